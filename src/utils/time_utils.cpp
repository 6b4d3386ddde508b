/**
 * @file time_utils.cpp
 * @brief Wall-clock helpers for report timestamps.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/utils/time_utils.hpp"

#include <iomanip>
#include <sstream>

namespace camfleet {
namespace utils {

double unixSeconds(SystemClock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

std::string isoTimestamp(SystemClock::time_point tp) {
    auto t = SystemClock::to_time_t(tp);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
        tp.time_since_epoch()) % 1000000;

    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(6) << us.count();
    return oss.str();
}

std::string isoUtc(std::time_t t) {
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

}  // namespace utils
}  // namespace camfleet
