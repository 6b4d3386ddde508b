/**
 * @file logger.cpp
 * @brief Logger helpers that live outside the header.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/utils/logger.hpp"
#include "camfleet/utils/string_utils.hpp"

namespace camfleet {
namespace utils {

LogLevel logLevelFromString(const std::string& name) {
    std::string upper = to_upper(trim(name));
    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL" || upper == "CRITICAL") return LogLevel::FATAL;
    if (upper == "OFF") return LogLevel::OFF;
    return LogLevel::INFO;
}

}  // namespace utils
}  // namespace camfleet
