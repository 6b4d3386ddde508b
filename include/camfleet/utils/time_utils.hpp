/**
 * @file time_utils.hpp
 * @brief Wall-clock helpers for report timestamps.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/utils/export.hpp"

#include <chrono>
#include <ctime>
#include <string>

namespace camfleet {
namespace utils {

using SystemClock = std::chrono::system_clock;

/// Seconds since the Unix epoch with sub-second precision.
CAMFLEET_UTILS_API double unixSeconds(SystemClock::time_point tp = SystemClock::now());

/**
 * @brief Local time as ISO-8601 with microseconds, e.g. 2024-05-01T10:22:03.123456
 */
CAMFLEET_UTILS_API std::string isoTimestamp(SystemClock::time_point tp = SystemClock::now());

/**
 * @brief UTC time as ISO-8601 without fraction, e.g. 2025-05-01T00:00:00
 */
CAMFLEET_UTILS_API std::string isoUtc(std::time_t t);

}  // namespace utils
}  // namespace camfleet
