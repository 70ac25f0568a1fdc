/**
 * @file time_utils.h
 * @brief Time and date utilities
 *
 * ISO 8601 formatting used when rendering calendar timestamps.
 *
 * @version 1.0.0
 */

#pragma once

#include <chrono>
#include <string>

namespace domaincore {
namespace utils {

/**
 * @brief Format time_point as ISO 8601 string (UTC)
 *
 * @param tp std::chrono time_point
 * @param includeMilliseconds Include milliseconds in output
 * @return ISO 8601 string (e.g., "2026-02-02T12:34:56Z" or
 *         "2026-02-02T12:34:56.789Z")
 */
std::string formatIso8601(
    const std::chrono::system_clock::time_point& tp,
    bool includeMilliseconds = false
);

} // namespace utils
} // namespace domaincore
