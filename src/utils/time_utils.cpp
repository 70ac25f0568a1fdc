/**
 * @file time_utils.cpp
 * @brief Time formatting utilities implementation
 */

#include "domaincore/utils/time_utils.h"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace domaincore {
namespace utils {

std::string formatIso8601(const std::chrono::system_clock::time_point& tp,
                          bool includeMilliseconds) {
    // floor keeps the millisecond part non-negative for pre-epoch instants
    auto seconds = std::chrono::floor<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count();

    std::time_t timeValue = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::time_point(seconds));

    struct tm tmTime;
    if (!gmtime_r(&timeValue, &tmTime)) {
        return "";
    }

    // Format as ISO8601: YYYY-MM-DDTHH:MM:SS[.mmm]Z
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << (tmTime.tm_year + 1900) << '-'
        << std::setw(2) << (tmTime.tm_mon + 1) << '-'
        << std::setw(2) << tmTime.tm_mday << 'T'
        << std::setw(2) << tmTime.tm_hour << ':'
        << std::setw(2) << tmTime.tm_min << ':'
        << std::setw(2) << tmTime.tm_sec;
    if (includeMilliseconds) {
        oss << '.' << std::setw(3) << millis;
    }
    oss << 'Z';

    return oss.str();
}

} // namespace utils
} // namespace domaincore
