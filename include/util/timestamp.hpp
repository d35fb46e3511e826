#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace lsm::util {

inline std::string formatTime(const std::chrono::system_clock::time_point tp, const char* fmt) {
    const std::time_t ts = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, fmt);
    return oss.str();
}

inline std::string timestampToString(const std::chrono::system_clock::time_point tp) {
    const std::time_t ts = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&ts, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ"); // ISO 8601 UTC
    return oss.str();
}

inline std::string dateToString(const std::chrono::system_clock::time_point tp) {
    return formatTime(tp, "%Y-%m-%d");
}

} // namespace lsm::util
