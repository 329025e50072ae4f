/**
 * @file TimeUtils.cpp
 * @brief Implementation of TimeUtils.
 */

#include "infrastructure/TimeUtils.hpp"
#include <iomanip>
#include <sstream>

namespace tidyfile::infrastructure {

std::tm TimeUtils::ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

namespace {

std::string Format(std::chrono::system_clock::time_point tp, const char* pattern) {
    std::tm tm = TimeUtils::ToLocalTime(std::chrono::system_clock::to_time_t(tp));
    std::ostringstream ss;
    ss << std::put_time(&tm, pattern);
    return ss.str();
}

} // namespace

std::string TimeUtils::ToIso8601(std::chrono::system_clock::time_point tp) {
    return Format(tp, "%Y-%m-%dT%H:%M:%S");
}

std::string TimeUtils::ToCompact(std::chrono::system_clock::time_point tp) {
    return Format(tp, "%Y%m%d_%H%M%S");
}

std::string TimeUtils::ToDisplay(std::chrono::system_clock::time_point tp) {
    return Format(tp, "%Y-%m-%d %H:%M:%S");
}

std::optional<std::chrono::system_clock::time_point> TimeUtils::FromIso8601(const std::string& text) {
    std::tm tm = {};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }
    tm.tm_isdst = -1;
    std::time_t tt = std::mktime(&tm);
    if (tt == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(tt);
}

std::chrono::system_clock::time_point TimeUtils::FromFileTime(std::filesystem::file_time_type ftime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}

double TimeUtils::ToEpochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

} // namespace tidyfile::infrastructure
