/**
 * @file TimeUtils.hpp
 * @brief Local-time formatting helpers shared by logs and stores.
 */

#pragma once
#include <chrono>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>

namespace tidyfile::infrastructure {

class TimeUtils {
public:
    static std::tm ToLocalTime(std::time_t tt);

    /** @brief "2025-01-15T14:03:22" in local time. */
    static std::string ToIso8601(std::chrono::system_clock::time_point tp);

    /** @brief "20250115_140322" in local time, used for file and session names. */
    static std::string ToCompact(std::chrono::system_clock::time_point tp);

    /** @brief "2025-01-15 14:03:22" in local time. */
    static std::string ToDisplay(std::chrono::system_clock::time_point tp);

    static std::optional<std::chrono::system_clock::time_point> FromIso8601(const std::string& text);

    static std::chrono::system_clock::time_point FromFileTime(std::filesystem::file_time_type ftime);

    static double ToEpochSeconds(std::chrono::system_clock::time_point tp);

    static std::string NowIso8601() { return ToIso8601(std::chrono::system_clock::now()); }
};

} // namespace tidyfile::infrastructure
