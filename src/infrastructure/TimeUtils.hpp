/**
 * @file TimeUtils.hpp
 * @brief UTC formatting and parsing for file names and serialized timestamps.
 */

#pragma once
#include <string>
#include <chrono>
#include <optional>

namespace engram::infrastructure {

class TimeUtils {
public:
    /** @brief strftime-style formatting of a time point in UTC. */
    static std::string FormatUtc(std::chrono::system_clock::time_point tp, const char* format);

    /** @brief "YYYY-MM-DDTHH:MM:SS.ffffffZ" (microsecond precision). */
    static std::string ToIso8601(std::chrono::system_clock::time_point tp);

    /**
     * @brief Parses "YYYY-MM-DDTHH:MM:SS" with an optional fractional part and a
     * trailing "Z" or "+00:00". Returns nullopt on malformed input.
     */
    static std::optional<std::chrono::system_clock::time_point> ParseIso8601(const std::string& text);

    /** @brief "YYYYMMDD_HHMMSS_mmm" for the current time, sortable as text. */
    static std::string SortableStampNow();
};

} // namespace engram::infrastructure
