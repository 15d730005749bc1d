/**
 * @file TimeUtils.cpp
 * @brief Implementation of TimeUtils.
 */

#include "infrastructure/TimeUtils.hpp"
#include <ctime>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace engram::infrastructure {

namespace {

std::tm ToUtcTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    return tm;
}

std::time_t FromUtcTime(std::tm* tm) {
#if defined(_WIN32)
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

} // namespace

std::string TimeUtils::FormatUtc(std::chrono::system_clock::time_point tp, const char* format) {
    std::time_t tt = std::chrono::system_clock::to_time_t(tp);
    std::tm tm = ToUtcTime(tt);
    char buffer[64];
    size_t written = std::strftime(buffer, sizeof(buffer), format, &tm);
    return std::string(buffer, written);
}

std::string TimeUtils::ToIso8601(std::chrono::system_clock::time_point tp) {
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count() % 1000000;
    if (micros < 0) micros += 1000000;
    char fraction[16];
    std::snprintf(fraction, sizeof(fraction), ".%06lldZ", static_cast<long long>(micros));
    return FormatUtc(tp, "%Y-%m-%dT%H:%M:%S") + fraction;
}

std::optional<std::chrono::system_clock::time_point> TimeUtils::ParseIso8601(const std::string& text) {
    std::tm tm = {};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    // Optional fractional seconds
    long long nanos = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) {
            digits += static_cast<char>(ss.get());
        }
        digits = digits.substr(0, 9);
        while (digits.size() < 9) digits += '0';
        nanos = std::stoll(digits);
    }

    std::string zone;
    ss >> zone;
    if (!zone.empty() && zone != "Z" && zone != "+00:00") {
        return std::nullopt;
    }

    std::time_t tt = FromUtcTime(&tm);
    if (tt == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    auto tp = std::chrono::system_clock::from_time_t(tt);
    tp += std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(nanos));
    return tp;
}

std::string TimeUtils::SortableStampNow() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    char suffix[8];
    std::snprintf(suffix, sizeof(suffix), "_%03lld", static_cast<long long>(millis));
    return FormatUtc(now, "%Y%m%d_%H%M%S") + suffix;
}

} // namespace engram::infrastructure
