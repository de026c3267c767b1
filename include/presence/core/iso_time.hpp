#pragma once
#include <chrono>
#include <cstdio>
#include <ctime>
#include <optional>
#include <string>
#include <presence/core/scheduler.hpp>

namespace presence::core {

// "2024-05-01T12:34:56.789Z"
inline std::string FormatIso8601(WallClock::time_point tp) {
    using namespace std::chrono;
    const auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count();
    std::time_t secs = static_cast<std::time_t>(ms / 1000);
    long frac = static_cast<long>(ms % 1000);
    if (frac < 0) { frac += 1000; --secs; }
    std::tm utc{};
    gmtime_r(&secs, &utc);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03ldZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, frac);
    return buf;
}

// Accepts the form produced above, with or without the millisecond part.
inline std::optional<WallClock::time_point> ParseIso8601(const std::string& s) {
    std::tm utc{};
    int ms = 0;
    int n = std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3dZ",
                        &utc.tm_year, &utc.tm_mon, &utc.tm_mday,
                        &utc.tm_hour, &utc.tm_min, &utc.tm_sec, &ms);
    if (n < 6) return std::nullopt;
    utc.tm_year -= 1900;
    utc.tm_mon  -= 1;
    const std::time_t secs = timegm(&utc);
    if (secs == static_cast<std::time_t>(-1)) return std::nullopt;
    return WallClock::from_time_t(secs) + std::chrono::milliseconds(n == 7 ? ms : 0);
}

} // namespace presence::core
