#pragma once

#include <chrono>
#include <cmath>
#include <cstdio>
#include <string>

namespace telemux::core {

// ============================================================================
// Wall-clock time as floating seconds since the Unix epoch (UTC).
// Recording start/stop times and durations use this representation.
// ============================================================================
using WallClock = std::chrono::system_clock;

[[nodiscard]] inline double to_seconds(WallClock::time_point tp) noexcept {
    using namespace std::chrono;
    return duration<double>(tp.time_since_epoch()).count();
}

[[nodiscard]] inline double now_seconds() noexcept {
    return to_seconds(WallClock::now());
}

namespace detail {

struct UtcParts {
    int year;
    unsigned month, day;
    int hour, minute, second;
    long long micros;
};

inline UtcParts split_utc(double seconds) noexcept {
    using namespace std::chrono;

    const auto total_us = static_cast<long long>(std::llround(seconds * 1'000'000.0));
    const sys_time<microseconds> ts{microseconds{total_us}};

    const sys_days d = floor<days>(ts);
    const year_month_day ymd{d};

    auto tod = ts - d;
    const auto h = floor<hours>(tod);
    const auto m = floor<minutes>(tod - h);
    const auto s = floor<std::chrono::seconds>(tod - h - m);
    const auto us = (tod - h - m - s).count();

    return UtcParts{
        int(ymd.year()), unsigned(ymd.month()), unsigned(ymd.day()),
        int(h.count()), int(m.count()), int(s.count()),
        static_cast<long long>(us)
    };
}

} // namespace detail

// ============================================================================
// ISO-8601 formatter (always UTC, microsecond precision)
//
// Produces:
//   YYYY-MM-DDTHH:MM:SS.ffffffZ
// ============================================================================
[[nodiscard]] inline std::string to_iso8601(double seconds) {
    const auto p = detail::split_utc(seconds);
    char buf[64];
    std::snprintf(buf, sizeof(buf),
                  "%04d-%02u-%02uT%02d:%02d:%02d.%06lldZ",
                  p.year, p.month, p.day, p.hour, p.minute, p.second, p.micros);
    return std::string(buf);
}

// Compact basic-format UTC stamp used in directory names: YYYYMMDDTHHMMSSZ
[[nodiscard]] inline std::string to_compact_utc(double seconds) {
    const auto p = detail::split_utc(seconds);
    char buf[32];
    std::snprintf(buf, sizeof(buf),
                  "%04d%02u%02uT%02d%02d%02dZ",
                  p.year, p.month, p.day, p.hour, p.minute, p.second);
    return std::string(buf);
}

} // namespace telemux::core
