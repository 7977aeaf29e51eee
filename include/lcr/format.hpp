#pragma once

#include <cstdint>
#include <cstdio>
#include <string>


namespace lcr {

// Integer with thousands separators: 6436311 -> "6,436,311"
inline std::string format_number_exact(std::uint64_t value) {
    std::string digits = std::to_string(value);
    for (std::size_t pos = digits.size(); pos > 3; pos -= 3) {
        digits.insert(pos - 3, 1, ',');
    }
    return digits;
}

// Binary-scaled size: 1234567 -> "1.18 MB". Two significant decimals below
// 10, one below 100, none above.
inline std::string format_bytes(std::uint64_t bytes) {
    static constexpr const char* units[] = {"B", "KB", "MB", "GB", "TB"};

    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0])) {
        value /= 1024.0;
        ++unit;
    }

    const int precision = value < 10.0 ? 2 : value < 100.0 ? 1 : 0;
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.*f %s", precision, value, units[unit]);
    return buf;
}

// Elapsed seconds: 4.25 -> "4.25 s", 3725.5 -> "1h 02m 05.5s"
inline std::string format_duration(double seconds) {
    if (!(seconds > 0.0)) {
        return "0 s";
    }
    char buf[48];
    if (seconds < 60.0) {
        std::snprintf(buf, sizeof(buf), "%.2f s", seconds);
        return buf;
    }
    const auto whole = static_cast<std::uint64_t>(seconds);
    const double frac = seconds - static_cast<double>(whole);
    const std::uint64_t h = whole / 3600;
    const std::uint64_t m = (whole % 3600) / 60;
    const double s = static_cast<double>(whole % 60) + frac;
    if (h > 0) {
        std::snprintf(buf, sizeof(buf), "%lluh %02llum %04.1fs",
                      static_cast<unsigned long long>(h), static_cast<unsigned long long>(m), s);
    } else {
        std::snprintf(buf, sizeof(buf), "%llum %04.1fs", static_cast<unsigned long long>(m), s);
    }
    return buf;
}

} // namespace lcr
