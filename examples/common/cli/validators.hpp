#pragma once

#include <charconv>
#include <string>
#include <system_error>

#include <CLI/CLI.hpp>

#include "lcr/log/logger.hpp"


namespace telemux::examples::cli {

// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        lcr::log::Level level;
        if (lcr::log::parse_level(value, level)) {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal, off";
    },
    "Log level validator"
);


// -------------------------------------------------------------
// Downsample factor validator
// -------------------------------------------------------------
inline auto downsample_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        int v = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), v);
        if (ec != std::errc{} || ptr != value.data() + value.size()) {
            return "Downsample must be a valid integer";
        }
        if (v < 1) {
            return "Downsample must be >= 1";
        }
        return {};
    },
    "Downsample validator"
);


// -------------------------------------------------------------
// Stream name validator
// -------------------------------------------------------------
inline auto stream_name_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "SimEEG" || value == "SimAccel" || value == "SimMarkers") {
            return {};
        }
        return "Stream must be one of: SimEEG, SimAccel, SimMarkers";
    },
    "Simulated stream validator"
);

} // namespace telemux::examples::cli
