#pragma once

#define TM_VERSION_MAJOR 0
#define TM_VERSION_MINOR 3
#define TM_VERSION_PATCH 0

#define TM_VERSION_STRING "0.3.0"

namespace telemux {

inline constexpr const char* version() noexcept {
    return TM_VERSION_STRING;
}

} // namespace telemux
