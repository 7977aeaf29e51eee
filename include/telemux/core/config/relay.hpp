#pragma once

#include <chrono>
#include <cstddef>

namespace telemux::core::config::relay {

// Live viewers favour freshness: a small queue sheds lag quickly.
inline constexpr std::size_t               queue_capacity = 512;

// Queue wait period; a stop request is observed within one period.
inline constexpr std::chrono::milliseconds wait_period{100};

} // namespace telemux::core::config::relay
