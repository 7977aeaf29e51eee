#pragma once

#include <chrono>
#include <cstddef>

namespace telemux::core::config::inlet {

/*
===============================================================================
Shared inlet defaults
===============================================================================

One upstream connection per stream uid, drained by a single pull worker.

  - open_timeout   : upper bound for opening the upstream inlet
  - pull_batch     : max samples requested per pull call
  - pull_timeout   : upper bound for one pull call
  - idle_sleep     : yield after an empty pull
===============================================================================
*/

inline constexpr std::chrono::milliseconds open_timeout{5000};
inline constexpr std::size_t               pull_batch   = 32;
inline constexpr std::chrono::milliseconds pull_timeout{50};
inline constexpr std::chrono::milliseconds idle_sleep{5};

} // namespace telemux::core::config::inlet
