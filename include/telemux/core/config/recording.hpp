#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

namespace telemux::core::config::recording {

/*
===============================================================================
Recording defaults
===============================================================================

Recorders tolerate consumer stalls far better than live viewers, hence the
large queue. Buffered lines are flushed on whichever threshold trips first.
===============================================================================
*/

inline constexpr std::size_t               queue_capacity = 8192;
inline constexpr std::size_t               flush_lines    = 2048;
inline constexpr std::chrono::milliseconds flush_interval{500};

// Consumer wait granularity: bounds how late a flush or a stop is observed
inline constexpr std::chrono::milliseconds poll_interval{50};

inline constexpr std::size_t               max_slug_length = 80;

inline constexpr std::string_view          default_root  = "recordings";
inline constexpr std::string_view          metadata_file = "metadata.json";
inline constexpr std::string_view          data_file     = "samples.ndjson";
inline constexpr std::string_view          archive_file  = "recording.tar.lz4";

} // namespace telemux::core::config::recording
