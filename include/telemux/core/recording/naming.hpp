#pragma once

#include <string>
#include <string_view>

namespace telemux::core::recording {

// Filesystem-safe slug: ASCII alphanumerics and "-_." are kept, whitespace
// becomes '-', everything else is dropped. Leading/trailing "-_." are
// trimmed, the result is capped at 80 characters and falls back to "stream"
// when nothing survives.
[[nodiscard]]
std::string make_slug(std::string_view text);

// 12 lowercase hex characters from a random 48-bit value
[[nodiscard]]
std::string make_recording_id();

// <YYYYMMDDTHHMMSSZ>_<slug>_<id>
[[nodiscard]]
std::string make_directory_name(double started_at, std::string_view slug_source, std::string_view id);

// telemux_<slug(stream name)>_<id>.tar.lz4
[[nodiscard]]
std::string make_download_name(std::string_view stream_name, std::string_view id);

} // namespace telemux::core::recording
