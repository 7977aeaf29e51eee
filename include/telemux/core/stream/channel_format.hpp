#pragma once

#include <cstdint>
#include <string_view>

namespace telemux::core::stream {

// Per-channel value encoding announced by the discovery source
enum class ChannelFormat : std::uint8_t {
    Float32,
    Float64,
    String,
    Int8,
    Int16,
    Int32,
    Int64,
    Unknown
};

inline constexpr std::string_view to_string(ChannelFormat f) noexcept {
    switch (f) {
    case ChannelFormat::Float32: return "float32";
    case ChannelFormat::Float64: return "float64";
    case ChannelFormat::String:  return "string";
    case ChannelFormat::Int8:    return "int8";
    case ChannelFormat::Int16:   return "int16";
    case ChannelFormat::Int32:   return "int32";
    case ChannelFormat::Int64:   return "int64";
    case ChannelFormat::Unknown: return "unknown";
    }
    return "unknown";
}

// Unknown names map to ChannelFormat::Unknown
[[nodiscard]]
inline constexpr ChannelFormat parse_channel_format(std::string_view name) noexcept {
    if (name == "float32") return ChannelFormat::Float32;
    if (name == "float64" || name == "double64") return ChannelFormat::Float64;
    if (name == "string")  return ChannelFormat::String;
    if (name == "int8")    return ChannelFormat::Int8;
    if (name == "int16")   return ChannelFormat::Int16;
    if (name == "int32")   return ChannelFormat::Int32;
    if (name == "int64")   return ChannelFormat::Int64;
    return ChannelFormat::Unknown;
}

} // namespace telemux::core::stream
