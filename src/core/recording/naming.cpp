#include "telemux/core/recording/naming.hpp"

#include <algorithm>
#include <cstdint>
#include <random>

#include "telemux/core/config/recording.hpp"
#include "telemux/core/timestamp.hpp"

namespace telemux::core::recording {

namespace {

inline bool is_ascii_alnum(unsigned char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

inline bool is_space(unsigned char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

inline bool is_trim_char(char c) noexcept {
    return c == '-' || c == '_' || c == '.';
}

} // namespace

std::string make_slug(std::string_view text) {
    // Surrounding whitespace is ignored rather than turned into dashes
    std::size_t b = 0, e = text.size();
    while (b < e && is_space(static_cast<unsigned char>(text[b]))) ++b;
    while (e > b && is_space(static_cast<unsigned char>(text[e - 1]))) --e;

    std::string out;
    out.reserve(e - b);
    for (std::size_t i = b; i < e; ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (is_ascii_alnum(c) || is_trim_char(static_cast<char>(c))) {
            out.push_back(static_cast<char>(c));
        } else if (is_space(c)) {
            out.push_back('-');
        }
    }

    std::size_t first = 0, last = out.size();
    while (first < last && is_trim_char(out[first])) ++first;
    while (last > first && is_trim_char(out[last - 1])) --last;

    if (first == last) {
        return "stream";
    }
    return out.substr(first, std::min(last - first, config::recording::max_slug_length));
}

std::string make_recording_id() {
    static constexpr char hex[] = "0123456789abcdef";
    thread_local std::mt19937_64 rng{std::random_device{}()};

    std::uint64_t bits = rng();
    std::string id(12, '0');
    for (std::size_t i = 0; i < id.size(); ++i) {
        id[id.size() - 1 - i] = hex[bits & 0x0F];
        bits >>= 4;
    }
    return id;
}

std::string make_directory_name(double started_at, std::string_view slug_source, std::string_view id) {
    std::string name = to_compact_utc(started_at);
    name += '_';
    name += make_slug(slug_source);
    name += '_';
    name += id;
    return name;
}

std::string make_download_name(std::string_view stream_name, std::string_view id) {
    std::string name = "telemux_";
    name += make_slug(stream_name);
    name += '_';
    name += id;
    name += ".tar.lz4";
    return name;
}

} // namespace telemux::core::recording
