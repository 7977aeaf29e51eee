#include "telemux/core/stream/sample.hpp"

#include <type_traits>

#include "lcr/json.hpp"

namespace telemux::core::stream {

void append_json(std::string& out, const Sample& s) {
    out += "{\"t\":";
    lcr::json::append(out, s.timestamp);
    out += ",\"d\":[";
    bool first = true;
    for (const auto& v : s.values) {
        if (!first) out += ',';
        first = false;
        std::visit([&out](const auto& x) {
            using T = std::decay_t<decltype(x)>;
            if constexpr (std::is_same_v<T, std::string>) {
                lcr::json::append_string(out, x);
            } else {
                lcr::json::append(out, x);
            }
        }, v);
    }
    out += "]}";
}

std::string to_json(const Sample& s) {
    std::string out;
    out.reserve(32 + s.values.size() * 12);
    append_json(out, s);
    return out;
}

} // namespace telemux::core::stream
