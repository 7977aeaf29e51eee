#include "telemux/core/stream/descriptor.hpp"

#include <string>

#include "lcr/json.hpp"

namespace telemux::core::stream {

void fill_default_channel_names(Descriptor& d) {
    if (!d.channel_names.empty() || d.channel_count <= 0) {
        return;
    }
    d.channel_names.reserve(static_cast<std::size_t>(d.channel_count));
    for (int i = 0; i < d.channel_count; ++i) {
        d.channel_names.push_back("ch" + std::to_string(i));
    }
}

void write_json(lcr::json::Writer& w, const Descriptor& d) {
    w.begin_object();
    w.key("uid").value(d.uid);
    w.key("name").value(d.name);
    w.key("type").value(d.type);
    w.key("channelCount").value(d.channel_count);
    w.key("nominalSrate").value(d.nominal_srate);
    w.key("channelFormat").value(to_string(d.channel_format));
    w.key("sourceId").value(d.source_id);
    w.key("hostname").value(d.hostname);
    w.key("createdAt").value(d.created_at);
    w.key("xmlDesc").value(d.xml_desc);
    w.key("channelNames").begin_array();
    for (const auto& name : d.channel_names) {
        w.value(name);
    }
    w.end_array();
    w.end_object();
}

std::string to_json(const Descriptor& d) {
    std::string out;
    lcr::json::Writer w(out);
    write_json(w, d);
    return out;
}

} // namespace telemux::core::stream
