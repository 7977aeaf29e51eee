#pragma once

#include <string>
#include <vector>

#include "telemux/core/stream/channel_format.hpp"

namespace lcr::json { class Writer; }

namespace telemux::core::stream {

/*
===============================================================================
 stream::Descriptor
===============================================================================

Immutable snapshot of one discovered stream, as reported by the discovery
source at resolve time. Descriptors are copied freely; the upstream handle
needed to open an inlet lives next to it in the Resolver cache.

JSON rendering (metadata documents, transports):

  {"uid","name","type","channelCount","nominalSrate","channelFormat",
   "sourceId","hostname","createdAt","xmlDesc","channelNames"}
===============================================================================
*/
struct Descriptor {
    std::string   uid;
    std::string   name;
    std::string   type;
    int           channel_count{0};
    double        nominal_srate{0.0};
    ChannelFormat channel_format{ChannelFormat::Unknown};
    std::string   source_id;
    std::string   hostname;
    double        created_at{0.0};
    std::string   xml_desc;
    std::vector<std::string> channel_names;
};

// Fills ch0 .. ch{N-1} when discovery reported no channel names
void fill_default_channel_names(Descriptor& d);

void write_json(lcr::json::Writer& w, const Descriptor& d);

[[nodiscard]]
std::string to_json(const Descriptor& d);

} // namespace telemux::core::stream
