#pragma once

#include <chrono>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

#include "telemux/core/error.hpp"
#include "telemux/core/source/concepts.hpp"
#include "telemux/core/stream/resolver.hpp"
#include "telemux/core/inlet/manager.hpp"
#include "telemux/core/recording/manager.hpp"
#include "telemux/core/relay/session.hpp"


namespace telemux {

struct HubConfig {
    core::inlet::Config     inlet;
    core::recording::Config recording;
    core::relay::Config     relay;
};

/*
===============================================================================
 telemux::Hub
===============================================================================

Explicit application context. Owns the resolver cache, the shared inlet
manager and the recording manager for one discovery source, and wires relay
sessions to them. Transports hold a reference to the Hub instead of reaching
for globals.

Destruction order: recordings are finalized first (their subscriptions
released), then every remaining inlet is closed.
===============================================================================
*/
template<core::source::SourceConcept Source>
class Hub {
public:
    explicit Hub(Source& source, HubConfig config = {})
        : source_(source)
        , config_(std::move(config))
        , resolver_(source)
        , inlets_(source, config_.inlet)
        , recordings_(source, inlets_, config_.recording)
    {}

    Hub(const Hub&) = delete;
    Hub& operator=(const Hub&) = delete;

    // ---------------------------------------------------------------------
    // Discovery
    // ---------------------------------------------------------------------

    [[nodiscard]]
    core::Error resolve(std::chrono::milliseconds timeout, std::vector<core::stream::Descriptor>& out) {
        return resolver_.resolve(timeout, out);
    }

    // ---------------------------------------------------------------------
    // Recording
    // ---------------------------------------------------------------------

    [[nodiscard]]
    core::Error start_recording(std::string_view uid, std::string_view label, int downsample,
                                core::recording::Session& out) {
        const auto entry = resolver_.get(uid);
        if (!entry) {
            return core::Error::NotFound;
        }
        return recordings_.start(uid, entry->handle, entry->descriptor, label, downsample, out);
    }

    [[nodiscard]]
    core::Error stop_recording(std::string_view id, core::recording::Session& out) {
        return recordings_.stop(id, out);
    }

    [[nodiscard]]
    std::vector<core::recording::Session> recordings() const {
        return recordings_.list();
    }

    [[nodiscard]]
    std::optional<core::recording::Session> recording(std::string_view id) const {
        return recordings_.get(id);
    }

    // ---------------------------------------------------------------------
    // Relay
    // ---------------------------------------------------------------------

    template<core::relay::SinkConcept Sink>
    [[nodiscard]]
    core::relay::Session<Source, Sink> make_relay(Sink& sink) {
        return core::relay::Session<Source, Sink>(resolver_, inlets_, sink, config_.relay);
    }

    // ---------------------------------------------------------------------
    // Components
    // ---------------------------------------------------------------------

    core::stream::Resolver<Source>&    resolver() noexcept { return resolver_; }
    core::inlet::Manager<Source>&      inlets() noexcept { return inlets_; }
    core::recording::Manager<Source>&  recorder() noexcept { return recordings_; }
    Source&                            source() noexcept { return source_; }

private:
    Source& source_;
    HubConfig config_;

    core::stream::Resolver<Source>   resolver_;
    core::inlet::Manager<Source>     inlets_;
    core::recording::Manager<Source> recordings_;
};

} // namespace telemux
