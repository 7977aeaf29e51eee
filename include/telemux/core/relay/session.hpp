#pragma once

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include "telemux/core/error.hpp"
#include "telemux/core/config/relay.hpp"
#include "telemux/core/source/concepts.hpp"
#include "telemux/core/stream/resolver.hpp"
#include "telemux/core/inlet/manager.hpp"
#include "telemux/core/relay/sink_concept.hpp"
#include "telemux/core/relay/telemetry.hpp"
#include "lcr/json.hpp"
#include "lcr/log/logger.hpp"


namespace telemux::core::relay {

struct Config {
    std::size_t               queue_capacity = config::relay::queue_capacity;
    std::chrono::milliseconds wait_period    = config::relay::wait_period;
};

// Parses the optional "downsample" parameter of a relay request.
// Missing -> 1, unparsable -> 1, values below 1 -> 1.
[[nodiscard]]
inline std::uint32_t parse_downsample(std::optional<std::string_view> param) noexcept {
    if (!param) return 1;

    std::string_view sv = *param;
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) sv.remove_suffix(1);
    if (!sv.empty() && sv.front() == '+') sv.remove_prefix(1);
    if (sv.empty()) return 1;

    long long value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) {
        return 1;
    }
    if (value < 1) return 1;
    if (value > static_cast<long long>(UINT32_MAX)) return UINT32_MAX;
    return static_cast<std::uint32_t>(value);
}

// {"error": "<message>"}
[[nodiscard]]
inline std::string make_error_frame(std::string_view message) {
    std::string out = "{\"error\":";
    lcr::json::append_string(out, message);
    out += '}';
    return out;
}

/*
===============================================================================
 relay::Session
===============================================================================

Streams one live uid to one downstream sink.

run(uid, downsample):
  • descriptor lookup in the resolver cache; unknown uid -> one error frame,
    Error::NotFound
  • subscribe to the shared inlet with a small private queue; failure -> one
    error frame, the subscribe error
  • loop: wait for the next sample, keep every N-th (counted over every
    sample received, independent of how they were batched upstream),
    serialize {"t","d"}, send

The loop ends on sink disconnect, send failure or request_stop(); a stop is
observed within one wait period. The subscription is released on every exit
path.

One Session per connection; run() blocks the calling thread.
===============================================================================
*/
template<source::SourceConcept Source, SinkConcept Sink>
class Session {
public:
    Session(stream::Resolver<Source>& resolver, inlet::Manager<Source>& inlets, Sink& sink,
            Config config = {}) noexcept
        : resolver_(resolver)
        , inlets_(inlets)
        , sink_(sink)
        , config_(config)
    {}

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // Returns Error::None on client disconnect, Error::Cancelled on stop
    // request, or the lookup / subscribe error.
    [[nodiscard]]
    Error run(std::string_view uid, std::optional<std::string_view> downsample_param = std::nullopt) {
        const auto handle = resolver_.get_handle(uid);
        if (!handle) {
            TM_WARN("[RELAY] Stream " << uid << " not found");
            send_error_("Stream " + std::string(uid) + " not found. Resolve streams first.");
            return Error::NotFound;
        }

        const std::uint32_t downsample = parse_downsample(downsample_param);

        inlet::Subscriber queue;
        const Error err = inlets_.subscribe(uid, *handle, config_.queue_capacity, queue);
        if (err != Error::None) {
            send_error_("Failed to open stream inlet: " + std::string(to_string(err)));
            return err;
        }

        // Released on every exit path below
        struct Unsubscribe {
            inlet::Manager<Source>& inlets;
            std::string_view uid;
            const inlet::Subscriber& queue;
            ~Unsubscribe() { inlets.unsubscribe(uid, queue); }
        } guard{inlets_, uid, queue};

        TM_INFO("[RELAY] Client attached to " << uid << " (downsample=" << downsample << ")");

        std::uint64_t sample_idx = 0;
        std::string frame;
        while (!stop_requested_.load(std::memory_order_acquire)) {
            if (!sink_.is_open()) {
                TM_INFO("[RELAY] Client disconnected from " << uid);
                return Error::None;
            }

            stream::SamplePtr sample;
            if (!queue->pop(sample, config_.wait_period)) {
                continue;
            }
            telemetry_.samples_received_total.inc();

            ++sample_idx;
            if (sample_idx % downsample != 0) {
                telemetry_.samples_skipped_total.inc();
                continue;
            }

            frame.clear();
            stream::append_json(frame, *sample);
            if (!sink_.send(frame)) {
                telemetry_.send_failures_total.inc();
                TM_INFO("[RELAY] Send failed, detaching client from " << uid);
                return Error::None;
            }
            telemetry_.samples_sent_total.inc();
        }

        TM_DEBUG("[RELAY] Session for " << uid << " cancelled");
        return Error::Cancelled;
    }

    // Thread-safe; run() returns within one wait period
    void request_stop() noexcept {
        stop_requested_.store(true, std::memory_order_release);
    }

    [[nodiscard]]
    const telemetry::Session& telemetry() const noexcept {
        return telemetry_;
    }

private:
    stream::Resolver<Source>& resolver_;
    inlet::Manager<Source>& inlets_;
    Sink& sink_;
    Config config_;

    std::atomic<bool> stop_requested_{false};
    telemetry::Session telemetry_;

    void send_error_(const std::string& message) {
        if (sink_.is_open() && !sink_.send(make_error_frame(message))) {
            telemetry_.send_failures_total.inc();
        }
    }
};

} // namespace telemux::core::relay
