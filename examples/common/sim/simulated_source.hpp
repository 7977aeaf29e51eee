/*
===============================================================================
 SimulatedSource
===============================================================================

In-process discovery source used by the examples. Publishes three streams:

  SimEEG      8 x float32 @ 250 Hz   10 Hz sine per channel, phase-shifted
  SimAccel    3 x float32 @ 100 Hz   slow rotation plus gravity on z
  SimMarkers  1 x string  irregular  "marker-<n>" about once per second

Samples are generated lazily by pull() from the elapsed time since open(),
so a paused consumer catches up in batches exactly like a real network
inlet would deliver its backlog. Timestamps are seconds on the source's
steady clock.
===============================================================================
*/
#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "telemux/core/error.hpp"
#include "telemux/core/timestamp.hpp"
#include "telemux/core/source/concepts.hpp"
#include "telemux/core/stream/descriptor.hpp"
#include "telemux/core/stream/sample.hpp"


namespace telemux::examples::sim {

using core::Error;

enum class Kind : std::uint8_t {
    Eeg,
    Accel,
    Markers
};

struct Handle {
    std::string uid;
    Kind kind;
    int channel_count;
    double rate;
};

class Inlet {
    using clock = std::chrono::steady_clock;

public:
    explicit Inlet(Handle handle) noexcept
        : handle_(std::move(handle))
    {}

    Inlet(Inlet&&) noexcept = default;
    Inlet& operator=(Inlet&&) noexcept = default;

    Error open(std::chrono::milliseconds) noexcept {
        start_ = clock::now();
        emitted_ = 0;
        open_ = true;
        return Error::None;
    }

    Error pull(std::vector<core::stream::SamplePtr>& out, std::size_t max_samples,
               std::chrono::milliseconds timeout) noexcept {
        if (!open_) {
            return Error::InvalidState;
        }

        const clock::time_point deadline = clock::now() + timeout;
        for (;;) {
            const auto now = clock::now();
            const double elapsed = std::chrono::duration<double>(now - start_).count();
            const auto due = static_cast<std::uint64_t>(elapsed * handle_.rate);

            if (due > emitted_) {
                const std::uint64_t n = std::min<std::uint64_t>(due - emitted_, max_samples);
                for (std::uint64_t i = 0; i < n; ++i) {
                    out.push_back(generate_(emitted_++));
                }
                return Error::None;
            }
            if (now >= deadline) {
                return Error::None;
            }

            const auto next_due = start_ + std::chrono::duration_cast<clock::duration>(
                std::chrono::duration<double>(static_cast<double>(emitted_ + 1) / handle_.rate));
            std::this_thread::sleep_until(std::min(next_due, deadline));
        }
    }

    void close() noexcept {
        open_ = false;
    }

private:
    Handle handle_;
    clock::time_point start_{};
    std::uint64_t emitted_{0};
    bool open_{false};

    core::stream::SamplePtr generate_(std::uint64_t index) const {
        constexpr double two_pi = 6.283185307179586;
        const double t = static_cast<double>(index) / handle_.rate;
        const double timestamp = std::chrono::duration<double>(start_.time_since_epoch()).count() + t;

        std::vector<core::stream::Value> values;
        values.reserve(static_cast<std::size_t>(handle_.channel_count));

        switch (handle_.kind) {
        case Kind::Eeg:
            for (int ch = 0; ch < handle_.channel_count; ++ch) {
                // Microvolts
                const double v = 50.0 * std::sin(two_pi * 10.0 * t + ch * 0.4);
                values.emplace_back(static_cast<double>(static_cast<float>(v)));
            }
            break;
        case Kind::Accel:
            values.emplace_back(static_cast<double>(static_cast<float>(std::sin(two_pi * 0.5 * t))));
            values.emplace_back(static_cast<double>(static_cast<float>(std::cos(two_pi * 0.5 * t))));
            values.emplace_back(9.81);
            break;
        case Kind::Markers:
            values.emplace_back("marker-" + std::to_string(index));
            break;
        }
        return core::stream::make_sample(timestamp, std::move(values));
    }
};

class Source {
public:
    using handle_type = Handle;
    using inlet_type  = Inlet;

    Error resolve(std::chrono::milliseconds, std::vector<core::source::Discovered<Handle>>& out) noexcept {
        out.push_back({describe_("sim-eeg", "SimEEG", "EEG", 8, 250.0, core::stream::ChannelFormat::Float32),
                       Handle{"sim-eeg", Kind::Eeg, 8, 250.0}});
        out.push_back({describe_("sim-accel", "SimAccel", "Accelerometer", 3, 100.0, core::stream::ChannelFormat::Float32),
                       Handle{"sim-accel", Kind::Accel, 3, 100.0}});
        // Irregular stream: nominal rate 0, generated at ~1 Hz
        out.push_back({describe_("sim-markers", "SimMarkers", "Markers", 1, 0.0, core::stream::ChannelFormat::String),
                       Handle{"sim-markers", Kind::Markers, 1, 1.0}});
        return Error::None;
    }

    Inlet open_inlet(const Handle& handle) {
        return Inlet(handle);
    }

    std::string version() const {
        return "simulated-source 1.0";
    }

private:
    double created_at_ = core::now_seconds();

    core::stream::Descriptor describe_(const char* uid, const char* name, const char* type, int channels,
                                       double srate, core::stream::ChannelFormat format) const {
        core::stream::Descriptor d;
        d.uid = uid;
        d.name = name;
        d.type = type;
        d.channel_count = channels;
        d.nominal_srate = srate;
        d.channel_format = format;
        d.source_id = std::string("telemux-sim-") + uid;
        d.hostname = "localhost";
        d.created_at = created_at_;
        d.xml_desc = std::string("<info><name>") + name + "</name><type>" + type + "</type></info>";
        if (format == core::stream::ChannelFormat::Float32 && channels == 3) {
            d.channel_names = {"x", "y", "z"};
        }
        return d;
    }
};

static_assert(core::source::SourceConcept<Source>);

} // namespace telemux::examples::sim
