#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace telemux::core::relay::telemetry {

// ============================================================================
// Relay Session Telemetry
//
// Written by the session thread, readable from any thread.
// ============================================================================

struct alignas(64) Session final {
    lcr::metrics::atomic::counter64 samples_received_total;
    lcr::metrics::atomic::counter64 samples_sent_total;
    lcr::metrics::atomic::counter64 samples_skipped_total;   // downsampled away
    lcr::metrics::atomic::counter32 send_failures_total;

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Relay Session Telemetry ===\n";
        os << "  Samples received      : " << lcr::format_number_exact(samples_received_total.load()) << '\n';
        os << "  Samples sent          : " << lcr::format_number_exact(samples_sent_total.load()) << '\n';
        os << "  Samples skipped       : " << lcr::format_number_exact(samples_skipped_total.load()) << '\n';
        os << "  Send failures         : " << lcr::format_number_exact(send_failures_total.load()) << '\n';
    }
};

static_assert(std::is_standard_layout_v<Session>, "telemetry::Session must be standard layout");
static_assert(alignof(Session) == 64, "telemetry::Session must be cache-line aligned");

} // namespace telemux::core::relay::telemetry
