#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace telemux::core::inlet::telemetry {

// ============================================================================
// Inlet Telemetry
//
// Per-uid counters owned by the managed inlet and written only by its pull
// worker. Readers observe them through Manager::telemetry_dump().
// ============================================================================

struct alignas(64) Inlet final {
    // ---------------------------------------------------------------------
    // Upstream
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 pull_calls_total;
    lcr::metrics::atomic::counter64 samples_pulled_total;
    lcr::metrics::atomic::counter32 pull_errors_total;

    // ---------------------------------------------------------------------
    // Fan-out
    // ---------------------------------------------------------------------

    // One increment per (sample, subscriber) delivery
    lcr::metrics::atomic::counter64 samples_fanned_out_total;

    // Deliveries that evicted an older queued sample (drop-oldest)
    lcr::metrics::atomic::counter64 samples_evicted_total;

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Inlet Telemetry ===\n";
        os << "Upstream\n";
        os << "  Pull calls            : " << lcr::format_number_exact(pull_calls_total.load()) << '\n';
        os << "  Samples pulled        : " << lcr::format_number_exact(samples_pulled_total.load()) << '\n';
        os << "  Pull errors           : " << lcr::format_number_exact(pull_errors_total.load()) << '\n';
        os << "\nFan-out\n";
        os << "  Samples delivered     : " << lcr::format_number_exact(samples_fanned_out_total.load()) << '\n';
        os << "  Samples evicted       : " << lcr::format_number_exact(samples_evicted_total.load()) << '\n';
    }
};

static_assert(std::is_standard_layout_v<Inlet>, "telemetry::Inlet must be standard layout");
static_assert(!std::is_polymorphic_v<Inlet>, "telemetry::Inlet must not be polymorphic");
static_assert(alignof(Inlet) == 64, "telemetry::Inlet must be cache-line aligned");

} // namespace telemux::core::inlet::telemetry
