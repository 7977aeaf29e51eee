/*
===============================================================================
Discovery source contract
===============================================================================

The multiplexing core never talks to a discovery library directly. It is
parameterised on a Source type that satisfies SourceConcept:

  • resolve()     fills one Discovered entry per reachable stream
  • open_inlet()  creates an (unopened) inlet bound to a resolved handle
  • version()     library identification, recorded in metadata documents

Inlets satisfy InletConcept and are driven by exactly one thread at a time
(the inlet manager opens, pulls and closes them). pull() may block up to the
given timeout and returns Error::None with an empty batch when nothing
arrived.

No virtual dispatch: sources are resolved at compile time.
===============================================================================
*/
#pragma once

#include <chrono>
#include <concepts>
#include <cstddef>
#include <string>
#include <vector>

#include "telemux/core/error.hpp"
#include "telemux/core/stream/descriptor.hpp"
#include "telemux/core/stream/sample.hpp"


namespace telemux::core::source {

// One resolve result: the descriptor snapshot and the opaque handle used to
// open an inlet for it.
template<class Handle>
struct Discovered {
    stream::Descriptor descriptor;
    Handle             handle;
};

template<class I>
concept InletConcept =
    requires(
        I inlet,
        std::vector<stream::SamplePtr>& out,
        std::size_t max_samples,
        std::chrono::milliseconds timeout
    )
{
    { inlet.open(timeout) } noexcept -> std::same_as<Error>;
    { inlet.pull(out, max_samples, timeout) } noexcept -> std::same_as<Error>;
    { inlet.close() } noexcept -> std::same_as<void>;
};

template<class S>
concept SourceConcept =
    requires {
        typename S::handle_type;
        typename S::inlet_type;
    } &&
    std::copy_constructible<typename S::handle_type> &&
    std::move_constructible<typename S::inlet_type> &&
    InletConcept<typename S::inlet_type> &&
    requires(
        S& source,
        const S& csource,
        const typename S::handle_type& handle,
        std::chrono::milliseconds timeout,
        std::vector<Discovered<typename S::handle_type>>& out
    )
{
    { source.resolve(timeout, out) } noexcept -> std::same_as<Error>;
    { source.open_inlet(handle) } -> std::same_as<typename S::inlet_type>;
    { csource.version() } -> std::convertible_to<std::string>;
};

} // namespace telemux::core::source
