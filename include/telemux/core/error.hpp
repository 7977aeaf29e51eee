#pragma once

#include <string_view>

namespace telemux::core {

/*
===============================================================================
 core::Error
===============================================================================

Failure classification shared by every public operation of the multiplexing
core (resolver, inlet manager, recording manager, relay sessions).

Discovery-library and filesystem failures are folded into these categories
at the boundary where they occur; callers never see errno or library codes.
Outputs travel through reference parameters, the return value only says
whether they are valid.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Lookup / contract errors (caller responsibility) -------------------
    NotFound,         // Unknown stream uid or recording id
    AlreadyExists,    // Exclusive creation target already present
    InvalidState,     // Operation not allowed in the current object state

    // --- Upstream failures ---------------------------------------------------
    ConnectionFailed, // Inlet could not be opened
    Timeout,          // Upstream did not answer within the allotted time
    SourceFailure,    // Discovery or pull failure reported by the source

    // --- Local failures ------------------------------------------------------
    IoFailure,        // Filesystem write / sync / rename failed

    // --- Lifecycle -----------------------------------------------------------
    Cancelled,        // Operation aborted by a local stop request
};


inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::NotFound:          return "NotFound";
    case Error::AlreadyExists:     return "AlreadyExists";
    case Error::InvalidState:      return "InvalidState";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::Timeout:           return "Timeout";
    case Error::SourceFailure:     return "SourceFailure";
    case Error::IoFailure:         return "IoFailure";
    case Error::Cancelled:         return "Cancelled";
    default:                       return "Unknown";
    }
}

} // namespace telemux::core
