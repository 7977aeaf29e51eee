/*
===============================================================================
SinkConcept
===============================================================================

Downstream connection of one relay session (a WebSocket, a test double, a
console printer). The session owns the loop; the sink only moves frames.

  • send()     delivers one complete text frame; false means the frame was
               not accepted and the session must end
  • is_open()  false once the peer disconnected

Both are called from the session's thread only.
===============================================================================
*/
#pragma once

#include <concepts>
#include <string_view>

namespace telemux::core::relay {

template<class S>
concept SinkConcept =
    requires(S sink, std::string_view frame)
{
    { sink.send(frame) } noexcept -> std::same_as<bool>;
    { sink.is_open() } noexcept -> std::same_as<bool>;
};

} // namespace telemux::core::relay
