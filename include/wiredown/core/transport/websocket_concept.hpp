/*
===============================================================================
WebSocketConcept (Pull-Based, Deadline-Bounded)
===============================================================================

Defines the minimal transport contract required by Connection.

The WebSocket implementation:

  • Establishes exactly one connection per instance (no reconnection)
  • Delivers complete text messages through receive()
  • Bounds every blocking call by a caller-supplied timeout
  • Is fully lifecycle-managed by Connection

-------------------------------------------------------------------------------
Receive Semantics
-------------------------------------------------------------------------------

receive(out, timeout):

  - Error::None     → out holds exactly one complete message
  - Error::Timeout  → nothing arrived in time; the connection stays usable and
                      a partially received message is resumed by the next call
  - anything else   → the connection is no longer usable

-------------------------------------------------------------------------------
Threading Model
-------------------------------------------------------------------------------

Single-threaded. All calls happen on the caller's thread; no background IO
thread is started.

===============================================================================
*/
#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <concepts>

#include "wiredown/core/transport/error.hpp"


namespace wiredown::core::transport {

template<class WS>
concept WebSocketConcept =
    requires(
        WS ws,
        const std::string& host,
        const std::string& port,
        const std::string& target,
        bool secure,
        std::string_view msg,
        std::string& out,
        std::chrono::milliseconds timeout
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.connect(host, port, target, secure) } noexcept -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { ws.send(msg) } noexcept -> std::same_as<bool>;

    // ---------------------------------------------------------------------
    // Receiving
    // ---------------------------------------------------------------------

    { ws.receive(out, timeout) } noexcept -> std::same_as<Error>;
};

} // namespace wiredown::core::transport
