#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <memory>

#include "wiredown/core/transport/websocket_concept.hpp"
#include "wiredown/core/transport/error.hpp"

/*
================================================================================
WebSocket Transport (Boost.Beast)
================================================================================

Single-connection WebSocket client over plain TCP (ws://) or TLS (wss://).

Design highlights:
  • No background thread: every operation runs the private io_context on the
    caller's thread until it completes or its deadline passes
  • A receive() that times out leaves its read outstanding; the next receive()
    resumes it, so a frame arriving late is never lost or half-consumed
  • TLS peers are verified against the system trust store and the host name
  • Idempotent close(): a bounded CLOSE handshake, then socket teardown

Boost headers stay out of this header (pimpl) so that protocol code and tests
can include the transport declaration without pulling in Asio.
================================================================================
*/

namespace wiredown::core {
namespace transport {
namespace beast {

constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(15);
constexpr auto SEND_TIMEOUT    = std::chrono::seconds(10);
constexpr auto CLOSE_TIMEOUT   = std::chrono::seconds(2);

class WebSocket {
public:
    WebSocket();
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    [[nodiscard]]
    Error connect(const std::string& host, const std::string& port, const std::string& target, bool secure) noexcept;

    // Send a text message. Returns true once the frame is fully written.
    [[nodiscard]]
    bool send(std::string_view msg) noexcept;

    [[nodiscard]]
    Error receive(std::string& out, std::chrono::milliseconds timeout) noexcept;

    void close() noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Check that WebSocket conforms to the WebSocketConcept concept
static_assert(WebSocketConcept<WebSocket>);

} // namespace beast
} // namespace transport
} // namespace wiredown::core
