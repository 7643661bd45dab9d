#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <memory>
#include <cstdint>

#include "wiredown/core/transport/websocket_concept.hpp"
#include "wiredown/core/transport/parse_url.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"


namespace wiredown::core::transport {

/*
===============================================================================
 wiredown::core::transport::Connection
===============================================================================

Scoped, single-use connection to a battle server, parameterized by a WebSocket
transport implementation conforming to transport::WebSocketConcept.

A Connection represents exactly one interaction: it is opened once, used for a
strictly sequential send / receive exchange, and closed. It never reconnects;
retry policy belongs to whoever runs the interaction.

-------------------------------------------------------------------------------
 Responsibilities
-------------------------------------------------------------------------------
- Validate the endpoint URL before any network I/O
- Own the transport instance and its lifetime
- Gate send()/receive() on the connection state
- Track rx/tx message counters and the last activity timestamp
- Close the transport on every exit path (destructor included)

-------------------------------------------------------------------------------
 Design Guarantees
-------------------------------------------------------------------------------
- No inheritance and no virtual functions
- Transport-agnostic via transport::WebSocketConcept
- Fully testable using mock transports
- No background threads; every blocking call is deadline-bounded by the caller

===============================================================================
*/

template <transport::WebSocketConcept WS>
class Connection {
public:
    Connection() = default;

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    // Ensure transport is closed on destruction.
    ~Connection() {
        close();
    }

    [[nodiscard]]
    inline Error open(std::string_view url) {
        WD_DEBUG("[CONN] Connecting to: " << url);
        // 0) PRECONDITION: single use
        if (ws_) {
            WD_WARN("[CONN] open() called on an already used connection. Ignoring.");
            return Error::InvalidState;
        }
        // 1) PRECONDITION: parse and validate URL
        ParsedUrl parsed;
        Error error = parse_url(url, parsed);
        if (error != Error::None) {
            WD_ERROR("[CONN] URL parsing failed: " << url);
            return error;
        }
        if (!is_websocket(parsed.scheme)) {
            WD_ERROR("[CONN] Not a websocket URL: " << url);
            return Error::InvalidUrl;
        }
        url_ = std::string(url);
        // 2) Create the transport instance and connect
        ws_ = std::make_unique<WS>();
        error = ws_->connect(parsed.host, parsed.port, parsed.target, parsed.secure);
        if (error != Error::None) {
            WD_ERROR("[CONN] Connection failed (" << to_string(error) << ")");
            ws_->close();
            return error;
        }
        open_ = true;
        last_activity_ts_ = std::chrono::steady_clock::now();
        WD_INFO("[CONN] Connected to server: " << url_);
        return Error::None;
    }

    // Idempotent
    inline void close() noexcept {
        if (!open_) {
            return;
        }
        open_ = false;
        ws_->close();
        WD_INFO("[CONN] Disconnected from server: " << url_ << " (rx " << rx_messages_ << ", tx " << tx_messages_ << ")");
    }

    [[nodiscard]]
    inline bool send(std::string_view text) noexcept {
        if (!open_) {
            WD_WARN("[CONN] send() called while not connected. Ignoring.");
            return false;
        }
        WD_DEBUG("[CONN] >> " << text);
        if (!ws_->send(text)) {
            WD_ERROR("[CONN] send() failed");
            return false;
        }
        ++tx_messages_;
        last_activity_ts_ = std::chrono::steady_clock::now();
        return true;
    }

    // Receive one frame. See WebSocketConcept for the meaning of Timeout.
    [[nodiscard]]
    inline Error receive(std::string& out, std::chrono::milliseconds timeout) noexcept {
        if (!open_) {
            return Error::InvalidState;
        }
        Error error = ws_->receive(out, timeout);
        if (error == Error::None) {
            ++rx_messages_;
            last_activity_ts_ = std::chrono::steady_clock::now();
            WD_TRACE("[CONN] << " << out);
        }
        else if (error != Error::Timeout) {
            WD_WARN("[CONN] Receive failed (" << to_string(error) << ")");
            // The transport is unusable from here on
            close();
        }
        return error;
    }

    // Accessors
    [[nodiscard]]
    inline bool is_open() const noexcept {
        return open_;
    }

    [[nodiscard]]
    inline std::uint64_t rx_messages() const noexcept {
        return rx_messages_;
    }

    [[nodiscard]]
    inline std::uint64_t tx_messages() const noexcept {
        return tx_messages_;
    }

    [[nodiscard]]
    inline std::chrono::steady_clock::time_point last_activity_ts() const noexcept {
        return last_activity_ts_;
    }

#ifdef WD_UNIT_TEST
public:
    WS& ws() {
        return *ws_;
    }
#endif // WD_UNIT_TEST

private:
    std::string url_;                    // for logging
    std::unique_ptr<WS> ws_;             // WebSocket instance (owned by Connection)
    bool open_{false};

    std::uint64_t rx_messages_{0};
    std::uint64_t tx_messages_{0};
    std::chrono::steady_clock::time_point last_activity_ts_{};
};

} // namespace wiredown::core::transport
