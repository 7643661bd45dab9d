#pragma once

#include <string_view>

namespace wiredown::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Transport-level error classification.

This enum represents *semantic transport failures*, abstracted away from
library-specific error codes (Boost.Beast / Asio / OpenSSL).

Higher layers (protocol wait loops, the session orchestrator) map these onto
operation-level failures. A Timeout from receive() is not a failure of the
connection: the pending read is kept and resumed by the next call.
===============================================================================
*/

enum class Error {
    None = 0,

    // --- Control / contract errors (caller responsibility) ------------------
    InvalidUrl,       // Malformed or unsupported URL (scheme, host, port)
    InvalidState,     // Operation not allowed in current transport state

    // --- Expected / benign termination --------------------------------------
    LocalShutdown,    // Connection was closed intentionally by the local endpoint
    RemoteClosed,     // Remote endpoint closed the connection (CLOSE frame or EOF)

    // --- Deadline ------------------------------------------------------------
    Timeout,          // No complete message / response within the caller deadline

    // --- Establishment failures ---------------------------------------------
    ConnectionFailed, // DNS resolution or TCP connect failed
    HandshakeFailed,  // TLS or WebSocket/HTTP handshake failed

    // --- Protocol / framing issues ------------------------------------------
    ProtocolError,    // Invalid frame or unexpected HTTP message structure

    // --- Fatal / unspecified transport failure ------------------------------
    TransportFailure, // Unclassified or unrecoverable transport failure
};


/// Optional helper for logging / diagnostics
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::LocalShutdown:     return "LocalShutdown";
    case Error::RemoteClosed:      return "RemoteClosed";
    case Error::Timeout:           return "Timeout";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::ProtocolError:     return "ProtocolError";
    case Error::TransportFailure:  return "TransportFailure";
    default:                       return "Unknown";
    }
}

} // namespace transport
} // namespace wiredown::core
