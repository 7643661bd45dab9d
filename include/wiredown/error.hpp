#pragma once

#include <string>
#include <string_view>
#include <cstdint>
#include <utility>

namespace wiredown {

/*
===============================================================================
Operation Error Model
===============================================================================

Errors returned by the public operations (start / observe / act). Lower layers
report their own codes (transport::Error, auth::Error, WaitError); the session
layer maps them onto these categories and attaches a human-readable message.

[configuration] a required input (identity, server address, battle id, choice
text, request id) is missing. Always reported before any network I/O, except
for a missing request id after refresh was disabled.

[authentication] the login server could not be reached, answered with a
non-200 status, or refused the credentials.

[timeout] a required event never arrived: the challenge after connecting, the
battle start after searching, or a request id to correlate an action with.

[protocol_decode] the server sent a |request| payload that is not valid JSON.

[transport] the battle server connection could not be opened, or failed or was
closed by the peer in the middle of the operation.

Protocol-level |error| lines are NOT errors here: they are reported in-band
as the result's `error` field.
===============================================================================
*/

enum class ErrorCode : std::uint8_t {
    None = 0,
    Configuration,
    Authentication,
    Timeout,
    ProtocolDecode,
    Transport
};

[[nodiscard]]
inline constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None:           return "none";
        case ErrorCode::Configuration:  return "configuration";
        case ErrorCode::Authentication: return "authentication";
        case ErrorCode::Timeout:        return "timeout";
        case ErrorCode::ProtocolDecode: return "protocol_decode";
        case ErrorCode::Transport:      return "transport";
        default:                        return "unknown";
    }
}

struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;    // Human-readable explanation

    [[nodiscard]]
    inline bool ok() const noexcept {
        return code == ErrorCode::None;
    }
};

[[nodiscard]]
inline Error make_error(ErrorCode code, std::string message) {
    return Error{code, std::move(message)};
}

} // namespace wiredown
