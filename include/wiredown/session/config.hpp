#pragma once

#include <string>
#include <string_view>
#include <filesystem>
#include <chrono>

#include "wiredown/error.hpp"
#include "wiredown/core/auth/login.hpp"
#include "wiredown/session/state.hpp"
#include "lcr/optional.hpp"


namespace wiredown::session {

// -----------------------------------------------------------------------------
// Session configuration
// -----------------------------------------------------------------------------
//
// Immutable per invocation. Identity and server address come from the command
// line first and from the persisted state second.
//
struct Config {
    std::string websocket_uri;
    std::string username;
    lcr::optional<std::string> password;      // unset → guest login
    std::string login_server{core::auth::DEFAULT_LOGIN_SERVER};
    std::filesystem::path state_path{std::string(DEFAULT_STATE_PATH)};

    // Pause after /trn so the server applies the rename before other commands
    std::chrono::milliseconds settle_delay{1000};
    // Longest silence tolerated while waiting for the challenge
    std::chrono::milliseconds challstr_idle_timeout{30000};
    // Whole login server exchange
    std::chrono::milliseconds login_timeout{30000};

    [[nodiscard]]
    inline core::auth::Credentials credentials() const {
        return core::auth::Credentials{username, password};
    }
};

// Values supplied explicitly by the caller (command line)
struct Overrides {
    lcr::optional<std::string> websocket_uri;
    lcr::optional<std::string> username;
    lcr::optional<std::string> password;
    lcr::optional<std::string> login_server;
    std::string state_path{DEFAULT_STATE_PATH};
};


// -----------------------------------------------------------------------------
// Resolve the configuration from explicit values and the persisted state.
//
//   username / websocket_uri : explicit non-empty value, else state, else error
//   password                 : explicit value (even empty), else state string
// -----------------------------------------------------------------------------
[[nodiscard]]
inline Error resolve_config(const Overrides& overrides, const StateDocument& state, Config& out) {
    out = Config{};
    out.state_path = expand_user(overrides.state_path);

    auto pick = [&state](const lcr::optional<std::string>& explicit_value, std::string_view key) {
        if (explicit_value.has() && !explicit_value.value().empty()) {
            return explicit_value.value();
        }
        return state.get_string(key).value_or(std::string{});
    };

    out.username = pick(overrides.username, "ps_username");
    out.websocket_uri = pick(overrides.websocket_uri, "websocket_uri");

    if (overrides.password.has()) {
        out.password = overrides.password.value();
    }
    else {
        out.password = state.get_string("ps_password");
    }

    if (overrides.login_server.has() && !overrides.login_server.value().empty()) {
        out.login_server = overrides.login_server.value();
    }

    if (out.username.empty()) {
        return make_error(ErrorCode::Configuration, "ps_username is required (or provide in state)");
    }
    if (out.websocket_uri.empty()) {
        return make_error(ErrorCode::Configuration, "websocket_uri is required (or provide in state)");
    }
    return Error{};
}

} // namespace wiredown::session
