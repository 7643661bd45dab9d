#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <utility>
#include <initializer_list>
#include <cstdint>

#include "wiredown/core/transport/http_concept.hpp"
#include "wiredown/core/protocol/showdown/parser/helpers.hpp"
#include "lcr/optional.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace wiredown::core::auth {

/*
===============================================================================
 Login server exchange
===============================================================================

Trades the connection's challenge ("<client id>|<challstr>") for a signed
assertion that the battle server accepts in "/trn <name>,0,<assertion>".

  guest (no password)
    POST <login server>/action.php?   act=getassertion&userid=..&challstr=..
    → the body IS the assertion

  registered (password)
    POST <login server>/api/login     name=..&pass=..&challstr=..
    → "]" + JSON { "actionsuccess": .., "assertion": "..", "curuser": {"userid": ".."} }

An assertion starting with ';' is the server's way of refusing the name
(registered name without password, wrong password, malformed name).
===============================================================================
*/

inline constexpr std::string_view DEFAULT_LOGIN_SERVER = "https://play.pokemonshowdown.com";

enum class Error : std::uint8_t {
    None = 0,
    Transport,         // request could not be completed
    HttpStatus,        // status other than 200
    Refused,           // server refused the credentials / name
    InvalidResponse    // body could not be interpreted
};

[[nodiscard]]
inline constexpr std::string_view to_string(Error e) noexcept {
    switch (e) {
        case Error::None:            return "None";
        case Error::Transport:       return "Transport";
        case Error::HttpStatus:      return "HttpStatus";
        case Error::Refused:         return "Refused";
        case Error::InvalidResponse: return "InvalidResponse";
        default:                     return "Unknown";
    }
}

struct Credentials {
    std::string username;
    lcr::optional<std::string> password;

    [[nodiscard]]
    inline bool is_guest() const noexcept {
        return !password.has();
    }
};

struct Assertion {
    std::string assertion;
    std::string userid;       // name the server knows us by
};


// -----------------------------------------------------------------------------
// application/x-www-form-urlencoded
// -----------------------------------------------------------------------------
inline void form_escape(std::string& out, std::string_view s) {
    static constexpr char hex[] = "0123456789ABCDEF";
    for (char c : s) {
        const auto u = static_cast<unsigned char>(c);
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out += c;
        }
        else if (c == ' ') {
            out += '+';
        }
        else {
            out += '%';
            out += hex[u >> 4];
            out += hex[u & 0x0F];
        }
    }
}

[[nodiscard]]
inline std::string form_encode(std::initializer_list<std::pair<std::string_view, std::string_view>> fields) {
    std::string out;
    for (const auto& [key, value] : fields) {
        if (!out.empty()) {
            out += '&';
        }
        form_escape(out, key);
        out += '=';
        form_escape(out, value);
    }
    return out;
}

[[nodiscard]]
inline std::string login_url(std::string_view login_server, bool guest) {
    while (!login_server.empty() && login_server.back() == '/') {
        login_server.remove_suffix(1);
    }
    return std::string(login_server) + (guest ? "/action.php?" : "/api/login");
}


// -----------------------------------------------------------------------------
// Registered login response: "]" + JSON
// -----------------------------------------------------------------------------
[[nodiscard]]
inline Error parse_login_response(std::string_view body, const Credentials& creds, Assertion& out, std::string& detail) {
    if (!body.empty() && body.front() == ']') {
        body.remove_prefix(1);
    }
    simdjson::dom::parser json;
    simdjson::dom::element root;
    if (json.parse(body.data(), body.size()).get(root) || !protocol::showdown::parser::helper::is_object(root)) {
        detail = "Could not log-in: " + std::string(body);
        return Error::InvalidResponse;
    }
    simdjson::dom::element field;
    if (!protocol::showdown::parser::helper::find_field(root, "actionsuccess", field)) {
        detail = "Could not log-in: " + simdjson::minify(root);
        return Error::Refused;
    }
    std::string_view assertion;
    if (root["assertion"].get(assertion)) {
        detail = "Could not log-in: no assertion in " + simdjson::minify(root);
        return Error::InvalidResponse;
    }
    out.assertion = std::string(assertion);

    std::string_view userid;
    if (root.at_pointer("/curuser/userid").get(userid)) {
        WD_WARN("[AUTH] Login response without curuser.userid, keeping '" << creds.username << "'");
        out.userid = creds.username;
    }
    else {
        out.userid = std::string(userid);
    }
    return Error::None;
}


// -----------------------------------------------------------------------------
// Request an assertion for `challenge`.
// On failure `detail` holds the human-readable reason.
// -----------------------------------------------------------------------------
template <transport::HttpConcept H>
[[nodiscard]]
inline Error get_assertion(H& http, std::string_view login_server, const Credentials& creds,
                           std::string_view challenge, std::chrono::milliseconds timeout,
                           Assertion& out, std::string& detail) {
    out = Assertion{};
    detail.clear();
    const bool guest = creds.is_guest();
    const std::string url = login_url(login_server, guest);
    const std::string body = guest
        ? form_encode({{"act", "getassertion"}, {"userid", creds.username}, {"challstr", challenge}})
        : form_encode({{"name", creds.username}, {"pass", creds.password.value()}, {"challstr", challenge}});

    WD_DEBUG("[AUTH] Requesting " << (guest ? "guest" : "registered") << " assertion for '" << creds.username << "'");
    transport::HttpResponse response;
    const transport::Error err = http.post_form(url, body, response, timeout);
    if (err != transport::Error::None) {
        detail = "Could not get assertion (" + std::string(transport::to_string(err)) + ")";
        return Error::Transport;
    }
    if (response.status != 200) {
        WD_ERROR("[AUTH] Login server answered HTTP " << response.status);
        detail = "Could not get assertion";
        return Error::HttpStatus;
    }

    Error result = Error::None;
    if (guest) {
        out.assertion = response.body;
        out.userid = creds.username;
    }
    else {
        result = parse_login_response(response.body, creds, out, detail);
        if (result != Error::None) {
            WD_ERROR("[AUTH] " << detail);
            return result;
        }
    }

    if (out.assertion.empty() || out.assertion.front() == ';') {
        detail = "Could not log-in: " + (out.assertion.empty() ? std::string("empty assertion") : out.assertion);
        WD_ERROR("[AUTH] " << detail);
        return Error::Refused;
    }
    WD_INFO("[AUTH] Assertion obtained for '" << out.userid << "'");
    return Error::None;
}

} // namespace wiredown::core::auth
