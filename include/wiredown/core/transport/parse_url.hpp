#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>
#include <cstdint>

#include "wiredown/core/transport/error.hpp"


namespace wiredown::core::transport {

    enum class Scheme : std::uint8_t {
        Ws,
        Wss,
        Http,
        Https
    };

    [[nodiscard]]
    inline constexpr std::string_view to_string(Scheme s) noexcept {
        switch (s) {
            case Scheme::Ws:    return "ws";
            case Scheme::Wss:   return "wss";
            case Scheme::Http:  return "http";
            case Scheme::Https: return "https";
        }
        return "unknown";
    }

    // Contains parsed URL components
    struct ParsedUrl {
        Scheme scheme{Scheme::Ws};
        bool secure{false};   // true = wss / https
        std::string host;
        std::string port;
        std::string target;   // path + query, always starts with '/'

        // Host header value: port omitted when it is the scheme default
        [[nodiscard]]
        inline std::string host_header() const {
            const bool default_port = (secure && port == "443") || (!secure && port == "80");
            return default_port ? host : host + ":" + port;
        }
    };


    // ---------------------------------------------------------------------
    // NOTE: Minimal URL parser supporting ws://, wss://, http:// and https://
    // It accepts the URLs used by battle servers and login servers and
    // rejects malformed inputs without attempting full RFC compliance.
    //
    // Example inputs:
    //   wss://sim3.psim.us/showdown/websocket
    //   ws://localhost:8000/showdown/websocket
    //   https://play.pokemonshowdown.com/action.php?
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract scheme
        struct Prefix { std::string_view text; Scheme scheme; bool secure; };
        constexpr Prefix prefixes[] = {
            {"ws://",    Scheme::Ws,    false},
            {"wss://",   Scheme::Wss,   true },
            {"http://",  Scheme::Http,  false},
            {"https://", Scheme::Https, true },
        };
        std::size_t pos = std::string_view::npos;
        for (const auto& p : prefixes) {
            if (url.substr(0, p.text.size()) == p.text) {
                out.scheme = p.scheme;
                out.secure = p.secure;
                pos = p.text.size();
                break;
            }
        }
        if (pos == std::string_view::npos) {
            return Error::InvalidUrl;
        }
        // 2) Extract host[:port] (terminated by path or query)
        std::size_t end = url.find_first_of("/?", pos);
        std::string_view hostport = (end == std::string_view::npos) ? url.substr(pos) : url.substr(pos, end - pos);
        if (hostport.empty()) {
            return Error::InvalidUrl;
        }
        // 3) Split host and port
        std::size_t colon = hostport.rfind(':');
        if (colon != std::string_view::npos) {
            out.host = std::string(hostport.substr(0, colon));
            out.port = std::string(hostport.substr(colon + 1));
        } else {
            out.host = std::string(hostport);
            out.port = out.secure ? "443" : "80";
        }
        // 4) Target (default "/" if missing, a bare query gets a leading '/')
        if (end == std::string_view::npos) {
            out.target = "/";
        } else if (url[end] == '?') {
            out.target = "/" + std::string(url.substr(end));
        } else {
            out.target = std::string(url.substr(end));
        }

        // Invariants check --------------------------------

        if (out.host.empty() || out.port.empty()) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }

    [[nodiscard]]
    inline constexpr bool is_websocket(Scheme s) noexcept {
        return s == Scheme::Ws || s == Scheme::Wss;
    }

} // namespace wiredown::core::transport
