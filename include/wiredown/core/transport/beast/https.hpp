#pragma once

#include <string>
#include <string_view>
#include <chrono>

#include "wiredown/core/transport/http_concept.hpp"
#include "wiredown/core/transport/error.hpp"


namespace wiredown::core {
namespace transport {
namespace beast {

/*
================================================================================
HTTP(S) client (Boost.Beast)
================================================================================

Stateless request/response client used for the login exchange. Each call
resolves, connects, performs the TLS handshake (https), writes one request,
reads one response and shuts the stream down. The whole exchange is bounded
by the caller's timeout.
================================================================================
*/
class HttpClient {
public:
    HttpClient() = default;

    [[nodiscard]]
    Error post_form(std::string_view url, std::string_view form_body, HttpResponse& out, std::chrono::milliseconds timeout) noexcept;
};

static_assert(HttpConcept<HttpClient>);

} // namespace beast
} // namespace transport
} // namespace wiredown::core
