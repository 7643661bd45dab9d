#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <concepts>

#include "wiredown/core/transport/error.hpp"


namespace wiredown::core::transport {

// Result of a single HTTP exchange
struct HttpResponse {
    unsigned status{0};
    std::string body;
};

// -----------------------------------------------------------------------------
// HttpConcept
// -----------------------------------------------------------------------------
//
// One request, one response. The implementation owns connection setup and
// teardown (DNS, TCP, TLS) for each call; nothing is kept alive in between.
//
// post_form() returns Error::None whenever a complete HTTP response was read,
// whatever its status code. Status interpretation belongs to the caller.
//
template<class H>
concept HttpConcept =
    requires(
        H http,
        std::string_view url,
        std::string_view form_body,
        HttpResponse& out,
        std::chrono::milliseconds timeout
    )
{
    { http.post_form(url, form_body, out, timeout) } noexcept -> std::same_as<Error>;
};

} // namespace wiredown::core::transport
