#include "wiredown/core/transport/beast/https.hpp"

#include <exception>
#include <algorithm>
#include <type_traits>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include "wiredown/core/transport/parse_url.hpp"
#include "wiredown/version.hpp"
#include "lcr/log/logger.hpp"
#include "detail/run.hpp"


namespace wiredown::core {
namespace transport {
namespace beast {

namespace net  = boost::asio;
namespace ssl  = boost::asio::ssl;
namespace bb   = boost::beast;
namespace http = boost::beast::http;
using tcp      = boost::asio::ip::tcp;
using detail::clock;

namespace {

using TlsStream = bb::ssl_stream<bb::tcp_stream>;

template <class Stream>
Error exchange(net::io_context& ioc, Stream& stream,
               const tcp::resolver::results_type& endpoints,
               http::request<http::string_body>& req,
               HttpResponse& out,
               clock::time_point deadline) {
    bool timed_out = false;
    auto cancel = [&stream] { bb::get_lowest_layer(stream).close(); };

    auto ec = detail::run_op(ioc, deadline,
        [&](auto handler) { bb::get_lowest_layer(stream).async_connect(endpoints, std::move(handler)); },
        cancel, timed_out);
    if (timed_out) {
        return Error::Timeout;
    }
    if (ec) {
        WD_ERROR("[HTTP] TCP connect failed: " << ec.message());
        return Error::ConnectionFailed;
    }

    if constexpr (std::is_same_v<Stream, TlsStream>) {
        ec = detail::run_op(ioc, deadline,
            [&](auto handler) { stream.async_handshake(ssl::stream_base::client, std::move(handler)); },
            cancel, timed_out);
        if (timed_out) {
            return Error::Timeout;
        }
        if (ec) {
            WD_ERROR("[HTTP] TLS handshake failed: " << ec.message());
            return Error::HandshakeFailed;
        }
    }

    ec = detail::run_op(ioc, deadline,
        [&](auto handler) { http::async_write(stream, req, std::move(handler)); },
        cancel, timed_out);
    if (timed_out) {
        return Error::Timeout;
    }
    if (ec) {
        WD_ERROR("[HTTP] Write failed: " << ec.message());
        return Error::TransportFailure;
    }

    bb::flat_buffer buffer;
    http::response<http::string_body> res;
    ec = detail::run_op(ioc, deadline,
        [&](auto handler) { http::async_read(stream, buffer, res, std::move(handler)); },
        cancel, timed_out);
    if (timed_out) {
        return Error::Timeout;
    }
    if (ec) {
        WD_ERROR("[HTTP] Read failed: " << ec.message());
        return Error::ProtocolError;
    }
    out.status = res.result_int();
    out.body = std::move(res.body());

    // Graceful shutdown. Servers routinely drop the connection without a TLS
    // close_notify, so its outcome does not affect the response.
    if constexpr (std::is_same_v<Stream, TlsStream>) {
        ec = detail::run_op(ioc, std::min(deadline, clock::now() + std::chrono::seconds(1)),
            [&](auto handler) { stream.async_shutdown(std::move(handler)); },
            cancel, timed_out);
    }
    else {
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }
    if (ec) {
        WD_TRACE("[HTTP] Shutdown: " << ec.message());
    }
    return Error::None;
}

} // namespace


Error HttpClient::post_form(std::string_view url, std::string_view form_body, HttpResponse& out, std::chrono::milliseconds timeout) noexcept {
    out = HttpResponse{};
    ParsedUrl parsed;
    Error error = parse_url(url, parsed);
    if (error != Error::None || is_websocket(parsed.scheme)) {
        WD_ERROR("[HTTP] Not an http(s) URL: " << url);
        return Error::InvalidUrl;
    }
    try {
        const auto deadline = clock::now() + timeout;
        net::io_context ioc;

        boost::system::error_code ec;
        tcp::resolver resolver(ioc);
        auto endpoints = resolver.resolve(parsed.host, parsed.port, ec);
        if (ec) {
            WD_ERROR("[HTTP] Cannot resolve " << parsed.host << " (" << ec.message() << ")");
            return Error::ConnectionFailed;
        }

        http::request<http::string_body> req{http::verb::post, parsed.target, 11};
        req.set(http::field::host, parsed.host_header());
        req.set(http::field::user_agent, WD_USER_AGENT);
        req.set(http::field::content_type, "application/x-www-form-urlencoded; charset=UTF-8");
        req.body() = std::string(form_body);
        req.prepare_payload();

        WD_DEBUG("[HTTP] POST " << parsed.host_header() << parsed.target << " (" << form_body.size() << " bytes)");

        if (parsed.secure) {
            ssl::context ctx{ssl::context::tls_client};
            ctx.set_default_verify_paths(ec);
            if (ec) {
                WD_WARN("[HTTP] Could not load system trust store: " << ec.message());
            }
            ctx.set_verify_mode(ssl::verify_peer);
            TlsStream stream(ioc, ctx);
            if (!SSL_set_tlsext_host_name(stream.native_handle(), parsed.host.c_str())) {
                WD_ERROR("[HTTP] Failed to set SNI host name");
                return Error::HandshakeFailed;
            }
            stream.set_verify_callback(ssl::host_name_verification(parsed.host));
            error = exchange(ioc, stream, endpoints, req, out, deadline);
        }
        else {
            bb::tcp_stream stream(ioc);
            error = exchange(ioc, stream, endpoints, req, out, deadline);
        }
        if (error == Error::Timeout) {
            WD_ERROR("[HTTP] Request timed out after " << timeout.count() << " ms");
        }
        else if (error == Error::None) {
            WD_DEBUG("[HTTP] Status " << out.status << " (" << out.body.size() << " bytes)");
        }
        return error;
    }
    catch (const std::exception& e) {
        WD_ERROR("[HTTP] post_form() failed: " << e.what());
        return Error::TransportFailure;
    }
}

} // namespace beast
} // namespace transport
} // namespace wiredown::core
