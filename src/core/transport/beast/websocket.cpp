#include "wiredown/core/transport/beast/websocket.hpp"

#include <exception>
#include <type_traits>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "wiredown/version.hpp"
#include "lcr/log/logger.hpp"
#include "detail/run.hpp"


namespace wiredown::core {
namespace transport {
namespace beast {

namespace net       = boost::asio;
namespace ssl       = boost::asio::ssl;
namespace bb        = boost::beast;
namespace http      = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp           = boost::asio::ip::tcp;
using detail::clock;

using PlainStream = websocket::stream<bb::tcp_stream>;
using TlsStream   = websocket::stream<bb::ssl_stream<bb::tcp_stream>>;


struct WebSocket::Impl {
    net::io_context ioc;
    ssl::context ssl_ctx{ssl::context::tls_client};

    // Exactly one of these is set while connected
    std::unique_ptr<PlainStream> plain;
    std::unique_ptr<TlsStream>   tls;

    bb::flat_buffer buffer;

    // Outstanding read state (survives receive() timeouts)
    bool read_pending{false};
    bool read_done{false};
    boost::system::error_code read_ec;

    bool connected{false};

    template <class F>
    decltype(auto) with_stream(F&& f) {
        if (tls) {
            return f(*tls);
        }
        return f(*plain);
    }

    [[nodiscard]]
    bool has_stream() const noexcept {
        return plain || tls;
    }

    template <class Stream>
    Error establish(Stream& ws, const tcp::resolver::results_type& endpoints,
                    const std::string& host_header, const std::string& target,
                    clock::time_point deadline) {
        bool timed_out = false;
        auto cancel = [&ws] { bb::get_lowest_layer(ws).close(); };

        // 1) TCP
        auto ec = detail::run_op(ioc, deadline,
            [&](auto handler) { bb::get_lowest_layer(ws).async_connect(endpoints, std::move(handler)); },
            cancel, timed_out);
        if (timed_out) {
            WD_ERROR("[WS] TCP connect timed out");
            return Error::Timeout;
        }
        if (ec) {
            WD_ERROR("[WS] TCP connect failed: " << ec.message());
            return Error::ConnectionFailed;
        }

        // 2) TLS
        if constexpr (std::is_same_v<Stream, TlsStream>) {
            ec = detail::run_op(ioc, deadline,
                [&](auto handler) { ws.next_layer().async_handshake(ssl::stream_base::client, std::move(handler)); },
                cancel, timed_out);
            if (timed_out || ec) {
                WD_ERROR("[WS] TLS handshake failed: " << (timed_out ? std::string("timeout") : ec.message()));
                return timed_out ? Error::Timeout : Error::HandshakeFailed;
            }
        }

        // 3) WebSocket upgrade. Deadlines are enforced per call by this class,
        //    so Beast's own idle timer stays off.
        websocket::stream_base::timeout opt{};
        opt.handshake_timeout = std::chrono::duration_cast<std::chrono::seconds>(CONNECT_TIMEOUT);
        opt.idle_timeout      = websocket::stream_base::none();
        opt.keep_alive_pings  = false;
        ws.set_option(opt);
        ws.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
            req.set(http::field::user_agent, WD_USER_AGENT);
        }));

        ec = detail::run_op(ioc, deadline,
            [&](auto handler) { ws.async_handshake(host_header, target, std::move(handler)); },
            cancel, timed_out);
        if (timed_out || ec) {
            WD_ERROR("[WS] WebSocket upgrade failed: " << (timed_out ? std::string("timeout") : ec.message()));
            return timed_out ? Error::Timeout : Error::HandshakeFailed;
        }
        ws.text(true);
        return Error::None;
    }

    void start_read() {
        read_pending = true;
        read_done = false;
        read_ec = {};
        with_stream([this](auto& ws) {
            ws.async_read(buffer, [this](boost::system::error_code ec, std::size_t) {
                read_ec = ec;
                read_done = true;
            });
        });
    }

    // Wait for the outstanding read to complete after its socket was closed
    void drain_read() {
        if (read_pending && !read_done) {
            ioc.restart();
            while (!read_done && ioc.run_one() > 0) {}
        }
        read_pending = false;
        read_done = false;
    }

    [[nodiscard]]
    static Error classify_read_error(const boost::system::error_code& ec) noexcept {
        if (ec == websocket::error::closed) {
            WD_INFO("[WS] Received WebSocket close frame.");
            return Error::RemoteClosed;
        }
        if (ec == net::error::eof || ec == net::error::connection_reset || ec == bb::error::timeout) {
            WD_INFO("[WS] Connection closed by peer (" << ec.message() << ")");
            return Error::RemoteClosed;
        }
        if (ec == net::error::operation_aborted) {
            WD_TRACE("[WS] Receive cancelled (local shutdown)");
            return Error::LocalShutdown;
        }
        WD_ERROR("[WS] Receive failed: " << ec.message());
        return Error::TransportFailure;
    }
};


WebSocket::WebSocket()
    : impl_(std::make_unique<Impl>()) {
}

WebSocket::~WebSocket() {
    close();
}

Error WebSocket::connect(const std::string& host, const std::string& port, const std::string& target, bool secure) noexcept {
    if (impl_->has_stream()) {
        WD_WARN("[WS] connect() called twice");
        return Error::InvalidState;
    }
    try {
        const auto deadline = clock::now() + CONNECT_TIMEOUT;

        boost::system::error_code ec;
        tcp::resolver resolver(impl_->ioc);
        auto endpoints = resolver.resolve(host, port, ec);
        if (ec) {
            WD_ERROR("[WS] Cannot resolve " << host << ":" << port << " (" << ec.message() << ")");
            return Error::ConnectionFailed;
        }

        const std::string host_header = (port == (secure ? "443" : "80")) ? host : host + ":" + port;

        Error error;
        if (secure) {
            impl_->ssl_ctx.set_default_verify_paths(ec);
            if (ec) {
                WD_WARN("[WS] Could not load system trust store: " << ec.message());
            }
            impl_->ssl_ctx.set_verify_mode(ssl::verify_peer);
            impl_->tls = std::make_unique<TlsStream>(impl_->ioc, impl_->ssl_ctx);
            if (!SSL_set_tlsext_host_name(impl_->tls->next_layer().native_handle(), host.c_str())) {
                WD_ERROR("[WS] Failed to set SNI host name");
                return Error::HandshakeFailed;
            }
            impl_->tls->next_layer().set_verify_callback(ssl::host_name_verification(host));
            error = impl_->establish(*impl_->tls, endpoints, host_header, target, deadline);
        }
        else {
            impl_->plain = std::make_unique<PlainStream>(impl_->ioc);
            error = impl_->establish(*impl_->plain, endpoints, host_header, target, deadline);
        }
        if (error != Error::None) {
            return error;
        }
        impl_->connected = true;
        WD_DEBUG("[WS] Connected to " << host_header << target);
        return Error::None;
    }
    catch (const std::exception& e) {
        WD_ERROR("[WS] connect() failed: " << e.what());
        return Error::TransportFailure;
    }
}

bool WebSocket::send(std::string_view msg) noexcept {
    if (!impl_->connected) {
        WD_ERROR("[WS] send() called on unconnected WebSocket");
        return false;
    }
    WD_TRACE("[WS] Sending message ... (size " << msg.size() << ")");
    bool timed_out = false;
    auto ec = impl_->with_stream([&](auto& ws) {
        return detail::run_op(impl_->ioc, clock::now() + SEND_TIMEOUT,
            [&](auto handler) { ws.async_write(net::buffer(msg.data(), msg.size()), std::move(handler)); },
            [&ws] { bb::get_lowest_layer(ws).close(); },
            timed_out);
    });
    if (timed_out || ec) {
        WD_ERROR("[WS] send() failed: " << (timed_out ? std::string("timeout") : ec.message()));
        impl_->connected = false;
        return false;
    }
    return true;
}

Error WebSocket::receive(std::string& out, std::chrono::milliseconds timeout) noexcept {
    if (!impl_->connected) {
        return Error::InvalidState;
    }
    if (!impl_->read_pending) {
        impl_->start_read();
    }
    if (!detail::run_until(impl_->ioc, impl_->read_done, clock::now() + timeout)) {
        return Error::Timeout;
    }
    impl_->read_pending = false;
    impl_->read_done = false;
    if (impl_->read_ec) {
        impl_->connected = false;
        return Impl::classify_read_error(impl_->read_ec);
    }
    out = bb::buffers_to_string(impl_->buffer.data());
    impl_->buffer.consume(impl_->buffer.size());
    return Error::None;
}

void WebSocket::close() noexcept {
    if (!impl_ || !impl_->has_stream()) {
        return;
    }
    try {
        impl_->with_stream([this](auto& ws) {
            if (impl_->connected) {
                impl_->connected = false;
                WD_TRACE("[WS] Closing WebSocket ...");
                bool timed_out = false;
                auto ec = detail::run_op(impl_->ioc, clock::now() + CLOSE_TIMEOUT,
                    [&](auto handler) { ws.async_close(websocket::close_code::normal, std::move(handler)); },
                    [&ws] { bb::get_lowest_layer(ws).close(); },
                    timed_out);
                if (timed_out || ec) {
                    WD_DEBUG("[WS] Close handshake incomplete: " << (timed_out ? std::string("timeout") : ec.message()));
                }
            }
            bb::get_lowest_layer(ws).close();
        });
        impl_->drain_read();
    }
    catch (const std::exception& e) {
        WD_WARN("[WS] close() raised: " << e.what());
    }
    impl_->tls.reset();
    impl_->plain.reset();
    WD_TRACE("[WS] WebSocket closed.");
}

} // namespace beast
} // namespace transport
} // namespace wiredown::core
