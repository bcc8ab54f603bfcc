/**
 * TcpTransport: listens for incoming TCP connections from other peers and
 * opens outbound ones.
 *
 * Uses standalone ASIO for async I/O. Every accepted or connected socket
 * becomes a TcpChannel that reads and writes length-prefixed frames.
 */

#include "network/tcp_transport.h"

#include <spdlog/spdlog.h>

#include "common/error.h"

namespace kizuna {

namespace {

std::string format_endpoint(const asio::ip::tcp::endpoint& ep) {
    if (ep.address().is_v6())
        return "tcp://[" + ep.address().to_string() + "]:" + std::to_string(ep.port());
    return "tcp://" + ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace

// ── TcpChannel ──────────────────────────────────────────────────────────────

TcpChannel::TcpChannel(asio::ip::tcp::socket socket)
    : socket_(std::move(socket)) {
    asio::error_code ec;
    auto ep = socket_.remote_endpoint(ec);
    remote_ = ec ? std::string("tcp://unknown") : format_endpoint(ep);
    socket_.set_option(asio::ip::tcp::no_delay(true), ec);
}

void TcpChannel::async_send(Bytes frame, SendHandler handler) {
    if (frame.size() > wire::kMaxFrameSize) {
        asio::post(socket_.get_executor(), [handler = std::move(handler)] { handler(errc::protocol_error); });
        return;
    }

    struct Outgoing {
        std::array<uint8_t, wire::kHeaderSize> header;
        Bytes body;
    };
    auto out = std::make_shared<Outgoing>();
    out->header = wire::encode_header(static_cast<std::uint32_t>(frame.size()));
    out->body = std::move(frame);

    std::array<asio::const_buffer, 2> buffers = {
        asio::buffer(out->header),
        asio::buffer(out->body),
    };
    asio::async_write(socket_, buffers,
        [self = shared_from_this(), out, handler = std::move(handler)](const asio::error_code& ec, std::size_t) {
            handler(ec);
        });
}

void TcpChannel::async_receive(ReceiveHandler handler) {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(header_),
        [this, self, handler = std::move(handler)](const asio::error_code& ec, std::size_t) mutable {
            if (ec) {
                handler(ec, {});
                return;
            }
            std::uint32_t length = wire::decode_header(header_);
            if (length > wire::kMaxFrameSize) {
                spdlog::warn("Session: oversized frame ({} bytes) from {}", length, remote_);
                handler(errc::protocol_error, {});
                return;
            }
            auto body = std::make_shared<Bytes>(length);
            asio::async_read(socket_, asio::buffer(*body),
                [self, body, handler = std::move(handler)](const asio::error_code& ec, std::size_t) {
                    handler(ec, ec ? Bytes{} : std::move(*body));
                });
        });
}

void TcpChannel::close() {
    // Socket state is only touched on its own executor.
    asio::post(socket_.get_executor(), [self = shared_from_this()] {
        if (!self->socket_.is_open())
            return;
        asio::error_code ec;
        self->socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        self->socket_.close(ec);
        if (ec)
            spdlog::debug("Session: closing {}: {}", self->remote_, ec.message());
    });
}

// ── TcpTransport ────────────────────────────────────────────────────────────

TcpTransport::TcpTransport(asio::io_context& io, uint16_t port, bool enable_ipv6)
    : io_(io)
    , acceptor_(asio::make_strand(io))
    , port_(port)
    , enable_ipv6_(enable_ipv6) {}

std::error_code TcpTransport::listen(AcceptHandler on_accept) {
    on_accept_ = std::move(on_accept);

    asio::error_code ec;
    asio::ip::tcp::endpoint endpoint(enable_ipv6_ ? asio::ip::tcp::v6() : asio::ip::tcp::v4(), port_);
    acceptor_.open(endpoint.protocol(), ec);
    if (ec && enable_ipv6_) {
        // Host without IPv6: fall back to IPv4 only.
        endpoint = asio::ip::tcp::endpoint(asio::ip::tcp::v4(), port_);
        acceptor_.open(endpoint.protocol(), ec);
    }
    if (ec)
        return ec;

    if (endpoint.protocol() == asio::ip::tcp::v6())
        acceptor_.set_option(asio::ip::v6_only(false), ec);
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
    acceptor_.bind(endpoint, ec);
    if (ec)
        return ec;
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec)
        return ec;

    port_ = acceptor_.local_endpoint(ec).port();
    spdlog::info("Connection: listening on tcp port {}", port_);
    do_accept();
    return {};
}

void TcpTransport::do_accept() {
    acceptor_.async_accept(asio::make_strand(io_),
        [self = shared_from_this()](const asio::error_code& ec, asio::ip::tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !self->acceptor_.is_open())
                return;
            if (ec) {
                spdlog::warn("Connection: accept failed: {}", ec.message());
            } else {
                auto channel = std::make_shared<TcpChannel>(std::move(socket));
                spdlog::debug("Connection: inbound tcp from {}", channel->remote_address());
                if (self->on_accept_)
                    self->on_accept_(channel);
            }
            self->do_accept();
        });
}

std::optional<asio::ip::tcp::endpoint> TcpTransport::parse_endpoint(const std::string& address) {
    auto parts = split_address(address);
    if (!parts || parts->first != "tcp")
        return std::nullopt;

    const std::string& rest = parts->second;
    auto colon = rest.rfind(':');
    if (colon == std::string::npos || colon + 1 >= rest.size())
        return std::nullopt;

    std::string host = rest.substr(0, colon);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']')
        host = host.substr(1, host.size() - 2);

    unsigned long port = 0;
    try {
        port = std::stoul(rest.substr(colon + 1));
    } catch (const std::exception&) {
        return std::nullopt;
    }
    if (port == 0 || port > 65535)
        return std::nullopt;

    asio::error_code ec;
    auto ip = asio::ip::make_address(host, ec);
    if (ec)
        return std::nullopt;
    return asio::ip::tcp::endpoint(ip, static_cast<uint16_t>(port));
}

void TcpTransport::async_connect(const std::string& address,
                                 std::chrono::milliseconds timeout,
                                 ConnectHandler handler) {
    auto endpoint = parse_endpoint(address);
    if (!endpoint) {
        asio::post(io_, [handler = std::move(handler)] { handler(errc::transport_unavailable, nullptr); });
        return;
    }

    struct Attempt {
        Attempt(asio::io_context& io)
            : socket(asio::make_strand(io)), timer(socket.get_executor()) {}
        asio::ip::tcp::socket socket;
        asio::steady_timer timer;
        bool timed_out = false;
    };
    auto attempt = std::make_shared<Attempt>(io_);

    attempt->timer.expires_after(timeout);
    attempt->timer.async_wait([attempt](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted)
            return;
        attempt->timed_out = true;
        asio::error_code ignored;
        attempt->socket.close(ignored);
    });

    attempt->socket.async_connect(*endpoint,
        [attempt, address, handler = std::move(handler)](const asio::error_code& ec) {
            attempt->timer.cancel();
            if (attempt->timed_out) {
                spdlog::debug("Connection: connect to {} timed out", address);
                handler(errc::timed_out, nullptr);
                return;
            }
            if (ec) {
                spdlog::debug("Connection: connect to {} failed: {}", address, ec.message());
                handler(ec, nullptr);
                return;
            }
            handler({}, std::make_shared<TcpChannel>(std::move(attempt->socket)));
        });
}

void TcpTransport::close() {
    asio::post(acceptor_.get_executor(), [self = shared_from_this()] {
        asio::error_code ec;
        self->acceptor_.close(ec);
        if (ec)
            spdlog::warn("Connection: closing tcp listener: {}", ec.message());
    });
}

} // namespace kizuna
