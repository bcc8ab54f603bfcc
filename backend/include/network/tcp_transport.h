#pragma once

#include <array>
#include <asio.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "common/wire.h"
#include "network/transport.h"

namespace kizuna {

/**
 * Length-prefixed frames over one TCP socket.
 */
class TcpChannel : public Channel, public std::enable_shared_from_this<TcpChannel> {
public:
    explicit TcpChannel(asio::ip::tcp::socket socket);

    TransportKind kind() const override { return TransportKind::tcp; }
    std::string remote_address() const override { return remote_; }

    void async_send(Bytes frame, SendHandler handler) override;
    void async_receive(ReceiveHandler handler) override;
    void close() override;

private:
    asio::ip::tcp::socket socket_;
    std::string remote_;
    std::array<uint8_t, wire::kHeaderSize> header_{};
};

/**
 * TCP transport: an async accept loop for inbound peers and outbound
 * connects with a deadline.
 */
class TcpTransport : public TransportAdapter, public std::enable_shared_from_this<TcpTransport> {
public:
    TcpTransport(asio::io_context& io, uint16_t port, bool enable_ipv6);

    TransportKind kind() const override { return TransportKind::tcp; }
    std::error_code listen(AcceptHandler on_accept) override;
    uint16_t port() const override { return port_; }
    void async_connect(const std::string& address,
                       std::chrono::milliseconds timeout,
                       ConnectHandler handler) override;
    void close() override;

    /// Parse "tcp://host:port" or "tcp://[v6]:port".
    static std::optional<asio::ip::tcp::endpoint> parse_endpoint(const std::string& address);

private:
    void do_accept();

    asio::io_context& io_;
    asio::ip::tcp::acceptor acceptor_;
    AcceptHandler on_accept_;
    uint16_t port_;
    bool enable_ipv6_;
};

} // namespace kizuna
