#pragma once

#include <asio.hpp>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "network/transport.h"

namespace kizuna {

class LoopbackTransport;

/**
 * In-process rendezvous for loopback transports.
 *
 * Several engines in one process register listeners here under addresses of
 * the form "<kind>://<name>". The hub also injects faults: refused connects,
 * frame rewriting or dropping, send latency, and severed links.
 */
class LoopbackHub {
public:
    /// Return false to drop the frame; the filter may also rewrite it.
    using FrameFilter = std::function<bool(const std::string& from, Bytes& frame)>;

    static std::shared_ptr<LoopbackHub> create();

    void set_frame_filter(FrameFilter filter);
    void set_send_delay(std::chrono::milliseconds delay);

    /// Refuse the next `count` connects to `address`.
    void fail_next_connects(const std::string& address, unsigned count);
    /// Refuse every connect to `address` while set.
    void set_unreachable(const std::string& address, bool unreachable);

    /// Close every live channel attached to the listener at `address`.
    void sever(const std::string& address);

    [[nodiscard]] unsigned connect_attempts(const std::string& address) const;

private:
    friend class LoopbackTransport;
    friend class LoopbackChannel;

    LoopbackHub() = default;

    bool register_listener(const std::string& address, std::weak_ptr<LoopbackTransport> transport);
    void unregister_listener(const std::string& address);
    /// Null with the refusal reason set when the connect must fail.
    std::shared_ptr<LoopbackTransport> admit(const std::string& address, std::error_code& ec);
    void track(const std::string& address, std::weak_ptr<Channel> channel);

    bool filter(const std::string& from, Bytes& frame) const;
    std::chrono::milliseconds send_delay() const;

    mutable std::mutex mutex_;
    std::map<std::string, std::weak_ptr<LoopbackTransport>> listeners_;
    std::map<std::string, std::vector<std::weak_ptr<Channel>>> channels_;
    std::map<std::string, unsigned> refuse_next_;
    std::map<std::string, bool> unreachable_;
    std::map<std::string, unsigned> attempts_;
    FrameFilter filter_;
    std::chrono::milliseconds send_delay_{0};
};

/// One end of an in-process channel pair.
class LoopbackChannel : public Channel {
public:
    LoopbackChannel(std::shared_ptr<LoopbackHub> hub, asio::io_context& io,
                    TransportKind kind, std::string local, std::string remote);

    /// Connect two fresh endpoints to each other.
    static void pair(const std::shared_ptr<LoopbackChannel>& a, const std::shared_ptr<LoopbackChannel>& b);

    TransportKind kind() const override { return kind_; }
    std::string remote_address() const override { return remote_; }

    void async_send(Bytes frame, SendHandler handler) override;
    void async_receive(ReceiveHandler handler) override;
    void close() override;

private:
    void deliver(Bytes frame);
    void remote_closed();

    std::shared_ptr<LoopbackHub> hub_;
    asio::io_context& io_;
    TransportKind kind_;
    std::string local_;
    std::string remote_;

    std::mutex mutex_;
    std::weak_ptr<LoopbackChannel> peer_;
    std::deque<Bytes> inbox_;
    ReceiveHandler pending_receive_;
    bool closed_ = false;
};

/**
 * A transport adapter of any kind whose channels never leave the process.
 */
class LoopbackTransport : public TransportAdapter, public std::enable_shared_from_this<LoopbackTransport> {
public:
    LoopbackTransport(asio::io_context& io, std::shared_ptr<LoopbackHub> hub,
                      TransportKind kind, std::string name);

    TransportKind kind() const override { return kind_; }
    std::error_code listen(AcceptHandler on_accept) override;
    std::string advertised_address() const override { return address_; }
    void async_connect(const std::string& address,
                       std::chrono::milliseconds timeout,
                       ConnectHandler handler) override;
    void close() override;

    /// "<kind>://<name>", the address peers connect to.
    [[nodiscard]] const std::string& address() const { return address_; }

private:
    friend class LoopbackHub;

    void accept(std::shared_ptr<Channel> channel);

    asio::io_context& io_;
    std::shared_ptr<LoopbackHub> hub_;
    TransportKind kind_;
    std::string address_;
    std::mutex mutex_;
    AcceptHandler on_accept_;
    bool listening_ = false;
};

} // namespace kizuna
