/**
 * LoopbackHub: in-process transport used by tests and the demo.
 *
 * Frames can be delayed, rewritten or dropped, and links severed.
 */

#include "network/loopback_transport.h"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "common/error.h"

namespace kizuna {

// ── LoopbackHub ─────────────────────────────────────────────────────────────

std::shared_ptr<LoopbackHub> LoopbackHub::create() {
    return std::shared_ptr<LoopbackHub>(new LoopbackHub());
}

void LoopbackHub::set_frame_filter(FrameFilter filter) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_ = std::move(filter);
}

void LoopbackHub::set_send_delay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    send_delay_ = delay;
}

void LoopbackHub::fail_next_connects(const std::string& address, unsigned count) {
    std::lock_guard<std::mutex> lock(mutex_);
    refuse_next_[address] = count;
}

void LoopbackHub::set_unreachable(const std::string& address, bool unreachable) {
    std::lock_guard<std::mutex> lock(mutex_);
    unreachable_[address] = unreachable;
}

void LoopbackHub::sever(const std::string& address) {
    std::vector<std::weak_ptr<Channel>> victims;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = channels_.find(address);
        if (it == channels_.end())
            return;
        victims.swap(it->second);
    }
    for (auto& weak : victims) {
        if (auto channel = weak.lock())
            channel->close();
    }
}

unsigned LoopbackHub::connect_attempts(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = attempts_.find(address);
    return it == attempts_.end() ? 0 : it->second;
}

bool LoopbackHub::register_listener(const std::string& address, std::weak_ptr<LoopbackTransport> transport) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = listeners_.find(address);
    if (it != listeners_.end() && !it->second.expired())
        return false;
    listeners_[address] = std::move(transport);
    return true;
}

void LoopbackHub::unregister_listener(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    listeners_.erase(address);
}

std::shared_ptr<LoopbackTransport> LoopbackHub::admit(const std::string& address, std::error_code& ec) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++attempts_[address];

    auto unreachable = unreachable_.find(address);
    if (unreachable != unreachable_.end() && unreachable->second) {
        ec = asio::error::host_unreachable;
        return nullptr;
    }
    auto refuse = refuse_next_.find(address);
    if (refuse != refuse_next_.end() && refuse->second > 0) {
        --refuse->second;
        ec = asio::error::connection_refused;
        return nullptr;
    }
    auto it = listeners_.find(address);
    auto listener = it == listeners_.end() ? nullptr : it->second.lock();
    if (!listener) {
        ec = asio::error::connection_refused;
        return nullptr;
    }
    ec.clear();
    return listener;
}

void LoopbackHub::track(const std::string& address, std::weak_ptr<Channel> channel) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& list = channels_[address];
    list.erase(std::remove_if(list.begin(), list.end(),
                              [](const std::weak_ptr<Channel>& c) { return c.expired(); }),
               list.end());
    list.push_back(std::move(channel));
}

bool LoopbackHub::filter(const std::string& from, Bytes& frame) const {
    FrameFilter filter;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        filter = filter_;
    }
    return !filter || filter(from, frame);
}

std::chrono::milliseconds LoopbackHub::send_delay() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return send_delay_;
}

// ── LoopbackChannel ─────────────────────────────────────────────────────────

LoopbackChannel::LoopbackChannel(std::shared_ptr<LoopbackHub> hub, asio::io_context& io,
                                 TransportKind kind, std::string local, std::string remote)
    : hub_(std::move(hub))
    , io_(io)
    , kind_(kind)
    , local_(std::move(local))
    , remote_(std::move(remote)) {}

void LoopbackChannel::pair(const std::shared_ptr<LoopbackChannel>& a, const std::shared_ptr<LoopbackChannel>& b) {
    {
        std::lock_guard<std::mutex> lock(a->mutex_);
        a->peer_ = b;
    }
    std::lock_guard<std::mutex> lock(b->mutex_);
    b->peer_ = a;
}

void LoopbackChannel::async_send(Bytes frame, SendHandler handler) {
    std::shared_ptr<LoopbackChannel> peer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_)
            peer = peer_.lock();
    }
    if (!peer) {
        asio::post(io_, [handler = std::move(handler)] { handler(asio::error::not_connected); });
        return;
    }

    bool keep = hub_->filter(local_, frame);
    auto delay = hub_->send_delay();
    auto complete = [peer, keep, frame = std::move(frame), handler = std::move(handler)]() mutable {
        if (keep)
            peer->deliver(std::move(frame));
        handler({});
    };

    if (delay.count() <= 0) {
        asio::post(io_, std::move(complete));
        return;
    }
    auto timer = std::make_shared<asio::steady_timer>(io_, delay);
    timer->async_wait([timer, complete = std::move(complete)](const asio::error_code&) mutable {
        complete();
    });
}

void LoopbackChannel::deliver(Bytes frame) {
    ReceiveHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return;
        if (!pending_receive_) {
            inbox_.push_back(std::move(frame));
            return;
        }
        handler = std::move(pending_receive_);
        pending_receive_ = nullptr;
    }
    asio::post(io_, [handler = std::move(handler), frame = std::move(frame)]() mutable {
        handler({}, std::move(frame));
    });
}

void LoopbackChannel::async_receive(ReceiveHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!inbox_.empty()) {
        Bytes frame = std::move(inbox_.front());
        inbox_.pop_front();
        asio::post(io_, [handler = std::move(handler), frame = std::move(frame)]() mutable {
            handler({}, std::move(frame));
        });
        return;
    }
    if (closed_) {
        asio::post(io_, [handler = std::move(handler)] { handler(asio::error::eof, {}); });
        return;
    }
    pending_receive_ = std::move(handler);
}

void LoopbackChannel::close() {
    std::shared_ptr<LoopbackChannel> peer;
    ReceiveHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return;
        closed_ = true;
        inbox_.clear();
        peer = peer_.lock();
        peer_.reset();
        handler = std::move(pending_receive_);
        pending_receive_ = nullptr;
    }
    if (handler)
        asio::post(io_, [handler = std::move(handler)] { handler(asio::error::operation_aborted, {}); });
    if (peer)
        peer->remote_closed();
}

void LoopbackChannel::remote_closed() {
    ReceiveHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return;
        // Frames already delivered stay readable; eof follows them.
        closed_ = true;
        peer_.reset();
        handler = std::move(pending_receive_);
        pending_receive_ = nullptr;
    }
    if (handler)
        asio::post(io_, [handler = std::move(handler)] { handler(asio::error::eof, {}); });
}

// ── LoopbackTransport ───────────────────────────────────────────────────────

LoopbackTransport::LoopbackTransport(asio::io_context& io, std::shared_ptr<LoopbackHub> hub,
                                     TransportKind kind, std::string name)
    : io_(io)
    , hub_(std::move(hub))
    , kind_(kind)
    , address_(std::string(to_string(kind)) + "://" + name) {}

std::error_code LoopbackTransport::listen(AcceptHandler on_accept) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        on_accept_ = std::move(on_accept);
        listening_ = true;
    }
    if (!hub_->register_listener(address_, weak_from_this()))
        return asio::error::address_in_use;
    spdlog::debug("Connection: loopback listener at {}", address_);
    return {};
}

void LoopbackTransport::accept(std::shared_ptr<Channel> channel) {
    AcceptHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!listening_) {
            channel->close();
            return;
        }
        handler = on_accept_;
    }
    asio::post(io_, [handler, channel] { handler(channel); });
}

void LoopbackTransport::async_connect(const std::string& address,
                                      std::chrono::milliseconds,
                                      ConnectHandler handler) {
    std::error_code ec;
    auto listener = hub_->admit(address, ec);
    if (!listener) {
        spdlog::debug("Connection: loopback connect to {} refused: {}", address, ec.message());
        asio::post(io_, [handler = std::move(handler), ec] { handler(ec, nullptr); });
        return;
    }

    auto client = std::make_shared<LoopbackChannel>(hub_, io_, kind_, address_, address);
    auto server = std::make_shared<LoopbackChannel>(hub_, listener->io_, kind_, address, address_);
    LoopbackChannel::pair(client, server);
    hub_->track(address, client);
    hub_->track(address, server);

    listener->accept(server);
    asio::post(io_, [handler = std::move(handler), client] { handler({}, client); });
}

void LoopbackTransport::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!listening_)
            return;
        listening_ = false;
        on_accept_ = nullptr;
    }
    hub_->unregister_listener(address_);
}

} // namespace kizuna
