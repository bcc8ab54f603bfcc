/**
 * Session: one authenticated channel to a peer.
 *
 * Outgoing messages are queued on the session strand and written one
 * at a time. Keepalives detect a peer that has gone silent.
 */

#include "connection/session.h"

#include <spdlog/spdlog.h>

#include "common/error.h"
#include "common/wire.h"

namespace kizuna {

using json = nlohmann::json;

Session::Session(asio::io_context& io,
                 std::shared_ptr<Channel> channel,
                 HandshakeResult handshake,
                 bool initiator,
                 const NetworkingConfig& config)
    : io_(io)
    , strand_(asio::make_strand(io))
    , channel_(std::move(channel))
    , config_(config)
    , keepalive_(strand_) {
    info_.id = handshake.session_id;
    info_.peer_id = handshake.peer_id;
    info_.peer_name = handshake.name;
    info_.user_name = handshake.user_name;
    info_.transport = channel_->kind();
    info_.security = handshake.security;
    info_.remote_address = channel_->remote_address();
    info_.initiator = initiator;
    if (handshake.keys)
        cipher_ = std::make_unique<SessionCipher>(std::move(*handshake.keys));
}

void Session::set_message_handler(const std::string& channel, MessageHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    handlers_[channel] = std::move(handler);
}

void Session::set_close_handler(CloseHandler handler) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    close_handler_ = std::move(handler);
}

void Session::start() {
    asio::post(strand_, [self = shared_from_this()] {
        spdlog::debug("Session: {} started with {} over {} ({})", self->info_.id, self->info_.peer_id.substr(0, 16),
                      to_string(self->info_.transport), to_string(self->info_.security));
        self->do_read();
        self->schedule_keepalive();
    });
}

void Session::do_read() {
    channel_->async_receive([self = shared_from_this()](std::error_code ec, Bytes frame) {
        asio::post(self->strand_, [self, ec, frame = std::move(frame)]() mutable {
            self->on_read(ec, std::move(frame));
        });
    });
}

void Session::on_read(std::error_code ec, Bytes frame) {
    if (finished_)
        return;
    if (ec) {
        spdlog::info("Session: {} with {} lost: {}", info_.id, info_.peer_id.substr(0, 16), ec.message());
        finish(errc::session_lost);
        return;
    }
    heard_since_tick_ = true;
    handle_frame(std::move(frame));
    if (!finished_)
        do_read();
}

void Session::handle_frame(Bytes frame) {
    if (cipher_) {
        auto plain = cipher_->open(frame);
        if (!plain) {
            spdlog::warn("Session: {} dropped a frame that failed authentication", info_.id);
            finish(errc::session_lost);
            return;
        }
        frame = std::move(*plain);
    }

    auto message = wire::decode_message(frame);
    if (!message) {
        spdlog::warn("Session: {} received a malformed message", info_.id);
        return;
    }

    const std::string channel = message->value("ch", std::string{});
    const std::string type = message->value("t", std::string{});
    if (channel == wire::kControl) {
        if (type == "ping") {
            send(wire::make_message(wire::kControl, "pong"));
        } else if (type == "bye") {
            spdlog::info("Session: {} closed by peer {}", info_.id, info_.peer_id.substr(0, 16));
            finish(errc::session_lost);
        }
        return;
    }

    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        auto it = handlers_.find(channel);
        if (it != handlers_.end())
            handler = it->second;
    }
    if (!handler) {
        spdlog::debug("Session: {} ignoring message on channel '{}'", info_.id, channel);
        return;
    }
    handler(*message);
}

void Session::send(json message, SendHandler done) {
    ++depth_;
    asio::post(strand_, [self = shared_from_this(), message = std::move(message), done = std::move(done)]() mutable {
        if (self->finished_) {
            --self->depth_;
            if (done)
                done(errc::session_lost);
            return;
        }
        self->queue_.push_back(Outgoing{std::move(message), std::move(done)});
        if (!self->writing_)
            self->do_write();
    });
}

void Session::do_write() {
    if (queue_.empty() || finished_) {
        writing_ = false;
        return;
    }
    writing_ = true;

    Bytes frame = wire::encode_message(queue_.front().message);
    if (cipher_)
        frame = cipher_->seal(frame);

    channel_->async_send(std::move(frame), [self = shared_from_this()](std::error_code ec) {
        asio::post(self->strand_, [self, ec] { self->on_written(ec); });
    });
}

void Session::on_written(std::error_code ec) {
    if (finished_)
        return;
    Outgoing sent = std::move(queue_.front());
    queue_.pop_front();
    --depth_;
    if (sent.done)
        sent.done(ec ? make_error_code(errc::session_lost) : std::error_code{});
    if (ec) {
        spdlog::info("Session: {} write failed: {}", info_.id, ec.message());
        finish(errc::session_lost);
        return;
    }
    do_write();
}

void Session::schedule_keepalive() {
    if (finished_ || config_.keepalive_interval.count() <= 0)
        return;
    keepalive_.expires_after(config_.keepalive_interval);
    keepalive_.async_wait([self = shared_from_this()](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted || self->finished_)
            return;

        if (self->heard_since_tick_) {
            self->missed_ = 0;
        } else if (++self->missed_ >= self->config_.keepalive_misses) {
            spdlog::warn("Session: {} missed {} keepalives, peer {} presumed gone", self->info_.id, self->missed_,
                         self->info_.peer_id.substr(0, 16));
            self->finish(errc::session_lost);
            return;
        }
        self->heard_since_tick_ = false;
        if (self->queue_.empty())
            self->send(wire::make_message(wire::kControl, "ping"));
        self->schedule_keepalive();
    });
}

void Session::close() {
    asio::post(strand_, [self = shared_from_this()] {
        if (self->finished_ || self->closing_)
            return;
        self->closing_ = true;
        spdlog::debug("Session: {} closing", self->info_.id);

        // bye is the last message; finish once it has been written.
        self->queue_.push_back(Outgoing{wire::make_message(wire::kControl, "bye"),
                                        [self](std::error_code) { self->finish({}); }});
        ++self->depth_;
        if (!self->writing_)
            self->do_write();
    });
}

void Session::abort(std::error_code reason) {
    asio::post(strand_, [self = shared_from_this(), reason] { self->finish(reason); });
}

void Session::finish(std::error_code reason) {
    if (finished_)
        return;
    finished_ = true;
    open_ = false;
    keepalive_.cancel();
    channel_->close();

    std::deque<Outgoing> pending;
    pending.swap(queue_);
    writing_ = false;
    for (auto& out : pending) {
        --depth_;
        if (out.done)
            out.done(errc::session_lost);
    }

    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = std::move(close_handler_);
        close_handler_ = nullptr;
        handlers_.clear();
    }
    if (handler)
        asio::post(io_, [handler = std::move(handler), reason] { handler(reason); });
}

} // namespace kizuna
