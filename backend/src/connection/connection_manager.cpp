/**
 * ConnectionManager: dialing, accepting and tracking sessions.
 *
 * Outbound attempts walk the transports in priority order. Inbound
 * channels are handshaken and checked against the trust policy
 * before a session is admitted.
 */

#include "connection/connection_manager.h"

#include <atomic>

#include <spdlog/spdlog.h>

#include "common/error.h"
#include "common/wire.h"

namespace kizuna {

using json = nlohmann::json;

namespace {

std::string short_id(const PeerId& peer) {
    return peer.substr(0, 16);
}

HandshakeOptions handshake_options(const SecurityConfig& security) {
    HandshakeOptions options;
    options.encryption = security.enable_encryption;
    options.require_authentication = security.require_authentication;
    return options;
}

} // namespace

/**
 * One handshake in progress over a raw channel, bounded by a deadline that
 * closes the channel when it expires.
 */
class ConnectionManager::Exchange : public std::enable_shared_from_this<Exchange> {
public:
    using SendDone = std::function<void(std::error_code)>;
    using ReceiveDone = std::function<void(std::error_code, json)>;

    Exchange(asio::io_context& io, std::shared_ptr<Channel> ch)
        : channel(std::move(ch))
        , strand(asio::make_strand(io))
        , timer(strand) {}

    // The timer is only touched on its strand; callers run on channel completions and the manager strand.
    void arm(std::chrono::milliseconds timeout) {
        asio::dispatch(strand, [self = shared_from_this(), timeout] {
            self->timer.expires_after(timeout);
            self->timer.async_wait([weak = std::weak_ptr<Exchange>(self)](const asio::error_code& ec) {
                auto self = weak.lock();
                if (!self || ec == asio::error::operation_aborted)
                    return;
                self->timed_out = true;
                self->channel->close();
            });
        });
    }

    void disarm() {
        asio::dispatch(strand, [self = shared_from_this()] { self->timer.cancel(); });
    }

    void send(const json& message, SendDone done) {
        channel->async_send(wire::encode_message(message),
            [self = shared_from_this(), done = std::move(done)](std::error_code ec) {
                done(self->map(ec));
            });
    }

    void receive(ReceiveDone done) {
        channel->async_receive([self = shared_from_this(), done = std::move(done)](std::error_code ec, Bytes frame) {
            if (ec) {
                done(self->map(ec), {});
                return;
            }
            auto message = wire::decode_message(frame);
            if (!message) {
                done(errc::protocol_error, {});
                return;
            }
            done({}, std::move(*message));
        });
    }

    std::error_code map(std::error_code ec) const {
        if (ec && timed_out)
            return errc::timed_out;
        return ec;
    }

    std::shared_ptr<Channel> channel;
    asio::strand<asio::io_context::executor_type> strand;
    asio::steady_timer timer;
    std::atomic<bool> timed_out{false};
    std::unique_ptr<HandshakeInitiator> initiator;
    std::unique_ptr<HandshakeResponder> responder;
};

ConnectionManager::ConnectionManager(asio::io_context& io,
                                     const NetworkingConfig& networking,
                                     const SecurityConfig& security,
                                     const Identity& identity,
                                     TrustManager& trust,
                                     PeerRegistry& registry)
    : io_(io)
    , strand_(asio::make_strand(io))
    , networking_(networking)
    , security_(security)
    , identity_(identity)
    , trust_(trust)
    , registry_(registry)
    , grace_timer_(strand_) {}

void ConnectionManager::add_transport(std::shared_ptr<TransportAdapter> adapter) {
    auto kind = adapter->kind();
    adapters_[kind] = std::move(adapter);
}

void ConnectionManager::on_session_established(SessionObserver observer) {
    established_observers_.push_back(std::move(observer));
}

void ConnectionManager::on_session_closing(SessionObserver observer) {
    closing_observers_.push_back(std::move(observer));
}

void ConnectionManager::on_session_closed(CloseObserver observer) {
    closed_observers_.push_back(std::move(observer));
}

void ConnectionManager::start() {
    for (auto kind : transport_priority()) {
        if (!networking_.transport_enabled(kind))
            continue;
        auto it = adapters_.find(kind);
        if (it == adapters_.end()) {
            spdlog::info("Connection: {} enabled but no adapter is available, skipping", to_string(kind));
            continue;
        }
        auto ec = it->second->listen([this](std::shared_ptr<Channel> channel) {
            asio::post(strand_, [this, channel] { handle_inbound(channel); });
        });
        if (ec)
            spdlog::warn("Connection: cannot listen on {}: {}", to_string(kind), ec.message());
    }
}

// ── State ───────────────────────────────────────────────────────────────────

ConnectionManager::PeerSlot& ConnectionManager::slot(const PeerId& peer) {
    auto it = slots_.find(peer);
    if (it == slots_.end())
        it = slots_.emplace(peer, std::make_unique<PeerSlot>(strand_)).first;
    return *it->second;
}

bool ConnectionManager::apply(const PeerId& peer, PeerSlot& s, ConnectionEvent event) {
    auto next = transition(s.state, event);
    if (!next) {
        spdlog::error("Connection: illegal event {} in state {} for {}", to_string(event), to_string(s.state),
                      short_id(peer));
        return false;
    }
    spdlog::debug("Connection: {} {} -> {} ({})", short_id(peer), to_string(s.state), to_string(*next),
                  to_string(event));
    s.state = *next;
    publish(peer, s);
    return true;
}

void ConnectionManager::publish(const PeerId& peer, const PeerSlot& s) {
    std::lock_guard<std::mutex> lock(view_mutex_);
    view_states_[peer] = s.state;
    if (s.session)
        view_sessions_[peer] = s.session;
    else
        view_sessions_.erase(peer);
}

std::shared_ptr<Session> ConnectionManager::session(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(view_mutex_);
    auto it = view_sessions_.find(peer);
    return it == view_sessions_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Session>> ConnectionManager::sessions() const {
    std::lock_guard<std::mutex> lock(view_mutex_);
    std::vector<std::shared_ptr<Session>> out;
    for (const auto& entry : view_sessions_)
        out.push_back(entry.second);
    return out;
}

ConnectionState ConnectionManager::state(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(view_mutex_);
    auto it = view_states_.find(peer);
    return it == view_states_.end() ? ConnectionState::discovered : it->second;
}

std::map<PeerId, ConnectionState> ConnectionManager::states() const {
    std::lock_guard<std::mutex> lock(view_mutex_);
    return view_states_;
}

std::vector<TransportKind> ConnectionManager::usable_transports() const {
    std::vector<TransportKind> out;
    for (auto kind : transport_priority()) {
        if (networking_.transport_enabled(kind) && adapters_.count(kind))
            out.push_back(kind);
    }
    return out;
}

uint16_t ConnectionManager::tcp_port() const {
    auto it = adapters_.find(TransportKind::tcp);
    if (it == adapters_.end() || !networking_.enable_tcp)
        return 0;
    return it->second->port();
}

std::vector<std::string> ConnectionManager::advertised_addresses() const {
    std::vector<std::string> out;
    for (auto kind : usable_transports()) {
        auto address = adapters_.at(kind)->advertised_address();
        if (!address.empty())
            out.push_back(address);
    }
    return out;
}

// ── Outbound ────────────────────────────────────────────────────────────────

void ConnectionManager::async_connect(const PeerId& peer, ConnectHandler handler) {
    asio::post(strand_, [this, peer, handler = std::move(handler)]() mutable {
        if (shutting_down_) {
            asio::post(io_, [handler = std::move(handler)] { handler(errc::cancelled, nullptr); });
            return;
        }

        auto& s = slot(peer);
        if (s.state == ConnectionState::established && s.session) {
            asio::post(io_, [handler = std::move(handler), session = s.session] { handler({}, session); });
            return;
        }
        if (is_attempting(s.state) || s.state == ConnectionState::closing) {
            spdlog::debug("Connection: joining attempt in progress for {}", short_id(peer));
            s.waiters.push_back(std::move(handler));
            return;
        }

        auto record = registry_.find(peer);
        if (!record) {
            asio::post(io_, [handler = std::move(handler)] { handler(errc::peer_not_found, nullptr); });
            return;
        }
        s.waiters.push_back(std::move(handler));
        apply(peer, s, ConnectionEvent::connect_requested);
        begin_attempt(peer, *record);
    });
}

void ConnectionManager::begin_attempt(const PeerId& peer, const PeerRecord& record) {
    auto& s = slot(peer);
    const uint64_t attempt = ++s.attempt;

    if (trust_.evaluate(peer) == TrustDecision::require_manual_approval) {
        apply(peer, s, ConnectionEvent::approval_required);
        registry_.set_trust(peer, TrustState::pending);
    }

    trust_.async_authorize(record, [this, peer, attempt, record](std::error_code ec) {
        asio::post(strand_, [this, peer, attempt, record, ec] { on_authorized(peer, attempt, record, ec); });
    });
}

void ConnectionManager::on_authorized(const PeerId& peer, uint64_t attempt, const PeerRecord& record,
                                      std::error_code ec) {
    auto& s = slot(peer);
    registry_.set_trust(peer, trust_.trust_state(peer));
    if (s.attempt != attempt || !is_attempting(s.state))
        return;

    if (ec) {
        fail_attempt(peer, ec, ec == errc::cancelled ? ConnectionEvent::cancelled : ConnectionEvent::trust_denied);
        return;
    }
    apply(peer, s, s.state == ConnectionState::approving ? ConnectionEvent::approval_granted
                                                         : ConnectionEvent::trust_allowed);

    auto list = std::make_shared<std::vector<Candidate>>(candidates(record));
    if (list->empty()) {
        spdlog::warn("Connection: no usable transport reaches {}", short_id(peer));
        fail_attempt(peer, errc::transport_unavailable, ConnectionEvent::connect_failed);
        return;
    }
    try_candidate(peer, attempt, list, 0, false);
}

std::vector<ConnectionManager::Candidate> ConnectionManager::candidates(const PeerRecord& record) const {
    std::vector<Candidate> out;
    for (auto kind : usable_transports()) {
        const auto& adapter = adapters_.at(kind);
        for (const auto& address : record.addresses) {
            auto parts = split_address(address);
            if (parts && parts->first == to_string(kind))
                out.push_back(Candidate{adapter, address});
        }
    }
    return out;
}

void ConnectionManager::try_candidate(const PeerId& peer, uint64_t attempt,
                                      std::shared_ptr<std::vector<Candidate>> list,
                                      std::size_t index, bool retried) {
    auto& s = slot(peer);
    if (s.attempt != attempt || !is_attempting(s.state))
        return;
    if (index >= list->size()) {
        spdlog::warn("Connection: every transport to {} failed", short_id(peer));
        fail_attempt(peer, errc::connection_failed, ConnectionEvent::connect_failed);
        return;
    }

    const auto& candidate = (*list)[index];
    spdlog::debug("Connection: dialing {} at {}{}", short_id(peer), candidate.address, retried ? " (retry)" : "");
    candidate.adapter->async_connect(candidate.address, networking_.connection_timeout,
        [this, peer, attempt, list, index, retried](std::error_code ec, std::shared_ptr<Channel> channel) {
            asio::post(strand_, [this, peer, attempt, list, index, retried, ec, channel] {
                auto& s = slot(peer);
                if (s.attempt != attempt || !is_attempting(s.state)) {
                    if (channel)
                        channel->close();
                    return;
                }
                if (ec) {
                    const auto& address = (*list)[index].address;
                    if (!retried && is_transient(ec)) {
                        spdlog::info("Connection: {} failed ({}), retrying once", address, ec.message());
                        try_candidate(peer, attempt, list, index, true);
                    } else {
                        spdlog::warn("Connection: {} failed ({}), falling back", address, ec.message());
                        try_candidate(peer, attempt, list, index + 1, false);
                    }
                    return;
                }
                s.channel = channel;
                run_initiator(peer, attempt, list, index, retried, channel);
            });
        });
}

void ConnectionManager::run_initiator(const PeerId& peer, uint64_t attempt,
                                      std::shared_ptr<std::vector<Candidate>> list,
                                      std::size_t index, bool retried, std::shared_ptr<Channel> channel) {
    auto ex = std::make_shared<Exchange>(io_, channel);
    ex->initiator = std::make_unique<HandshakeInitiator>(identity_, handshake_options(security_), peer);
    exchanges_.insert(ex);
    ex->arm(networking_.connection_timeout);

    auto finish = [this, ex, peer, attempt, list, index, retried](std::error_code ec, bool duplicate) {
        ex->disarm();
        asio::post(strand_, [this, ex, peer, attempt, list, index, retried, ec, duplicate] {
            exchanges_.erase(ex);
            auto& s = slot(peer);
            s.channel.reset();
            if (s.attempt != attempt || !is_attempting(s.state)) {
                ex->channel->close();
                return;
            }
            if (duplicate) {
                ex->channel->close();
                spdlog::debug("Connection: {} is dialing us too, waiting for its connection", short_id(peer));
                await_inbound(peer, attempt);
                return;
            }
            if (!ec) {
                establish(peer, ex->channel, ex->initiator->result(), true);
                return;
            }

            ex->channel->close();
            if (ec == errc::trust_denied || ec == errc::approval_timeout) {
                spdlog::info("Connection: {} refused us: {}", short_id(peer), ec.message());
                fail_attempt(peer, ec, ConnectionEvent::trust_denied);
            } else if (ec == errc::handshake_failed || ec == errc::protocol_error) {
                spdlog::warn("Connection: handshake with {} failed: {}", short_id(peer), ec.message());
                fail_attempt(peer, errc::handshake_failed, ConnectionEvent::handshake_failed);
            } else if (!retried && is_transient(ec)) {
                spdlog::info("Connection: handshake with {} interrupted ({}), retrying once", short_id(peer),
                             ec.message());
                try_candidate(peer, attempt, list, index, true);
            } else {
                spdlog::warn("Connection: handshake with {} over {} failed ({}), falling back", short_id(peer),
                             (*list)[index].address, ec.message());
                try_candidate(peer, attempt, list, index + 1, false);
            }
        });
    };

    const auto verdict_window = networking_.connection_timeout + security_.approval_timeout;
    ex->send(ex->initiator->hello(), [ex, finish, verdict_window](std::error_code ec) {
        if (ec)
            return finish(ec, false);
        ex->receive([ex, finish, verdict_window](std::error_code ec, json ack) {
            if (ec)
                return finish(ec, false);
            json fin;
            ec = ex->initiator->on_hello_ack(ack, fin);
            if (ec)
                return finish(ec, false);
            ex->send(fin, [ex, finish, verdict_window](std::error_code ec) {
                if (ec)
                    return finish(ec, false);
                // The responder may be waiting on a manual approval.
                ex->arm(verdict_window);
                ex->receive([ex, finish](std::error_code ec, json verdict) {
                    if (ec)
                        return finish(ec, false);
                    if (HandshakeInitiator::is_duplicate(verdict))
                        return finish({}, true);
                    finish(ex->initiator->on_verdict(verdict), false);
                });
            });
        });
    });
}

void ConnectionManager::await_inbound(const PeerId& peer, uint64_t attempt) {
    auto& s = slot(peer);
    s.inbound_wait.expires_after(networking_.connection_timeout);
    s.inbound_wait.async_wait([this, peer, attempt](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted)
            return;
        auto& s = slot(peer);
        if (s.attempt != attempt || !is_attempting(s.state))
            return;
        spdlog::warn("Connection: {} never completed its own connection", short_id(peer));
        fail_attempt(peer, errc::connection_failed, ConnectionEvent::connect_failed);
    });
}

void ConnectionManager::fail_attempt(const PeerId& peer, std::error_code ec, ConnectionEvent event) {
    auto& s = slot(peer);
    s.inbound_wait.cancel();
    if (s.channel) {
        s.channel->close();
        s.channel.reset();
    }
    apply(peer, s, event);
    spdlog::info("Connection: attempt for {} ended in {}: {}", short_id(peer), to_string(s.state), ec.message());
    complete_waiters(s, ec, nullptr);
}

void ConnectionManager::complete_waiters(PeerSlot& s, std::error_code ec, std::shared_ptr<Session> session) {
    auto waiters = std::move(s.waiters);
    s.waiters.clear();
    for (auto& waiter : waiters)
        asio::post(io_, [waiter = std::move(waiter), ec, session] { waiter(ec, session); });
}

void ConnectionManager::cancel(const PeerId& peer) {
    asio::post(strand_, [this, peer] {
        auto& s = slot(peer);
        if (!is_attempting(s.state))
            return;
        ++s.attempt;
        fail_attempt(peer, errc::cancelled, ConnectionEvent::cancelled);
    });
}

// ── Inbound ─────────────────────────────────────────────────────────────────

void ConnectionManager::handle_inbound(std::shared_ptr<Channel> channel) {
    if (shutting_down_) {
        channel->close();
        return;
    }

    auto ex = std::make_shared<Exchange>(io_, channel);
    ex->responder = std::make_unique<HandshakeResponder>(identity_, handshake_options(security_));
    exchanges_.insert(ex);
    ex->arm(networking_.connection_timeout);

    auto abandon = [this, ex](std::error_code ec, bool tell_peer) {
        ex->disarm();
        spdlog::info("Connection: inbound handshake from {} failed: {}", ex->channel->remote_address(), ec.message());
        auto drop = [this, ex] {
            ex->channel->close();
            asio::post(strand_, [this, ex] { exchanges_.erase(ex); });
        };
        if (tell_peer)
            ex->send(HandshakeResponder::verdict(errc::handshake_failed), [drop](std::error_code) { drop(); });
        else
            drop();
    };

    ex->receive([this, ex, abandon](std::error_code ec, json hello) {
        if (ec)
            return abandon(ec, false);
        json ack;
        ec = ex->responder->on_hello(hello, ack);
        if (ec)
            return abandon(ec, true);
        ex->send(ack, [this, ex, abandon](std::error_code ec) {
            if (ec)
                return abandon(ec, false);
            ex->receive([this, ex, abandon](std::error_code ec, json fin) {
                if (ec)
                    return abandon(ec, false);
                ec = ex->responder->on_finish(fin);
                if (ec)
                    return abandon(ec, true);
                ex->disarm();
                asio::post(strand_, [this, ex] { on_inbound_verified(ex, ex->responder->result()); });
            });
        });
    });
}

void ConnectionManager::on_inbound_verified(std::shared_ptr<Exchange> ex, HandshakeResult result) {
    const PeerId peer = result.peer_id;

    auto reply = [this, ex](json verdict, std::function<void(std::error_code)> then) {
        ex->send(verdict, [this, ex, then = std::move(then)](std::error_code ec) {
            asio::post(strand_, [this, ex, then, ec] {
                exchanges_.erase(ex);
                then(ec);
            });
        });
    };
    auto refuse = [reply, ex](json verdict) {
        reply(std::move(verdict), [ex](std::error_code) { ex->channel->close(); });
    };

    if (shutting_down_) {
        refuse(HandshakeResponder::verdict(errc::cancelled));
        return;
    }
    if (peer == identity_.peer_id()) {
        spdlog::warn("Connection: refusing a connection from ourselves");
        refuse(HandshakeResponder::verdict(errc::handshake_failed));
        return;
    }

    auto& s = slot(peer);
    if (s.state == ConnectionState::closing) {
        refuse(HandshakeResponder::verdict(errc::cancelled));
        return;
    }
    const bool resolving = is_attempting(s.state);
    if (resolving && identity_.peer_id() < peer) {
        // Both sides are dialing; the side with the lower id keeps its own connection.
        spdlog::debug("Connection: {} dialed us while we dial it, keeping ours", short_id(peer));
        refuse(HandshakeResponder::duplicate_verdict());
        return;
    }

    PeerRecord record;
    if (auto known = registry_.find(peer)) {
        record = *known;
    } else {
        record.id = peer;
        record.name = result.name;
        record.user_name = result.user_name;
    }

    uint64_t attempt = s.attempt;
    if (is_terminal(s.state)) {
        apply(peer, s, ConnectionEvent::connect_requested);
        attempt = ++s.attempt;
        if (trust_.evaluate(peer) == TrustDecision::require_manual_approval) {
            apply(peer, s, ConnectionEvent::approval_required);
            registry_.set_trust(peer, TrustState::pending);
        }
    }
    const bool owns_attempt = !resolving && s.state != ConnectionState::established;

    trust_.async_authorize(record, [this, ex, peer, attempt, owns_attempt, result, reply, refuse](std::error_code ec) {
        asio::post(strand_, [this, ex, peer, attempt, owns_attempt, result, reply, refuse, ec] {
            auto& s = slot(peer);
            registry_.set_trust(peer, trust_.trust_state(peer));
            const bool current = !owns_attempt || (s.attempt == attempt && is_attempting(s.state));

            if (ec || !current || shutting_down_) {
                auto reason = ec ? ec : make_error_code(errc::cancelled);
                spdlog::info("Connection: refusing inbound {}: {}", short_id(peer), reason.message());
                refuse(HandshakeResponder::verdict(reason));
                if (owns_attempt && current)
                    fail_attempt(peer, reason,
                                 reason == errc::cancelled ? ConnectionEvent::cancelled : ConnectionEvent::trust_denied);
                return;
            }

            if (owns_attempt)
                apply(peer, s, s.state == ConnectionState::approving ? ConnectionEvent::approval_granted
                                                                     : ConnectionEvent::trust_allowed);

            reply(HandshakeResponder::verdict({}), [this, ex, peer, attempt, owns_attempt, result](std::error_code ec) {
                auto& s = slot(peer);
                if (ec) {
                    ex->channel->close();
                    if (owns_attempt && s.attempt == attempt && is_attempting(s.state))
                        fail_attempt(peer, errc::connection_failed, ConnectionEvent::connect_failed);
                    return;
                }
                establish(peer, ex->channel, result, false);
            });
        });
    });
}

// ── Sessions ────────────────────────────────────────────────────────────────

void ConnectionManager::establish(const PeerId& peer, std::shared_ptr<Channel> channel, HandshakeResult result,
                                  bool initiator) {
    auto& s = slot(peer);
    std::shared_ptr<Session> replaced;

    if (shutting_down_) {
        channel->close();
        return;
    }
    if (s.state == ConnectionState::established) {
        replaced = s.session;
    } else if (s.state == ConnectionState::handshaking) {
        apply(peer, s, initiator ? ConnectionEvent::handshake_succeeded : ConnectionEvent::inbound_accepted);
    } else if (is_attempting(s.state)) {
        apply(peer, s, ConnectionEvent::inbound_accepted);
    } else {
        channel->close();
        return;
    }

    ++s.attempt;
    s.inbound_wait.cancel();
    if (s.channel && s.channel != channel) {
        s.channel->close();
        s.channel.reset();
    }

    auto session = std::make_shared<Session>(io_, channel, std::move(result), initiator, networking_);
    s.session = session;
    live_.insert(session);
    publish(peer, s);

    if (replaced) {
        spdlog::info("Connection: new session from {} replaces {}", short_id(peer), replaced->id());
        replaced->abort(errc::session_lost);
    }

    session->set_close_handler([this, peer, session](std::error_code reason) {
        asio::post(strand_, [this, peer, session, reason] { on_session_ended(peer, session, reason); });
    });
    for (const auto& observer : established_observers_)
        observer(session);
    session->start();

    const auto& info = session->info();
    spdlog::info("Connection: established {} with {} ({}) over {}, {}", info.id, short_id(peer), info.peer_name,
                 to_string(info.transport), to_string(info.security));
    complete_waiters(s, {}, session);
}

void ConnectionManager::on_session_ended(const PeerId& peer, std::shared_ptr<Session> session, std::error_code reason) {
    live_.erase(session);
    for (const auto& observer : closed_observers_)
        observer(session, reason);

    auto& s = slot(peer);
    if (s.session == session) {
        s.session.reset();
        if (s.state == ConnectionState::established)
            apply(peer, s, reason ? ConnectionEvent::session_lost : ConnectionEvent::close_requested);
        if (s.state == ConnectionState::closing)
            apply(peer, s, ConnectionEvent::closed);
        spdlog::info("Connection: session {} with {} ended{}{}", session->id(), short_id(peer),
                     reason ? ": " : "", reason ? reason.message() : "");

        if (!s.waiters.empty()) {
            auto record = registry_.find(peer);
            if (shutting_down_ || !record) {
                complete_waiters(s, shutting_down_ ? make_error_code(errc::cancelled)
                                                   : make_error_code(errc::peer_not_found), nullptr);
            } else {
                apply(peer, s, ConnectionEvent::connect_requested);
                begin_attempt(peer, *record);
            }
        }
    }
    maybe_finish_shutdown();
}

void ConnectionManager::close(const PeerId& peer) {
    asio::post(strand_, [this, peer] {
        auto& s = slot(peer);
        if (s.state != ConnectionState::established || !s.session)
            return;
        apply(peer, s, ConnectionEvent::close_requested);
        for (const auto& observer : closing_observers_)
            observer(s.session);
        s.session->close();
    });
}

void ConnectionManager::shutdown(std::chrono::milliseconds grace, std::function<void()> done) {
    asio::post(strand_, [this, grace, done = std::move(done)]() mutable {
        shutting_down_ = true;
        shutdown_done_ = std::move(done);

        for (const auto& entry : adapters_)
            entry.second->close();
        trust_.cancel_pending();

        for (auto& entry : slots_) {
            auto& s = *entry.second;
            if (is_attempting(s.state)) {
                ++s.attempt;
                fail_attempt(entry.first, errc::cancelled, ConnectionEvent::cancelled);
            }
            s.inbound_wait.cancel();
        }
        for (const auto& ex : exchanges_) {
            ex->disarm();
            ex->channel->close();
        }

        for (auto& entry : slots_) {
            auto& s = *entry.second;
            if (s.state != ConnectionState::established || !s.session)
                continue;
            apply(entry.first, s, ConnectionEvent::close_requested);
            for (const auto& observer : closing_observers_)
                observer(s.session);
            s.session->close();
        }

        if (!live_.empty()) {
            spdlog::info("Connection: closing {} session(s)", live_.size());
            grace_timer_.expires_after(grace);
            grace_timer_.async_wait([this](const asio::error_code& ec) {
                if (ec == asio::error::operation_aborted || live_.empty())
                    return;
                spdlog::warn("Connection: {} session(s) did not close in time, forcing", live_.size());
                for (const auto& session : live_)
                    session->abort(errc::cancelled);
            });
        }
        maybe_finish_shutdown();
    });
}

void ConnectionManager::maybe_finish_shutdown() {
    if (!shutting_down_ || !live_.empty() || !shutdown_done_)
        return;
    grace_timer_.cancel();
    auto done = std::move(shutdown_done_);
    shutdown_done_ = nullptr;
    asio::post(io_, std::move(done));
}

} // namespace kizuna
