#pragma once

#include <asio.hpp>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include "config/engine_config.h"
#include "connection/connection_state.h"
#include "connection/session.h"
#include "discovery/peer_registry.h"
#include "network/transport.h"
#include "security/identity.h"
#include "security/trust_manager.h"

namespace kizuna {

/**
 * Takes peers from discovered to an established session.
 *
 * Owns every session and the per-peer state machine. All state lives on one
 * strand; callers read snapshots through state() and session().
 *
 * Outbound: trust check (and manual approval), then transports in priority
 * order, each with one retry on a transient failure, then the handshake.
 * Inbound: handshake first, then the same trust check before the verdict.
 */
class ConnectionManager {
public:
    using ConnectHandler = std::function<void(std::error_code, std::shared_ptr<Session>)>;
    using SessionObserver = std::function<void(const std::shared_ptr<Session>&)>;
    using CloseObserver = std::function<void(const std::shared_ptr<Session>&, std::error_code)>;

    ConnectionManager(asio::io_context& io,
                      const NetworkingConfig& networking,
                      const SecurityConfig& security,
                      const Identity& identity,
                      TrustManager& trust,
                      PeerRegistry& registry);

    void add_transport(std::shared_ptr<TransportAdapter> adapter);

    /// Runs on the manager strand before the session starts reading.
    void on_session_established(SessionObserver observer);
    /// Runs before a local close tears the session down; handles can still send.
    void on_session_closing(SessionObserver observer);
    /// Runs after a session ended, for whatever reason.
    void on_session_closed(CloseObserver observer);

    /// Start listening on every enabled transport.
    void start();

    /// Coalesced: concurrent calls for one peer share a single attempt.
    void async_connect(const PeerId& peer, ConnectHandler handler);

    /// Abort an attempt in progress; waiters complete with errc::cancelled.
    void cancel(const PeerId& peer);

    /// Gracefully close the established session, if any.
    void close(const PeerId& peer);

    std::shared_ptr<Session> session(const PeerId& peer) const;
    std::vector<std::shared_ptr<Session>> sessions() const;
    ConnectionState state(const PeerId& peer) const;
    std::map<PeerId, ConnectionState> states() const;

    /// Transport kinds that are enabled and have an adapter, in priority order.
    std::vector<TransportKind> usable_transports() const;
    /// Listening TCP port, 0 without a TCP listener.
    uint16_t tcp_port() const;
    /// Advertised addresses of non-IP transports.
    std::vector<std::string> advertised_addresses() const;

    /**
     * Cancel every attempt and close every session: gracefully first, forced
     * after `grace`. `done` runs once nothing is left.
     */
    void shutdown(std::chrono::milliseconds grace, std::function<void()> done);

private:
    struct Candidate {
        std::shared_ptr<TransportAdapter> adapter;
        std::string address;
    };

    struct PeerSlot {
        explicit PeerSlot(asio::strand<asio::io_context::executor_type>& strand) : inbound_wait(strand) {}
        ConnectionState state = ConnectionState::discovered;
        std::vector<ConnectHandler> waiters;
        std::shared_ptr<Session> session;
        uint64_t attempt = 0;
        std::shared_ptr<Channel> channel;
        asio::steady_timer inbound_wait;
    };

    class Exchange;

    PeerSlot& slot(const PeerId& peer);
    bool apply(const PeerId& peer, PeerSlot& slot, ConnectionEvent event);
    void publish(const PeerId& peer, const PeerSlot& slot);

    void begin_attempt(const PeerId& peer, const PeerRecord& record);
    void on_authorized(const PeerId& peer, uint64_t attempt, const PeerRecord& record, std::error_code ec);
    std::vector<Candidate> candidates(const PeerRecord& record) const;
    void try_candidate(const PeerId& peer, uint64_t attempt, std::shared_ptr<std::vector<Candidate>> list,
                       std::size_t index, bool retried);
    void run_initiator(const PeerId& peer, uint64_t attempt, std::shared_ptr<std::vector<Candidate>> list,
                       std::size_t index, bool retried, std::shared_ptr<Channel> channel);
    void fail_attempt(const PeerId& peer, std::error_code ec, ConnectionEvent event);
    void await_inbound(const PeerId& peer, uint64_t attempt);

    void handle_inbound(std::shared_ptr<Channel> channel);
    void on_inbound_verified(std::shared_ptr<Exchange> exchange, HandshakeResult result);

    void establish(const PeerId& peer, std::shared_ptr<Channel> channel, HandshakeResult result, bool initiator);
    void on_session_ended(const PeerId& peer, std::shared_ptr<Session> session, std::error_code reason);
    void complete_waiters(PeerSlot& slot, std::error_code ec, std::shared_ptr<Session> session);
    void maybe_finish_shutdown();

    asio::io_context& io_;
    asio::strand<asio::io_context::executor_type> strand_;
    NetworkingConfig networking_;
    SecurityConfig security_;
    const Identity& identity_;
    TrustManager& trust_;
    PeerRegistry& registry_;

    std::map<TransportKind, std::shared_ptr<TransportAdapter>> adapters_;
    std::vector<SessionObserver> established_observers_;
    std::vector<SessionObserver> closing_observers_;
    std::vector<CloseObserver> closed_observers_;

    // Strand-only state.
    std::map<PeerId, std::unique_ptr<PeerSlot>> slots_;
    std::set<std::shared_ptr<Session>> live_;
    std::set<std::shared_ptr<Exchange>> exchanges_;
    bool shutting_down_ = false;
    std::function<void()> shutdown_done_;
    asio::steady_timer grace_timer_;

    mutable std::mutex view_mutex_;
    std::map<PeerId, ConnectionState> view_states_;
    std::map<PeerId, std::shared_ptr<Session>> view_sessions_;
};

} // namespace kizuna
