#pragma once

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "config/engine_config.h"
#include "connection/connection_manager.h"
#include "discovery/discovery_manager.h"
#include "discovery/peer_registry.h"
#include "security/identity.h"
#include "security/trust_manager.h"
#include "security/trust_store.h"
#include "stream/stream_engine.h"
#include "transfer/transfer_engine.h"

namespace kizuna {

enum class EngineEventType {
    peer_discovered,
    session_established,
    session_closed,
    transfer_progress,
    transfer_completed,
    transfer_failed,
    incoming_transfer,
    stream_started,
    stream_stopped,
    stream_quality_changed,
};

const char* to_string(EngineEventType type);

struct EngineEvent {
    EngineEventType type = EngineEventType::peer_discovered;
    PeerId peer_id;
    std::optional<PeerRecord> peer;
    std::optional<SessionInfo> session;
    std::optional<TransferStatus> transfer;
    std::optional<StreamStatus> stream;
    std::error_code error;
};

/**
 * One engine instance: identity, trust, discovery, connections, transfers
 * and streams with a shared lifecycle.
 *
 * Several instances can live in one process. Adapters, the approval
 * handler and the event handler must be set before init(). Blocking
 * operations must not be called from engine callbacks.
 */
class Engine {
public:
    using EventHandler = std::function<void(const EngineEvent&)>;
    using DiscoveryFactory = std::function<std::shared_ptr<DiscoveryAdapter>(asio::io_context&)>;
    using TransportFactory = std::function<std::shared_ptr<TransportAdapter>(asio::io_context&)>;
    using DiscoverHandler = DiscoveryManager::DiscoverHandler;
    using ConnectHandler = ConnectionManager::ConnectHandler;

    explicit Engine(EngineConfig config = {});
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    void add_discovery_adapter(DiscoveryFactory factory);
    void add_transport(TransportFactory factory);
    void set_approval_handler(TrustManager::ApprovalHandler handler);
    /// Runs on engine threads; must not block.
    void set_event_handler(EventHandler handler);
    void set_frame_sink(StreamEngine::FrameSink sink);
    void set_frame_source_factory(StreamEngine::SourceFactory factory);

    std::error_code init();
    [[nodiscard]] bool initialized() const { return running_.load(); }

    // Asynchronous forms; handlers run on engine threads.
    void async_discover_peers(std::chrono::milliseconds timeout, std::chrono::milliseconds interval,
                              DiscoverHandler handler);
    void async_connect_to_peer(const PeerId& peer, ConnectHandler handler);

    // Blocking forms.
    std::vector<PeerRecord> discover_peers(std::error_code& ec);
    std::vector<PeerRecord> discover_peers(std::chrono::milliseconds timeout, std::chrono::milliseconds interval,
                                           std::error_code& ec);
    std::shared_ptr<Session> connect_to_peer(const PeerId& peer, std::error_code& ec);
    void disconnect_peer(const PeerId& peer, std::error_code& ec);
    void cancel_connect(const PeerId& peer, std::error_code& ec);

    TransferId transfer_file(const std::string& path, const PeerId& peer, std::error_code& ec);
    void cancel_transfer(const TransferId& id, std::error_code& ec);
    void resume_transfer(const TransferId& id, std::error_code& ec);
    std::optional<TransferStatus> transfer_status(const TransferId& id) const;
    std::vector<TransferStatus> transfers() const;

    StreamId start_stream(const std::string& kind, const PeerId& peer, int quality, std::error_code& ec);
    StreamId start_stream(StreamKind kind, const PeerId& peer, int quality, std::error_code& ec);
    void stop_stream(const StreamId& id, std::error_code& ec);
    std::optional<StreamStatus> stream_status(const StreamId& id) const;
    std::vector<StreamStatus> streams() const;

    std::vector<PeerRecord> peers() const;
    std::optional<PeerRecord> find_peer(const PeerId& peer) const;
    ConnectionState connection_state(const PeerId& peer) const;
    std::shared_ptr<Session> session(const PeerId& peer) const;

    PeerId local_peer_id() const;
    /// TCP port peers reach this engine on, 0 without a TCP listener.
    uint16_t listen_port() const;

    void trust_peer(const PeerId& peer, const std::string& nickname, std::error_code& ec);
    void block_peer(const PeerId& peer, std::error_code& ec);
    void unblock_peer(const PeerId& peer, std::error_code& ec);
    void forget_peer(const PeerId& peer, std::error_code& ec);
    std::vector<TrustEntry> trusted_peers() const;

    /**
     * Cancel discovery, stop streams, cancel transfers, close sessions
     * (gracefully, then forced) and join the engine threads. Idempotent.
     */
    void shutdown();

    [[nodiscard]] const EngineConfig& config() const { return config_; }

private:
    void emit(EngineEvent event) const;
    void wire_components();
    Beacon local_beacon() const;
    void teardown();

    EngineConfig config_;
    std::vector<DiscoveryFactory> discovery_factories_;
    std::vector<TransportFactory> transport_factories_;
    TrustManager::ApprovalHandler approval_handler_;
    EventHandler event_handler_;
    StreamEngine::FrameSink frame_sink_;
    StreamEngine::SourceFactory source_factory_;

    std::mutex lifecycle_mutex_;               // serializes init and shutdown
    mutable std::shared_mutex components_mutex_; // guards the component pointers below
    std::atomic<bool> running_{false};

    std::unique_ptr<asio::io_context> io_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
    std::vector<std::thread> threads_;

    std::unique_ptr<Identity> identity_;
    std::unique_ptr<TrustStore> trust_store_;
    std::unique_ptr<TrustManager> trust_;
    std::unique_ptr<PeerRegistry> registry_;
    std::unique_ptr<DiscoveryManager> discovery_;
    std::unique_ptr<ConnectionManager> connections_;
    std::unique_ptr<TransferEngine> transfers_;
    std::unique_ptr<StreamEngine> streams_;
};

} // namespace kizuna
