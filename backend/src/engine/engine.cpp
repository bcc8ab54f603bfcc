/**
 * Engine: the public facade.
 *
 * Owns the runtime threads and wires discovery, trust, connections,
 * transfers and streams together. Every operation checks the
 * initialized state first and reports failures as error codes.
 */

#include "engine/engine.h"

#include <algorithm>
#include <future>
#include <thread>

#include <spdlog/spdlog.h>

#include "common/error.h"
#include "common/logging.h"
#include "crypto/crypto_manager.h"
#include "discovery/bluetooth_discovery.h"
#include "discovery/mdns_discovery.h"
#include "discovery/udp_discovery.h"
#include "network/tcp_transport.h"

namespace kizuna {

namespace {

/// Bridges a completion handler to a blocking caller.
template <typename Result>
class Completion {
public:
    Completion() {
        auto promise = std::make_shared<std::promise<Outcome>>();
        future_ = promise->get_future();
        promise_ = std::move(promise);
    }

    std::function<void(std::error_code, Result)> handler() {
        return [promise = std::move(promise_)](std::error_code ec, Result result) {
            promise->set_value(Outcome{ec, std::move(result)});
        };
    }

    Result wait(std::error_code& ec) {
        try {
            auto outcome = future_.get();
            ec = outcome.first;
            return std::move(outcome.second);
        } catch (const std::future_error&) {
            // The handler was destroyed unrun: the engine went away underneath us.
            ec = errc::cancelled;
            return Result{};
        }
    }

private:
    using Outcome = std::pair<std::error_code, Result>;
    std::shared_ptr<std::promise<Outcome>> promise_;
    std::future<Outcome> future_;
};

const std::vector<std::string> kCapabilities = {"file_transfer", "streaming", "camera", "screen", "audio"};

} // namespace

const char* to_string(EngineEventType type) {
    switch (type) {
    case EngineEventType::peer_discovered:        return "peer_discovered";
    case EngineEventType::session_established:    return "session_established";
    case EngineEventType::session_closed:         return "session_closed";
    case EngineEventType::transfer_progress:      return "transfer_progress";
    case EngineEventType::transfer_completed:     return "transfer_completed";
    case EngineEventType::transfer_failed:        return "transfer_failed";
    case EngineEventType::incoming_transfer:      return "incoming_transfer";
    case EngineEventType::stream_started:         return "stream_started";
    case EngineEventType::stream_stopped:         return "stream_stopped";
    case EngineEventType::stream_quality_changed: return "stream_quality_changed";
    }
    return "unknown";
}

Engine::Engine(EngineConfig config)
    : config_(std::move(config)) {}

Engine::~Engine() {
    shutdown();
}

void Engine::add_discovery_adapter(DiscoveryFactory factory) {
    discovery_factories_.push_back(std::move(factory));
}

void Engine::add_transport(TransportFactory factory) {
    transport_factories_.push_back(std::move(factory));
}

void Engine::set_approval_handler(TrustManager::ApprovalHandler handler) {
    approval_handler_ = std::move(handler);
}

void Engine::set_event_handler(EventHandler handler) {
    event_handler_ = std::move(handler);
}

void Engine::set_frame_sink(StreamEngine::FrameSink sink) {
    frame_sink_ = std::move(sink);
}

void Engine::set_frame_source_factory(StreamEngine::SourceFactory factory) {
    source_factory_ = std::move(factory);
}

// ── Lifecycle ───────────────────────────────────────────────────────────────

std::error_code Engine::init() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_)
        return errc::already_initialized;

    configure_logging(config_.logging);
    try {
        config_.validate();
    } catch (const std::system_error& e) {
        spdlog::error("Engine: {}", e.what());
        return e.code();
    }
    if (!CryptoManager::init()) {
        spdlog::error("Engine: libsodium failed to initialise");
        return errc::not_initialized;
    }

    auto store = std::make_unique<TrustStore>(config_.security.trust_store_path);
    if (auto ec = store->load()) {
        spdlog::error("Engine: cannot load trust store {}: {}", store->path(), ec.message());
        return ec;
    }

    std::error_code identity_ec;
    auto identity = Identity::load_or_create(config_.identity.identity_path, config_.identity.device_name,
                                             config_.identity.user_name, identity_ec);
    if (identity_ec) {
        spdlog::error("Engine: cannot load identity {}: {}", config_.identity.identity_path, identity_ec.message());
        return identity_ec;
    }

    {
        std::unique_lock<std::shared_mutex> lock(components_mutex_);
        identity_ = std::move(identity);
        trust_store_ = std::move(store);
        io_ = std::make_unique<asio::io_context>();
        work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_->get_executor());

        trust_ = std::make_unique<TrustManager>(*io_, config_.security, *trust_store_);
        registry_ = std::make_unique<PeerRegistry>(*io_, config_.discovery.peer_expiry);
        discovery_ = std::make_unique<DiscoveryManager>(*io_, config_.discovery, *registry_);
        connections_ = std::make_unique<ConnectionManager>(*io_, config_.networking, config_.security, *identity_,
                                                           *trust_, *registry_);
        transfers_ = std::make_unique<TransferEngine>(*io_, config_.transfer);
        streams_ = std::make_unique<StreamEngine>(*io_, config_.stream);
    }

    const auto& discovery = config_.discovery;
    if (discovery.enable_udp)
        discovery_->add_adapter(std::make_shared<UdpDiscovery>(*io_, discovery.udp_port));
    if (discovery.enable_mdns)
        discovery_->add_adapter(std::make_shared<MdnsDiscovery>(*io_));
    if (discovery.enable_bluetooth)
        discovery_->add_adapter(std::make_shared<BluetoothDiscovery>(*io_));
    for (const auto& factory : discovery_factories_)
        discovery_->add_adapter(factory(*io_));

    const auto& networking = config_.networking;
    if (networking.enable_tcp)
        connections_->add_transport(std::make_shared<TcpTransport>(*io_, networking.listen_port,
                                                                   networking.enable_ipv6));
    for (const auto& factory : transport_factories_)
        connections_->add_transport(factory(*io_));

    wire_components();
    connections_->start();
    discovery_->start(local_beacon());

    const unsigned workers = std::max(1u, config_.runtime.worker_threads);
    for (unsigned i = 0; i < workers; ++i) {
        threads_.emplace_back([io = io_.get()] {
            for (;;) {
                try {
                    io->run();
                    break;
                } catch (const std::exception& e) {
                    spdlog::error("Engine: unhandled exception on worker thread: {}", e.what());
                }
            }
        });
    }

    running_ = true;
    spdlog::info("Engine: {} ({}) ready, trust mode {}, {} worker thread(s)", identity_->peer_id().substr(0, 16),
                 identity_->device_name(), to_string(config_.security.trust_mode), workers);
    return {};
}

void Engine::wire_components() {
    trust_->set_approval_handler(approval_handler_);
    registry_->set_trust_resolver([trust = trust_.get()](const PeerId& peer) { return trust->trust_state(peer); });

    registry_->subscribe([this](const PeerRecord& record) {
        EngineEvent event;
        event.type = EngineEventType::peer_discovered;
        event.peer_id = record.id;
        event.peer = record;
        emit(std::move(event));
    });

    connections_->on_session_established([this](const std::shared_ptr<Session>& session) {
        transfers_->attach(session);
        streams_->attach(session);
        trust_store_->touch(session->peer_id());

        EngineEvent event;
        event.type = EngineEventType::session_established;
        event.peer_id = session->peer_id();
        event.session = session->info();
        emit(std::move(event));
    });

    connections_->on_session_closing([this](const std::shared_ptr<Session>& session) {
        streams_->session_closing(session);
        transfers_->session_closing(session);
    });

    connections_->on_session_closed([this](const std::shared_ptr<Session>& session, std::error_code reason) {
        transfers_->session_closed(session, reason);
        streams_->session_closed(session, reason);

        EngineEvent event;
        event.type = EngineEventType::session_closed;
        event.peer_id = session->peer_id();
        event.session = session->info();
        event.error = reason;
        emit(std::move(event));
    });

    transfers_->set_observer([this](const TransferStatus& status) {
        EngineEvent event;
        event.peer_id = status.peer_id;
        event.transfer = status;
        event.error = status.error;
        switch (status.state) {
        case TransferState::queued:
            if (status.direction == TransferDirection::outgoing)
                return;
            event.type = EngineEventType::incoming_transfer;
            break;
        case TransferState::in_progress:
        case TransferState::interrupted:
            event.type = EngineEventType::transfer_progress;
            break;
        case TransferState::completed:
            event.type = EngineEventType::transfer_completed;
            break;
        case TransferState::failed:
        case TransferState::cancelled:
            event.type = EngineEventType::transfer_failed;
            break;
        }
        emit(std::move(event));
    });

    streams_->set_observer([this](StreamEngine::Change change, const StreamStatus& status) {
        EngineEvent event;
        event.peer_id = status.peer_id;
        event.stream = status;
        event.error = status.error;
        switch (change) {
        case StreamEngine::Change::started: event.type = EngineEventType::stream_started; break;
        case StreamEngine::Change::quality: event.type = EngineEventType::stream_quality_changed; break;
        case StreamEngine::Change::stopped: event.type = EngineEventType::stream_stopped; break;
        }
        emit(std::move(event));
    });
    if (frame_sink_)
        streams_->set_frame_sink(frame_sink_);
    if (source_factory_)
        streams_->set_source_factory(source_factory_);
}

Beacon Engine::local_beacon() const {
    Beacon beacon;
    beacon.type = "announce";
    beacon.id = identity_->peer_id();
    beacon.name = identity_->device_name();
    beacon.user = identity_->user_name();
    beacon.port = connections_->tcp_port();
    beacon.caps = kCapabilities;
    for (auto kind : connections_->usable_transports())
        beacon.transports.push_back(to_string(kind));
    beacon.addrs = connections_->advertised_addresses();
    return beacon;
}

void Engine::shutdown() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
        std::unique_lock<std::shared_mutex> lock(components_mutex_);
        if (!running_)
            return;
        running_ = false;
    }
    spdlog::info("Engine: shutting down");

    auto done = std::make_shared<std::promise<void>>();
    auto finished = done->get_future();
    const auto grace = config_.runtime.shutdown_grace;

    discovery_->stop();
    streams_->shutdown([this, done, grace] {
        transfers_->shutdown([this, done, grace] {
            connections_->shutdown(grace, [done] { done->set_value(); });
        });
    });

    if (finished.wait_for(grace + std::chrono::seconds(5)) != std::future_status::ready)
        spdlog::warn("Engine: cleanup did not finish in time, stopping anyway");
    teardown();
    spdlog::info("Engine: stopped");
}

void Engine::teardown() {
    work_.reset();

    // Let cancelled operations drain, then stop whatever is left.
    const auto deadline = Clock::now() + std::chrono::milliseconds(500);
    while (!io_->stopped() && Clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    if (!io_->stopped())
        spdlog::debug("Engine: stopping io with work outstanding");
    io_->stop();
    for (auto& thread : threads_) {
        if (thread.joinable())
            thread.join();
    }
    threads_.clear();

    std::unique_lock<std::shared_mutex> lock(components_mutex_);
    streams_.reset();
    transfers_.reset();
    connections_.reset();
    discovery_.reset();
    registry_.reset();
    trust_.reset();
    trust_store_.reset();
    io_.reset();
}

void Engine::emit(EngineEvent event) const {
    if (event_handler_)
        event_handler_(event);
}

// ── Discovery and connections ───────────────────────────────────────────────

void Engine::async_discover_peers(std::chrono::milliseconds timeout, std::chrono::milliseconds interval,
                                  DiscoverHandler handler) {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    if (!running_) {
        handler(errc::not_initialized, {});
        return;
    }
    discovery_->async_discover(timeout, interval, std::move(handler));
}

void Engine::async_connect_to_peer(const PeerId& peer, ConnectHandler handler) {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    if (!running_) {
        handler(errc::not_initialized, nullptr);
        return;
    }
    connections_->async_connect(peer, std::move(handler));
}

std::vector<PeerRecord> Engine::discover_peers(std::error_code& ec) {
    return discover_peers(config_.discovery.timeout, config_.discovery.interval, ec);
}

std::vector<PeerRecord> Engine::discover_peers(std::chrono::milliseconds timeout, std::chrono::milliseconds interval,
                                               std::error_code& ec) {
    Completion<std::vector<PeerRecord>> completion;
    async_discover_peers(timeout, interval, completion.handler());
    return completion.wait(ec);
}

std::shared_ptr<Session> Engine::connect_to_peer(const PeerId& peer, std::error_code& ec) {
    Completion<std::shared_ptr<Session>> completion;
    async_connect_to_peer(peer, completion.handler());
    return completion.wait(ec);
}

void Engine::disconnect_peer(const PeerId& peer, std::error_code& ec) {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    if (!running_) {
        ec = errc::not_initialized;
        return;
    }
    if (!connections_->session(peer)) {
        ec = errc::session_required;
        return;
    }
    ec = {};
    connections_->close(peer);
}

void Engine::cancel_connect(const PeerId& peer, std::error_code& ec) {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    if (!running_) {
        ec = errc::not_initialized;
        return;
    }
    ec = {};
    connections_->cancel(peer);
}

std::vector<PeerRecord> Engine::peers() const {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    return registry_ ? registry_->peers() : std::vector<PeerRecord>{};
}

std::optional<PeerRecord> Engine::find_peer(const PeerId& peer) const {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    return registry_ ? registry_->find(peer) : std::nullopt;
}

ConnectionState Engine::connection_state(const PeerId& peer) const {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    return connections_ ? connections_->state(peer) : ConnectionState::discovered;
}

std::shared_ptr<Session> Engine::session(const PeerId& peer) const {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    return connections_ ? connections_->session(peer) : nullptr;
}

PeerId Engine::local_peer_id() const {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    return identity_ ? identity_->peer_id() : PeerId{};
}

uint16_t Engine::listen_port() const {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    return connections_ ? connections_->tcp_port() : 0;
}

// ── Transfers ───────────────────────────────────────────────────────────────

TransferId Engine::transfer_file(const std::string& path, const PeerId& peer, std::error_code& ec) {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    if (!running_) {
        ec = errc::not_initialized;
        return {};
    }
    auto session = connections_->session(peer);
    if (!session) {
        ec = registry_->find(peer) ? errc::session_required : errc::peer_not_found;
        return {};
    }
    return transfers_->start(path, session, ec);
}

void Engine::cancel_transfer(const TransferId& id, std::error_code& ec) {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    if (!running_) {
        ec = errc::not_initialized;
        return;
    }
    transfers_->cancel(id, ec);
}

void Engine::resume_transfer(const TransferId& id, std::error_code& ec) {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    if (!running_) {
        ec = errc::not_initialized;
        return;
    }
    auto status = transfers_->status(id);
    if (!status) {
        ec = errc::transfer_not_found;
        return;
    }
    auto session = connections_->session(status->peer_id);
    if (!session) {
        ec = errc::session_required;
        return;
    }
    transfers_->resume(id, session, ec);
}

std::optional<TransferStatus> Engine::transfer_status(const TransferId& id) const {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    return transfers_ ? transfers_->status(id) : std::nullopt;
}

std::vector<TransferStatus> Engine::transfers() const {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    return transfers_ ? transfers_->transfers() : std::vector<TransferStatus>{};
}

// ── Streams ─────────────────────────────────────────────────────────────────

StreamId Engine::start_stream(const std::string& kind, const PeerId& peer, int quality, std::error_code& ec) {
    auto parsed = stream_kind_from_string(kind);
    if (!parsed) {
        ec = errc::invalid_stream_kind;
        return {};
    }
    return start_stream(*parsed, peer, quality, ec);
}

StreamId Engine::start_stream(StreamKind kind, const PeerId& peer, int quality, std::error_code& ec) {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    if (!running_) {
        ec = errc::not_initialized;
        return {};
    }
    if (!valid_quality(quality)) {
        ec = errc::invalid_quality;
        return {};
    }
    return streams_->start(kind, connections_->session(peer), quality, ec);
}

void Engine::stop_stream(const StreamId& id, std::error_code& ec) {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    if (!running_) {
        ec = errc::not_initialized;
        return;
    }
    streams_->stop(id, ec);
}

std::optional<StreamStatus> Engine::stream_status(const StreamId& id) const {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    return streams_ ? streams_->status(id) : std::nullopt;
}

std::vector<StreamStatus> Engine::streams() const {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    return streams_ ? streams_->streams() : std::vector<StreamStatus>{};
}

// ── Trust store ─────────────────────────────────────────────────────────────

void Engine::trust_peer(const PeerId& peer, const std::string& nickname, std::error_code& ec) {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    if (!running_) {
        ec = errc::not_initialized;
        return;
    }
    ec = {};
    trust_store_->trust(peer, nickname);
    registry_->set_trust(peer, trust_->trust_state(peer));
}

void Engine::block_peer(const PeerId& peer, std::error_code& ec) {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    if (!running_) {
        ec = errc::not_initialized;
        return;
    }
    ec = {};
    trust_store_->block(peer);
    registry_->set_trust(peer, TrustState::blocked);
    connections_->cancel(peer);
    connections_->close(peer);
    spdlog::info("Engine: blocked {}", peer.substr(0, 16));
}

void Engine::unblock_peer(const PeerId& peer, std::error_code& ec) {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    if (!running_) {
        ec = errc::not_initialized;
        return;
    }
    ec = {};
    trust_store_->unblock(peer);
    registry_->set_trust(peer, trust_->trust_state(peer));
}

void Engine::forget_peer(const PeerId& peer, std::error_code& ec) {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    if (!running_) {
        ec = errc::not_initialized;
        return;
    }
    ec = {};
    trust_store_->forget(peer);
    registry_->set_trust(peer, trust_->trust_state(peer));
}

std::vector<TrustEntry> Engine::trusted_peers() const {
    std::shared_lock<std::shared_mutex> lock(components_mutex_);
    return trust_store_ ? trust_store_->entries() : std::vector<TrustEntry>{};
}

} // namespace kizuna
