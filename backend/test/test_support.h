#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>

#include "config/engine_config.h"
#include "crypto/crypto_manager.h"
#include "discovery/discovery_adapter.h"
#include "engine/engine.h"
#include "network/loopback_transport.h"

namespace kizuna::test {

using namespace std::chrono_literals;

inline bool wait_until(const std::function<bool()>& ready, std::chrono::milliseconds timeout = 5s) {
    const auto deadline = Clock::now() + timeout;
    while (Clock::now() < deadline) {
        if (ready())
            return true;
        std::this_thread::sleep_for(10ms);
    }
    return ready();
}

/// Scratch directory removed on destruction.
class TempDir {
public:
    TempDir() {
        CryptoManager::init();
        path_ = std::filesystem::temp_directory_path() / ("kizuna-test-" + random_id(6));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
    std::filesystem::path path_;
};

inline std::string write_file(const std::string& path, std::size_t size) {
    std::ofstream out(path, std::ios::binary);
    for (std::size_t i = 0; i < size; ++i)
        out.put(static_cast<char>((i * 31 + i / 7) & 0xff));
    return path;
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// Beacons of every scripted node in one test.
class Directory {
public:
    void publish(const Beacon& beacon) {
        std::lock_guard<std::mutex> lock(mutex_);
        beacons_[beacon.id] = beacon;
    }

    void withdraw(const PeerId& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        beacons_.erase(id);
    }

    std::vector<Beacon> others(const PeerId& self) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Beacon> out;
        for (const auto& entry : beacons_) {
            if (entry.first != self)
                out.push_back(entry.second);
        }
        return out;
    }

private:
    mutable std::mutex mutex_;
    std::map<PeerId, Beacon> beacons_;
};

/**
 * Discovery medium backed by a Directory, plus optional fixed sightings.
 * A start error makes the adapter unavailable.
 */
class ScriptedDiscovery : public DiscoveryAdapter {
public:
    ScriptedDiscovery(asio::io_context& io, std::shared_ptr<Directory> directory, std::string method = "scripted",
                      std::vector<Sighting> fixed = {}, std::error_code start_error = {})
        : io_(io)
        , directory_(std::move(directory))
        , method_(std::move(method))
        , fixed_(std::move(fixed))
        , start_error_(start_error) {}

    std::string method() const override { return method_; }

    std::error_code start(const Beacon& local) override {
        if (start_error_)
            return start_error_;
        local_ = local;
        if (directory_)
            directory_->publish(local);
        return {};
    }

    void stop() override {
        if (directory_)
            directory_->withdraw(local_.id);
    }

    void async_scan(std::chrono::milliseconds, std::chrono::milliseconds, SightingHandler on_sighting,
                    ScanHandler done) override {
        std::vector<Sighting> sightings = fixed_;
        for (auto& sighting : sightings)
            sighting.method = method_;
        if (directory_) {
            for (const auto& beacon : directory_->others(local_.id))
                sightings.push_back(beacon_to_sighting(beacon, "127.0.0.1", method_));
        }
        asio::post(io_, [sightings = std::move(sightings), on_sighting = std::move(on_sighting),
                         done = std::move(done)]() mutable {
            for (auto& sighting : sightings)
                on_sighting(std::move(sighting));
            done({});
        });
    }

    void cancel() override {}

private:
    asio::io_context& io_;
    std::shared_ptr<Directory> directory_;
    std::string method_;
    std::vector<Sighting> fixed_;
    std::error_code start_error_;
    Beacon local_;
};

/// Config for an engine that only talks through the loopback hub.
inline EngineConfig node_config(const std::string& name, const std::filesystem::path& root) {
    EngineConfig config;
    config.identity.device_name = name;
    config.identity.user_name = name;
    config.discovery.enable_mdns = false;
    config.discovery.enable_udp = false;
    config.discovery.enable_bluetooth = false;
    config.discovery.timeout = 300ms;
    config.discovery.interval = 100ms;
    config.security.trust_mode = TrustMode::open;
    config.security.approval_timeout = 2s;
    config.networking.enable_tcp = false;
    config.networking.enable_quic = false;
    config.networking.connection_timeout = 2s;
    config.transfer.download_dir = (root / name / "downloads").string();
    config.transfer.chunk_size = 4096;
    config.transfer.ack_timeout = 1s;
    config.transfer.retry_backoff = 50ms;
    config.logging.level = "warn";
    config.runtime.worker_threads = 2;
    config.runtime.shutdown_grace = 500ms;
    return config;
}

/// Register scripted discovery and loopback listeners named after `name`.
inline void use_loopback(Engine& engine, const std::shared_ptr<LoopbackHub>& hub,
                         const std::shared_ptr<Directory>& directory, const std::string& name,
                         std::vector<TransportKind> kinds = {TransportKind::websocket}) {
    engine.add_discovery_adapter([directory](asio::io_context& io) {
        return std::make_shared<ScriptedDiscovery>(io, directory);
    });
    for (auto kind : kinds) {
        engine.add_transport([hub, kind, name](asio::io_context& io) {
            return std::make_shared<LoopbackTransport>(io, hub, kind, name);
        });
    }
}

/// Thread-safe record of engine events.
class EventLog {
public:
    void record(const EngineEvent& event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(event);
    }

    Engine::EventHandler handler() {
        return [this](const EngineEvent& event) { record(event); };
    }

    std::vector<EngineEvent> of(EngineEventType type) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<EngineEvent> out;
        for (const auto& event : events_) {
            if (event.type == type)
                out.push_back(event);
        }
        return out;
    }

    std::size_t count(EngineEventType type) const { return of(type).size(); }

private:
    mutable std::mutex mutex_;
    std::vector<EngineEvent> events_;
};

/// Engines in one test sharing a loopback hub, a discovery directory and a scratch directory.
struct Mesh {
    TempDir scratch;
    std::shared_ptr<LoopbackHub> hub = LoopbackHub::create();
    std::shared_ptr<Directory> directory = std::make_shared<Directory>();

    /// Engine wired to the mesh but not yet initialised.
    std::unique_ptr<Engine> node(const std::string& name,
                                 const std::function<void(EngineConfig&)>& adjust = {},
                                 std::vector<TransportKind> kinds = {TransportKind::websocket}) {
        auto config = node_config(name, scratch.path());
        if (adjust)
            adjust(config);
        auto engine = std::make_unique<Engine>(config);
        use_loopback(*engine, hub, directory, name, std::move(kinds));
        return engine;
    }

    std::string address(TransportKind kind, const std::string& name) const {
        return std::string(to_string(kind)) + "://" + name;
    }
};

/// Discover until `peer` is known, then connect to it.
inline std::shared_ptr<Session> discover_and_connect(Engine& engine, const PeerId& peer, std::error_code& ec) {
    for (int i = 0; i < 20 && !engine.find_peer(peer); ++i) {
        engine.discover_peers(ec);
        if (ec)
            return nullptr;
    }
    return engine.connect_to_peer(peer, ec);
}

} // namespace kizuna::test
