#pragma once

#include <asio.hpp>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include "config/engine_config.h"
#include "discovery/discovery_adapter.h"
#include "discovery/peer_registry.h"

namespace kizuna {

/**
 * Runs every enabled discovery adapter in parallel and folds their
 * sightings into the peer registry.
 *
 * A discover call completes with the peers seen during that run. Calls made
 * while a run is in progress join it instead of starting another.
 */
class DiscoveryManager {
public:
    using DiscoverHandler = std::function<void(std::error_code, std::vector<PeerRecord>)>;

    DiscoveryManager(asio::io_context& io, const DiscoveryConfig& config, PeerRegistry& registry);

    void add_adapter(std::shared_ptr<DiscoveryAdapter> adapter);

    /// Start adapter responders and the eviction sweep. Failing adapters are logged and skipped.
    void start(const Beacon& local);

    void async_discover(std::chrono::milliseconds timeout,
                        std::chrono::milliseconds interval,
                        DiscoverHandler handler);

    /// Complete the running discovery with errc::cancelled.
    void cancel();

    /// Cancel, stop every adapter and the sweep. Later discover calls fail with not_initialized.
    void stop();

    /// Methods of the adapters that started successfully.
    std::vector<std::string> active_methods() const;

private:
    struct Run {
        explicit Run(asio::strand<asio::io_context::executor_type>& strand) : deadline(strand) {}
        uint64_t id = 0;
        std::size_t outstanding = 0;
        std::set<PeerId> seen;
        std::vector<DiscoverHandler> waiters;
        asio::steady_timer deadline;
    };

    void finish_run(std::error_code ec);
    void schedule_sweep();

    asio::io_context& io_;
    asio::strand<asio::io_context::executor_type> strand_;
    DiscoveryConfig config_;
    PeerRegistry& registry_;

    std::vector<std::shared_ptr<DiscoveryAdapter>> adapters_;
    std::vector<std::shared_ptr<DiscoveryAdapter>> active_;
    std::shared_ptr<Run> run_;
    uint64_t next_run_ = 1;
    asio::steady_timer sweep_timer_;
    bool stopped_ = false;
};

} // namespace kizuna
