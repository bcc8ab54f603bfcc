/**
 * DiscoveryManager: fans a discovery run out to every adapter and
 * feeds their sightings into the peer registry. A sweep timer drops
 * peers that have not been seen for a while.
 */

#include "discovery/discovery_manager.h"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "common/error.h"

namespace kizuna {

DiscoveryManager::DiscoveryManager(asio::io_context& io, const DiscoveryConfig& config, PeerRegistry& registry)
    : io_(io)
    , strand_(asio::make_strand(io))
    , config_(config)
    , registry_(registry)
    , sweep_timer_(strand_) {}

void DiscoveryManager::add_adapter(std::shared_ptr<DiscoveryAdapter> adapter) {
    adapters_.push_back(std::move(adapter));
}

void DiscoveryManager::start(const Beacon& local) {
    for (const auto& adapter : adapters_) {
        auto ec = adapter->start(local);
        if (ec) {
            spdlog::warn("Discovery: {} adapter unavailable: {}", adapter->method(), ec.message());
            continue;
        }
        active_.push_back(adapter);
    }
    spdlog::info("Discovery: {} of {} adapter(s) active", active_.size(), adapters_.size());
    asio::post(strand_, [this] { schedule_sweep(); });
}

void DiscoveryManager::schedule_sweep() {
    if (stopped_)
        return;
    auto period = std::max(config_.peer_expiry / 2, std::chrono::milliseconds(100));
    sweep_timer_.expires_after(period);
    sweep_timer_.async_wait([this](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted || stopped_)
            return;
        registry_.sweep(Clock::now());
        schedule_sweep();
    });
}

void DiscoveryManager::async_discover(std::chrono::milliseconds timeout,
                                      std::chrono::milliseconds interval,
                                      DiscoverHandler handler) {
    asio::post(strand_, [this, timeout, interval, handler = std::move(handler)]() mutable {
        if (stopped_) {
            asio::post(io_, [handler = std::move(handler)] { handler(errc::not_initialized, {}); });
            return;
        }
        if (run_) {
            run_->waiters.push_back(std::move(handler));
            return;
        }

        auto run = std::make_shared<Run>(strand_);
        run->id = next_run_++;
        run->outstanding = active_.size();
        run->waiters.push_back(std::move(handler));
        run_ = run;

        spdlog::debug("Discovery: run {} over {} adapter(s), timeout {} ms", run->id, active_.size(),
                      timeout.count());

        if (active_.empty()) {
            finish_run({});
            return;
        }

        run->deadline.expires_after(timeout);
        run->deadline.async_wait([this, id = run->id](const asio::error_code& ec) {
            if (ec == asio::error::operation_aborted || !run_ || run_->id != id)
                return;
            finish_run({});
        });

        for (const auto& adapter : active_) {
            const uint64_t id = run->id;
            auto on_sighting = [this, id](Sighting sighting) {
                PeerId peer = sighting.peer_id;
                registry_.post_sighting(std::move(sighting));
                asio::post(strand_, [this, id, peer] {
                    if (run_ && run_->id == id)
                        run_->seen.insert(peer);
                });
            };
            auto done = [this, id, method = adapter->method()](std::error_code ec) {
                asio::post(strand_, [this, id, method, ec] {
                    if (ec && ec != errc::cancelled)
                        spdlog::warn("Discovery: {} adapter failed: {}", method, ec.message());
                    if (!run_ || run_->id != id)
                        return;
                    if (--run_->outstanding == 0)
                        finish_run({});
                });
            };
            adapter->async_scan(timeout, interval, std::move(on_sighting), std::move(done));
        }
    });
}

void DiscoveryManager::finish_run(std::error_code ec) {
    auto run = std::move(run_);
    run_.reset();
    if (!run)
        return;

    run->deadline.cancel();
    if (run->outstanding > 0) {
        for (const auto& adapter : active_)
            adapter->cancel();
    }

    // The registry strand has merged every sighting posted before this point.
    registry_.post([this, run, ec] {
        auto peers = ec ? std::vector<PeerRecord>{} : registry_.select(run->seen);
        spdlog::debug("Discovery: run {} finished with {} peer(s)", run->id, peers.size());
        for (auto& waiter : run->waiters)
            asio::post(io_, [waiter = std::move(waiter), ec, peers] { waiter(ec, peers); });
    });
}

void DiscoveryManager::cancel() {
    asio::post(strand_, [this] { finish_run(errc::cancelled); });
}

void DiscoveryManager::stop() {
    asio::post(strand_, [this] {
        stopped_ = true;
        sweep_timer_.cancel();
        finish_run(errc::cancelled);
        for (const auto& adapter : active_)
            adapter->stop();
    });
}

std::vector<std::string> DiscoveryManager::active_methods() const {
    std::vector<std::string> out;
    for (const auto& adapter : active_)
        out.push_back(adapter->method());
    return out;
}

} // namespace kizuna
