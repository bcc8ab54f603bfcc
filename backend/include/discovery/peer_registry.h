#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

#include "common/types.h"

namespace kizuna {

/**
 * De-duplicated set of known peers, keyed by peer id.
 *
 * All mutation happens on one strand: adapters post sightings and the
 * registry merges them in arrival order. Readers see an immutable snapshot
 * that is republished after every update.
 */
class PeerRegistry {
public:
    using Subscriber = std::function<void(const PeerRecord&)>;
    using TrustResolver = std::function<TrustState(const PeerId&)>;

    PeerRegistry(asio::io_context& io, std::chrono::milliseconds expiry);

    void post_sighting(Sighting sighting);

    /// Run `fn` on the registry strand, after every update posted before it.
    void post(std::function<void()> fn);

    void set_trust(const PeerId& peer, TrustState state);
    void set_trust_resolver(TrustResolver resolver);

    /// Drop peers silent for longer than the expiry.
    void sweep(Clock::time_point now);
    void clear();

    std::optional<PeerRecord> find(const PeerId& peer) const;
    std::vector<PeerRecord> peers() const;
    std::vector<PeerRecord> select(const std::set<PeerId>& ids) const;
    [[nodiscard]] std::size_t size() const;

    /// Called on the registry strand for every merged update.
    std::size_t subscribe(Subscriber subscriber);
    void unsubscribe(std::size_t token);

private:
    using Snapshot = std::map<PeerId, PeerRecord>;

    void publish();
    std::shared_ptr<const Snapshot> snapshot() const;

    asio::strand<asio::io_context::executor_type> strand_;
    std::chrono::milliseconds expiry_;

    // Strand-only state.
    Snapshot records_;
    std::map<std::size_t, Subscriber> subscribers_;
    TrustResolver trust_resolver_;

    std::atomic<std::size_t> next_token_{1};
    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const Snapshot> snapshot_;
};

} // namespace kizuna
