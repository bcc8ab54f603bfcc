/**
 * PeerRegistry: merged view of peers seen by every discovery method.
 */

#include "discovery/peer_registry.h"

#include <spdlog/spdlog.h>

namespace kizuna {

PeerRegistry::PeerRegistry(asio::io_context& io, std::chrono::milliseconds expiry)
    : strand_(asio::make_strand(io))
    , expiry_(expiry)
    , snapshot_(std::make_shared<const Snapshot>()) {}

void PeerRegistry::post_sighting(Sighting sighting) {
    asio::post(strand_, [this, sighting = std::move(sighting)] {
        if (sighting.peer_id.empty())
            return;

        auto now = Clock::now();
        auto it = records_.find(sighting.peer_id);
        if (it == records_.end()) {
            it = records_.emplace(sighting.peer_id, make_peer_record(sighting, now)).first;
            spdlog::debug("Discovery: new peer {} ({}) via {}", sighting.peer_id.substr(0, 16), sighting.name,
                          sighting.method);
        } else {
            merge_sighting(it->second, sighting, now);
        }
        if (trust_resolver_ && it->second.trust != TrustState::pending)
            it->second.trust = trust_resolver_(it->first);

        publish();
        for (const auto& entry : subscribers_)
            entry.second(it->second);
    });
}

void PeerRegistry::post(std::function<void()> fn) {
    asio::post(strand_, std::move(fn));
}

void PeerRegistry::set_trust(const PeerId& peer, TrustState state) {
    asio::post(strand_, [this, peer, state] {
        auto it = records_.find(peer);
        if (it == records_.end() || it->second.trust == state)
            return;
        it->second.trust = state;
        publish();
    });
}

void PeerRegistry::set_trust_resolver(TrustResolver resolver) {
    asio::post(strand_, [this, resolver = std::move(resolver)]() mutable {
        trust_resolver_ = std::move(resolver);
    });
}

void PeerRegistry::sweep(Clock::time_point now) {
    asio::post(strand_, [this, now] {
        std::size_t evicted = 0;
        for (auto it = records_.begin(); it != records_.end();) {
            if (now - it->second.last_seen > expiry_) {
                spdlog::debug("Discovery: evicting silent peer {}", it->first.substr(0, 16));
                it = records_.erase(it);
                ++evicted;
            } else {
                ++it;
            }
        }
        if (evicted > 0)
            publish();
    });
}

void PeerRegistry::clear() {
    asio::post(strand_, [this] {
        records_.clear();
        subscribers_.clear();
        publish();
    });
}

std::optional<PeerRecord> PeerRegistry::find(const PeerId& peer) const {
    auto snap = snapshot();
    auto it = snap->find(peer);
    if (it == snap->end())
        return std::nullopt;
    return it->second;
}

std::vector<PeerRecord> PeerRegistry::peers() const {
    auto snap = snapshot();
    std::vector<PeerRecord> out;
    out.reserve(snap->size());
    for (const auto& entry : *snap)
        out.push_back(entry.second);
    return out;
}

std::vector<PeerRecord> PeerRegistry::select(const std::set<PeerId>& ids) const {
    auto snap = snapshot();
    std::vector<PeerRecord> out;
    for (const auto& id : ids) {
        auto it = snap->find(id);
        if (it != snap->end())
            out.push_back(it->second);
    }
    return out;
}

std::size_t PeerRegistry::size() const {
    return snapshot()->size();
}

std::size_t PeerRegistry::subscribe(Subscriber subscriber) {
    std::size_t token = next_token_++;
    asio::post(strand_, [this, token, subscriber = std::move(subscriber)]() mutable {
        subscribers_[token] = std::move(subscriber);
    });
    return token;
}

void PeerRegistry::unsubscribe(std::size_t token) {
    asio::post(strand_, [this, token] { subscribers_.erase(token); });
}

void PeerRegistry::publish() {
    auto next = std::make_shared<const Snapshot>(records_);
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_ = std::move(next);
}

std::shared_ptr<const PeerRegistry::Snapshot> PeerRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

} // namespace kizuna
