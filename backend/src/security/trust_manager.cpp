/**
 * TrustManager: allowlist, blocklist and manual approval decisions.
 */

#include "security/trust_manager.h"

#include <spdlog/spdlog.h>

#include "common/error.h"

namespace kizuna {

TrustManager::TrustManager(asio::io_context& io, const SecurityConfig& config, TrustStore& store)
    : io_(io)
    , strand_(asio::make_strand(io))
    , config_(config)
    , store_(store) {
    for (const auto& peer : config_.allowlist)
        store_.allowlist(peer);
    for (const auto& peer : config_.blocklist)
        store_.block(peer);
}

TrustDecision TrustManager::evaluate(const PeerId& peer) const {
    if (store_.is_blocked(peer))
        return TrustDecision::deny;

    switch (config_.trust_mode) {
    case TrustMode::open:
        return TrustDecision::allow;
    case TrustMode::allowlist_only:
        return store_.is_known(peer) ? TrustDecision::allow : TrustDecision::deny;
    case TrustMode::manual:
        return store_.is_known(peer) ? TrustDecision::allow : TrustDecision::require_manual_approval;
    }
    return TrustDecision::deny;
}

TrustState TrustManager::trust_state(const PeerId& peer) const {
    if (store_.is_blocked(peer))
        return TrustState::blocked;
    if (store_.is_known(peer))
        return TrustState::trusted;
    return TrustState::unknown;
}

void TrustManager::set_approval_handler(ApprovalHandler handler) {
    asio::post(strand_, [this, handler = std::move(handler)]() mutable {
        approval_handler_ = std::move(handler);
    });
}

void TrustManager::async_authorize(const PeerRecord& peer, AuthorizeHandler handler) {
    switch (evaluate(peer.id)) {
    case TrustDecision::allow:
        store_.touch(peer.id);
        asio::post(io_, [handler = std::move(handler)] { handler({}); });
        return;
    case TrustDecision::deny:
        spdlog::info("Trust: denied peer {} under {} mode", peer.id.substr(0, 16), to_string(config_.trust_mode));
        asio::post(io_, [handler = std::move(handler)] { handler(errc::trust_denied); });
        return;
    case TrustDecision::require_manual_approval:
        break;
    }

    asio::post(strand_, [this, peer, handler = std::move(handler)]() mutable {
        auto it = pending_.find(peer.id);
        if (it != pending_.end()) {
            it->second->waiters.push_back(std::move(handler));
            return;
        }

        if (!approval_handler_) {
            spdlog::warn("Trust: no approval handler installed, peer {} cannot be approved", peer.id.substr(0, 16));
            asio::post(io_, [handler = std::move(handler)] { handler(errc::approval_timeout); });
            return;
        }

        auto pending = std::make_shared<PendingApproval>(io_);
        pending->waiters.push_back(std::move(handler));
        pending_[peer.id] = pending;
        nicknames_[peer.id] = peer.name;

        const PeerId id = peer.id;
        pending->timer.expires_after(config_.approval_timeout);
        pending->timer.async_wait(asio::bind_executor(strand_, [this, id](const asio::error_code& ec) {
            if (ec == asio::error::operation_aborted)
                return;
            settle(id, errc::approval_timeout, false);
        }));

        spdlog::info("Trust: requesting manual approval for {} ({})", id.substr(0, 16), peer.name);
        auto respond = [this, id, weak = std::weak_ptr<PendingApproval>(pending)](bool approved) {
            asio::post(strand_, [this, id, weak, approved] {
                auto alive = weak.lock();
                if (!alive || alive->settled)
                    return;
                settle(id, approved ? std::error_code{} : make_error_code(errc::trust_denied), approved);
            });
        };
        // The handler runs off-strand so it may block or answer synchronously.
        asio::post(io_, [handler = approval_handler_, peer, respond]() { handler(peer, respond); });
    });
}

void TrustManager::settle(const PeerId& peer, std::error_code ec, bool approved) {
    auto it = pending_.find(peer);
    if (it == pending_.end())
        return;

    auto pending = it->second;
    pending_.erase(it);
    pending->settled = true;
    pending->timer.cancel();

    if (approved) {
        store_.trust(peer, nicknames_[peer]);
        spdlog::info("Trust: peer {} approved", peer.substr(0, 16));
    } else {
        spdlog::info("Trust: peer {} not approved: {}", peer.substr(0, 16), ec.message());
    }
    nicknames_.erase(peer);

    for (auto& waiter : pending->waiters)
        asio::post(io_, [waiter = std::move(waiter), ec] { waiter(ec); });
}

void TrustManager::cancel_pending() {
    asio::post(strand_, [this] {
        std::vector<PeerId> peers;
        for (const auto& entry : pending_)
            peers.push_back(entry.first);
        for (const auto& peer : peers)
            settle(peer, errc::cancelled, false);
    });
}

} // namespace kizuna
