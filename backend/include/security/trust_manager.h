#pragma once

#include <functional>
#include <map>
#include <memory>
#include <system_error>
#include <vector>

#include <asio.hpp>

#include "common/types.h"
#include "config/engine_config.h"
#include "security/trust_store.h"

namespace kizuna {

enum class TrustDecision {
    allow,
    require_manual_approval,
    deny,
};

/**
 * Applies the configured trust mode to peers before a session is allowed.
 *
 * Manual approval is solicited through an injected handler; the engine never
 * assumes a UI. The handler may answer from any thread, at most once.
 */
class TrustManager {
public:
    using ApprovalResponder = std::function<void(bool approved)>;
    using ApprovalHandler = std::function<void(const PeerRecord& peer, ApprovalResponder respond)>;
    using AuthorizeHandler = std::function<void(std::error_code)>;

    TrustManager(asio::io_context& io, const SecurityConfig& config, TrustStore& store);

    /// Policy decision without side effects. Blocked peers are denied in every mode.
    TrustDecision evaluate(const PeerId& peer) const;

    /// Trust state to show on a peer record.
    TrustState trust_state(const PeerId& peer) const;

    void set_approval_handler(ApprovalHandler handler);

    /**
     * Evaluate and, in manual mode, wait for approval. Completes with
     * success, trust_denied, approval_timeout or cancelled.
     */
    void async_authorize(const PeerRecord& peer, AuthorizeHandler handler);

    /// Fail every pending approval with `cancelled`.
    void cancel_pending();

    [[nodiscard]] TrustMode mode() const { return config_.trust_mode; }
    TrustStore& store() { return store_; }

private:
    struct PendingApproval {
        explicit PendingApproval(asio::io_context& io) : timer(io) {}
        asio::steady_timer timer;
        std::vector<AuthorizeHandler> waiters;
        bool settled = false;
    };

    void settle(const PeerId& peer, std::error_code ec, bool approved);

    asio::io_context& io_;
    asio::strand<asio::io_context::executor_type> strand_;
    SecurityConfig config_;
    TrustStore& store_;
    ApprovalHandler approval_handler_;
    std::map<PeerId, std::shared_ptr<PendingApproval>> pending_;
    std::map<PeerId, std::string> nicknames_;
};

} // namespace kizuna
