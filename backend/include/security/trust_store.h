#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <system_error>
#include <vector>

#include "common/types.h"

namespace kizuna {

enum class TrustLevel {
    allowlisted,   // pre-approved by configuration or API
    trusted,       // approved manually
};

struct TrustEntry {
    PeerId peer_id;
    std::string nickname;
    TrustLevel level = TrustLevel::trusted;
    int64_t first_seen = 0;   // unix seconds
    int64_t last_seen = 0;
};

/**
 * Remembered trust decisions, optionally persisted as JSON.
 *
 * Every mutation is written through to disk when a path is configured.
 * Safe to use from any thread.
 */
class TrustStore {
public:
    explicit TrustStore(std::string path = {});

    /// Read the store from disk; a missing file is an empty store.
    std::error_code load();
    std::error_code save() const;

    void trust(const PeerId& peer, const std::string& nickname = {});
    void allowlist(const PeerId& peer);
    void block(const PeerId& peer);
    void unblock(const PeerId& peer);
    void forget(const PeerId& peer);
    void touch(const PeerId& peer);

    [[nodiscard]] bool is_blocked(const PeerId& peer) const;
    [[nodiscard]] bool is_known(const PeerId& peer) const;
    std::optional<TrustEntry> entry(const PeerId& peer) const;
    std::vector<TrustEntry> entries() const;
    std::vector<PeerId> blocked() const;

    [[nodiscard]] const std::string& path() const { return path_; }

private:
    void persist_locked() const;
    std::error_code save_locked() const;

    std::string path_;
    mutable std::mutex mutex_;
    std::map<PeerId, TrustEntry> entries_;
    std::set<PeerId> blocked_;
};

} // namespace kizuna
