#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/types.h"

namespace kizuna {

using std::chrono::milliseconds;

enum class TrustMode {
    open,
    manual,
    allowlist_only,
};

const char* to_string(TrustMode mode);

struct IdentityConfig {
    std::string device_name = "kizuna-device";
    std::string user_name;
    std::string identity_path;          // empty: keys live only for this process
};

struct DiscoveryConfig {
    bool enable_mdns = true;
    bool enable_udp = true;
    bool enable_bluetooth = false;
    milliseconds interval{5000};
    milliseconds timeout{30000};
    uint16_t udp_port = 41337;
    milliseconds peer_expiry{60000};
};

struct SecurityConfig {
    bool enable_encryption = true;
    bool require_authentication = true;
    TrustMode trust_mode = TrustMode::manual;
    std::vector<PeerId> allowlist;
    std::vector<PeerId> blocklist;
    std::string trust_store_path;       // empty: in-memory trust store
    milliseconds approval_timeout{30000};
};

struct NetworkingConfig {
    uint16_t listen_port = 0;           // 0: pick an ephemeral port
    bool enable_ipv6 = true;
    bool enable_quic = true;
    bool enable_webrtc = true;
    bool enable_websocket = true;
    bool enable_tcp = true;
    milliseconds connection_timeout{30000};
    milliseconds keepalive_interval{5000};
    unsigned keepalive_misses = 3;

    [[nodiscard]] bool transport_enabled(TransportKind kind) const;
};

struct TransferConfig {
    std::string download_dir = "downloads";
    uint32_t chunk_size = 64 * 1024;
    uint32_t window = 8;                 // unacknowledged chunks in flight
    milliseconds ack_timeout{5000};
    unsigned max_chunk_retries = 3;
    milliseconds retry_backoff{200};
    milliseconds retention{60000};
    milliseconds complete_timeout{30000};    // last ack to the receiver's verdict
    milliseconds resume_window{600000};      // interrupted transfers fail after this
    bool auto_resume = true;
};

struct StreamConfig {
    std::size_t max_queue_depth = 8;     // frames queued on the session per stream
    std::size_t high_water = 4;
    unsigned congestion_ticks = 3;
    int degrade_step = 10;
    int min_quality = 10;
    unsigned recover_ticks = 20;
    milliseconds retention{60000};           // stopped streams stay visible this long
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern;
    std::string file;
};

struct RuntimeConfig {
    unsigned worker_threads = 2;
    milliseconds shutdown_grace{2000};
};

/**
 * Complete engine configuration. Every field is optional in JSON form;
 * durations are written in seconds (`*_secs`) or milliseconds (`*_ms`).
 */
struct EngineConfig {
    IdentityConfig identity;
    DiscoveryConfig discovery;
    SecurityConfig security;
    NetworkingConfig networking;
    TransferConfig transfer;
    StreamConfig stream;
    LoggingConfig logging;
    RuntimeConfig runtime;

    /// Throws std::system_error(errc::invalid_config) on mistyped values.
    static EngineConfig from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;

    /// Throws std::system_error(errc::invalid_config) on inconsistent settings.
    void validate() const;
};

/// Read and parse a JSON config file.
EngineConfig load_config(const std::string& path);

} // namespace kizuna
