#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace kizuna {

using Bytes = std::vector<uint8_t>;

/// Lowercase hex SHA-256 of a peer's public signing key.
using PeerId = std::string;

using Clock = std::chrono::steady_clock;

/**
 * Stream transports in the fixed preference order used for connection
 * attempts: lower enumerator value wins.
 */
enum class TransportKind {
    quic,
    webrtc,
    websocket,
    tcp,
    udp,
};

const char* to_string(TransportKind kind);
std::optional<TransportKind> transport_kind_from_string(const std::string& name);

/// Every transport kind, highest priority first.
const std::vector<TransportKind>& transport_priority();

enum class TrustState {
    unknown,
    pending,
    trusted,
    blocked,
};

const char* to_string(TrustState state);

/**
 * A peer as seen by the discovery aggregator.
 *
 * Addresses are transport URIs ("tcp://10.0.0.7:41400"); the scheme names the
 * transport kind that can reach it.
 */
struct PeerRecord {
    PeerId id;
    std::string name;
    std::string user_name;
    std::set<std::string> addresses;
    std::set<std::string> capabilities;
    std::vector<std::string> discovery_methods;   // first-seen order, unique
    TrustState trust = TrustState::unknown;
    int protocol_version = 0;
    Clock::time_point first_seen{};
    Clock::time_point last_seen{};

    [[nodiscard]] bool has_capability(const std::string& tag) const { return capabilities.count(tag) != 0; }
    [[nodiscard]] bool found_by(const std::string& method) const;
};

/// Raw observation of a peer from a single discovery adapter.
struct Sighting {
    PeerId peer_id;
    std::string name;
    std::string user_name;
    std::vector<std::string> addresses;
    std::vector<std::string> capabilities;
    std::string method;
    int protocol_version = 1;
};

/**
 * Merge a sighting into a record for the same peer: addresses and
 * capabilities are unioned, the method is appended once, last_seen refreshed.
 */
void merge_sighting(PeerRecord& record, const Sighting& sighting, Clock::time_point now);

PeerRecord make_peer_record(const Sighting& sighting, Clock::time_point now);

/// Split "scheme://rest" into its parts; nullopt without a scheme.
std::optional<std::pair<std::string, std::string>> split_address(const std::string& address);

/// Random lowercase hex identifier of the given byte length.
std::string random_id(std::size_t bytes = 8);

} // namespace kizuna
