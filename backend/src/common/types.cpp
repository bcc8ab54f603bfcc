/**
 * Enum names and small conversions shared across modules.
 */

#include "common/types.h"

#include <algorithm>

#include <sodium.h>

namespace kizuna {

const char* to_string(TransportKind kind) {
    switch (kind) {
    case TransportKind::quic:      return "quic";
    case TransportKind::webrtc:    return "webrtc";
    case TransportKind::websocket: return "websocket";
    case TransportKind::tcp:       return "tcp";
    case TransportKind::udp:       return "udp";
    }
    return "unknown";
}

std::optional<TransportKind> transport_kind_from_string(const std::string& name) {
    for (auto kind : transport_priority()) {
        if (name == to_string(kind))
            return kind;
    }
    return std::nullopt;
}

const std::vector<TransportKind>& transport_priority() {
    static const std::vector<TransportKind> order = {
        TransportKind::quic,
        TransportKind::webrtc,
        TransportKind::websocket,
        TransportKind::tcp,
        TransportKind::udp,
    };
    return order;
}

const char* to_string(TrustState state) {
    switch (state) {
    case TrustState::unknown: return "unknown";
    case TrustState::pending: return "pending";
    case TrustState::trusted: return "trusted";
    case TrustState::blocked: return "blocked";
    }
    return "unknown";
}

bool PeerRecord::found_by(const std::string& method) const {
    return std::find(discovery_methods.begin(), discovery_methods.end(), method)
        != discovery_methods.end();
}

void merge_sighting(PeerRecord& record, const Sighting& sighting, Clock::time_point now) {
    if (record.name.empty() && !sighting.name.empty())
        record.name = sighting.name;
    if (record.user_name.empty() && !sighting.user_name.empty())
        record.user_name = sighting.user_name;

    record.addresses.insert(sighting.addresses.begin(), sighting.addresses.end());
    record.capabilities.insert(sighting.capabilities.begin(), sighting.capabilities.end());

    if (!sighting.method.empty() && !record.found_by(sighting.method))
        record.discovery_methods.push_back(sighting.method);

    record.protocol_version = std::max(record.protocol_version, sighting.protocol_version);
    record.last_seen = now;
}

PeerRecord make_peer_record(const Sighting& sighting, Clock::time_point now) {
    PeerRecord record;
    record.id = sighting.peer_id;
    record.first_seen = now;
    merge_sighting(record, sighting, now);
    return record;
}

std::optional<std::pair<std::string, std::string>> split_address(const std::string& address) {
    auto pos = address.find("://");
    if (pos == std::string::npos || pos == 0)
        return std::nullopt;
    return std::make_pair(address.substr(0, pos), address.substr(pos + 3));
}

std::string random_id(std::size_t bytes) {
    std::vector<unsigned char> raw(bytes);
    randombytes_buf(raw.data(), raw.size());
    std::string hex(bytes * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), raw.data(), raw.size());
    hex.resize(bytes * 2);
    return hex;
}

} // namespace kizuna
