#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/types.h"
#include "common/wire.h"

namespace kizuna {

/**
 * What a device advertises about itself on discovery media.
 *
 * Encoded as a JSON object; receivers ignore unknown fields and accept any
 * protocol version from 1 upwards.
 */
struct Beacon {
    std::string type = "announce";          // "query" or "announce"
    PeerId id;
    std::string name;
    std::string user;
    uint16_t port = 0;                      // tcp listener, 0 when none
    std::vector<std::string> caps;
    std::vector<std::string> transports;
    std::vector<std::string> addrs;         // explicit non-IP transport URIs
    int version = wire::kProtocolVersion;
};

std::string encode_beacon(const Beacon& beacon);
std::optional<Beacon> decode_beacon(const std::string& datagram);

/// Turn a received beacon into a sighting, addressing IP transports at `sender_ip`.
Sighting beacon_to_sighting(const Beacon& beacon, const std::string& sender_ip, const std::string& method);

} // namespace kizuna
