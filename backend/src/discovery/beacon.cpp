/**
 * Beacon encoding and parsing.
 */

#include "discovery/beacon.h"

#include <nlohmann/json.hpp>

namespace kizuna {

using json = nlohmann::json;

namespace {

constexpr const char* kProtocolTag = "kizuna";

std::vector<std::string> string_list(const json& j, const char* key) {
    std::vector<std::string> out;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array())
        return out;
    for (const auto& item : *it) {
        if (item.is_string())
            out.push_back(item.get<std::string>());
    }
    return out;
}

} // namespace

std::string encode_beacon(const Beacon& beacon) {
    json j = {
        {"proto", kProtocolTag},
        {"v", beacon.version},
        {"type", beacon.type},
        {"id", beacon.id},
        {"name", beacon.name},
        {"user", beacon.user},
        {"port", beacon.port},
        {"caps", beacon.caps},
        {"transports", beacon.transports},
    };
    if (!beacon.addrs.empty())
        j["addrs"] = beacon.addrs;
    return j.dump();
}

std::optional<Beacon> decode_beacon(const std::string& datagram) {
    json j = json::parse(datagram, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;

    auto proto = j.find("proto");
    auto version = j.find("v");
    auto id = j.find("id");
    if (proto == j.end() || *proto != kProtocolTag)
        return std::nullopt;
    if (version == j.end() || !version->is_number_integer() || version->get<int>() < 1)
        return std::nullopt;
    if (id == j.end() || !id->is_string() || id->get<std::string>().empty())
        return std::nullopt;

    Beacon beacon;
    beacon.version = version->get<int>();
    beacon.id = id->get<std::string>();

    auto text = [&j](const char* key) {
        auto it = j.find(key);
        return it != j.end() && it->is_string() ? it->get<std::string>() : std::string{};
    };
    beacon.type = text("type");
    if (beacon.type != "query")
        beacon.type = "announce";
    beacon.name = text("name");
    beacon.user = text("user");

    auto port = j.find("port");
    if (port != j.end() && port->is_number_unsigned() && port->get<unsigned>() <= 65535)
        beacon.port = static_cast<uint16_t>(port->get<unsigned>());

    beacon.caps = string_list(j, "caps");
    beacon.transports = string_list(j, "transports");
    beacon.addrs = string_list(j, "addrs");
    return beacon;
}

Sighting beacon_to_sighting(const Beacon& beacon, const std::string& sender_ip, const std::string& method) {
    Sighting s;
    s.peer_id = beacon.id;
    s.name = beacon.name;
    s.user_name = beacon.user;
    s.capabilities = beacon.caps;
    s.method = method;
    s.protocol_version = beacon.version;

    if (beacon.port != 0 && !sender_ip.empty()) {
        std::string host = sender_ip.find(':') != std::string::npos ? "[" + sender_ip + "]" : sender_ip;
        for (const auto& transport : beacon.transports) {
            if (transport == "tcp")
                s.addresses.push_back("tcp://" + host + ":" + std::to_string(beacon.port));
        }
    }
    for (const auto& addr : beacon.addrs) {
        if (split_address(addr))
            s.addresses.push_back(addr);
    }
    return s;
}

} // namespace kizuna
