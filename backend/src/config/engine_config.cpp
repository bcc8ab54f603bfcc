/**
 * EngineConfig: JSON loading, saving and validation of engine settings.
 *
 * Durations are stored in seconds on disk and milliseconds in memory.
 * Keys missing from a file keep their defaults.
 */

#include "config/engine_config.h"

#include <cmath>
#include <fstream>
#include <system_error>

#include "common/error.h"

namespace kizuna {

using json = nlohmann::json;

namespace {

template <typename T>
void read(const json& section, const char* key, T& out) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null())
        out = it->get<T>();
}

void read_secs(const json& section, const char* key, milliseconds& out) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null())
        return;
    double secs = it->get<double>();
    if (secs < 0)
        throw std::system_error(errc::invalid_config, std::string(key) + " must not be negative");
    out = milliseconds(static_cast<milliseconds::rep>(std::llround(secs * 1000.0)));
}

void read_ms(const json& section, const char* key, milliseconds& out) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null())
        out = milliseconds(it->get<milliseconds::rep>());
}

const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end() || it->is_null())
        return empty;
    if (!it->is_object())
        throw std::system_error(errc::invalid_config, std::string("section '") + name + "' must be an object");
    return *it;
}

TrustMode parse_trust_mode(const std::string& name) {
    if (name == "open" || name == "trust_all")
        return TrustMode::open;
    if (name == "manual")
        return TrustMode::manual;
    if (name == "allowlist_only")
        return TrustMode::allowlist_only;
    throw std::system_error(errc::invalid_config, "unknown trust_mode '" + name + "'");
}

double to_secs(milliseconds ms) {
    return static_cast<double>(ms.count()) / 1000.0;
}

} // namespace

const char* to_string(TrustMode mode) {
    switch (mode) {
    case TrustMode::open:           return "open";
    case TrustMode::manual:         return "manual";
    case TrustMode::allowlist_only: return "allowlist_only";
    }
    return "manual";
}

bool NetworkingConfig::transport_enabled(TransportKind kind) const {
    switch (kind) {
    case TransportKind::quic:      return enable_quic;
    case TransportKind::webrtc:    return enable_webrtc;
    case TransportKind::websocket: return enable_websocket;
    case TransportKind::tcp:       return enable_tcp;
    case TransportKind::udp:       return true;
    }
    return false;
}

EngineConfig EngineConfig::from_json(const json& j) {
    if (!j.is_object())
        throw std::system_error(errc::invalid_config, "configuration must be a JSON object");

    EngineConfig config;
    try {
        const auto& identity = section(j, "identity");
        read(identity, "device_name", config.identity.device_name);
        read(identity, "user_name", config.identity.user_name);
        read(identity, "identity_path", config.identity.identity_path);

        const auto& discovery = section(j, "discovery");
        read(discovery, "enable_mdns", config.discovery.enable_mdns);
        read(discovery, "enable_udp", config.discovery.enable_udp);
        read(discovery, "enable_bluetooth", config.discovery.enable_bluetooth);
        read_secs(discovery, "interval_secs", config.discovery.interval);
        read_secs(discovery, "timeout_secs", config.discovery.timeout);
        read(discovery, "udp_port", config.discovery.udp_port);
        read_secs(discovery, "peer_expiry_secs", config.discovery.peer_expiry);

        const auto& security = section(j, "security");
        read(security, "enable_encryption", config.security.enable_encryption);
        read(security, "require_authentication", config.security.require_authentication);
        if (security.contains("trust_mode"))
            config.security.trust_mode = parse_trust_mode(security.at("trust_mode").get<std::string>());
        read(security, "allowlist", config.security.allowlist);
        read(security, "blocklist", config.security.blocklist);
        read(security, "trust_store_path", config.security.trust_store_path);
        read_secs(security, "approval_timeout_secs", config.security.approval_timeout);

        const auto& networking = section(j, "networking");
        read(networking, "listen_port", config.networking.listen_port);
        read(networking, "enable_ipv6", config.networking.enable_ipv6);
        read(networking, "enable_quic", config.networking.enable_quic);
        read(networking, "enable_webrtc", config.networking.enable_webrtc);
        read(networking, "enable_websocket", config.networking.enable_websocket);
        read(networking, "enable_tcp", config.networking.enable_tcp);
        read_secs(networking, "connection_timeout_secs", config.networking.connection_timeout);
        read_secs(networking, "keepalive_interval_secs", config.networking.keepalive_interval);
        read(networking, "keepalive_misses", config.networking.keepalive_misses);

        const auto& transfer = section(j, "transfer");
        read(transfer, "download_dir", config.transfer.download_dir);
        read(transfer, "chunk_size", config.transfer.chunk_size);
        read(transfer, "window", config.transfer.window);
        read_ms(transfer, "ack_timeout_ms", config.transfer.ack_timeout);
        read(transfer, "max_chunk_retries", config.transfer.max_chunk_retries);
        read_ms(transfer, "retry_backoff_ms", config.transfer.retry_backoff);
        read_secs(transfer, "retention_secs", config.transfer.retention);
        read_secs(transfer, "complete_timeout_secs", config.transfer.complete_timeout);
        read_secs(transfer, "resume_window_secs", config.transfer.resume_window);
        read(transfer, "auto_resume", config.transfer.auto_resume);

        const auto& stream = section(j, "stream");
        read(stream, "max_queue_depth", config.stream.max_queue_depth);
        read(stream, "high_water", config.stream.high_water);
        read(stream, "congestion_ticks", config.stream.congestion_ticks);
        read(stream, "degrade_step", config.stream.degrade_step);
        read(stream, "min_quality", config.stream.min_quality);
        read(stream, "recover_ticks", config.stream.recover_ticks);
        read_secs(stream, "retention_secs", config.stream.retention);

        const auto& logging = section(j, "logging");
        read(logging, "level", config.logging.level);
        read(logging, "pattern", config.logging.pattern);
        read(logging, "file", config.logging.file);

        const auto& runtime = section(j, "runtime");
        read(runtime, "worker_threads", config.runtime.worker_threads);
        read_ms(runtime, "shutdown_grace_ms", config.runtime.shutdown_grace);
    } catch (const json::exception& e) {
        throw std::system_error(errc::invalid_config, e.what());
    }

    if (config.runtime.worker_threads == 0)
        config.runtime.worker_threads = 1;
    config.validate();
    return config;
}

void EngineConfig::validate() const {
    if (discovery.interval.count() <= 0)
        throw std::system_error(errc::invalid_config, "discovery interval_secs must be positive");
    if (security.require_authentication && !security.enable_encryption)
        throw std::system_error(errc::invalid_config, "require_authentication needs enable_encryption");
    if (transfer.chunk_size == 0 || transfer.window == 0)
        throw std::system_error(errc::invalid_config, "transfer chunk_size and window must be positive");
    if (stream.high_water == 0 || stream.high_water > stream.max_queue_depth)
        throw std::system_error(errc::invalid_config, "stream high_water must be within (0, max_queue_depth]");
}

json EngineConfig::to_json() const {
    return json{
        {"identity", {
            {"device_name", identity.device_name},
            {"user_name", identity.user_name},
            {"identity_path", identity.identity_path},
        }},
        {"discovery", {
            {"enable_mdns", discovery.enable_mdns},
            {"enable_udp", discovery.enable_udp},
            {"enable_bluetooth", discovery.enable_bluetooth},
            {"interval_secs", to_secs(discovery.interval)},
            {"timeout_secs", to_secs(discovery.timeout)},
            {"udp_port", discovery.udp_port},
            {"peer_expiry_secs", to_secs(discovery.peer_expiry)},
        }},
        {"security", {
            {"enable_encryption", security.enable_encryption},
            {"require_authentication", security.require_authentication},
            {"trust_mode", to_string(security.trust_mode)},
            {"allowlist", security.allowlist},
            {"blocklist", security.blocklist},
            {"trust_store_path", security.trust_store_path},
            {"approval_timeout_secs", to_secs(security.approval_timeout)},
        }},
        {"networking", {
            {"listen_port", networking.listen_port},
            {"enable_ipv6", networking.enable_ipv6},
            {"enable_quic", networking.enable_quic},
            {"enable_webrtc", networking.enable_webrtc},
            {"enable_websocket", networking.enable_websocket},
            {"enable_tcp", networking.enable_tcp},
            {"connection_timeout_secs", to_secs(networking.connection_timeout)},
            {"keepalive_interval_secs", to_secs(networking.keepalive_interval)},
            {"keepalive_misses", networking.keepalive_misses},
        }},
        {"transfer", {
            {"download_dir", transfer.download_dir},
            {"chunk_size", transfer.chunk_size},
            {"window", transfer.window},
            {"ack_timeout_ms", transfer.ack_timeout.count()},
            {"max_chunk_retries", transfer.max_chunk_retries},
            {"retry_backoff_ms", transfer.retry_backoff.count()},
            {"retention_secs", to_secs(transfer.retention)},
            {"complete_timeout_secs", to_secs(transfer.complete_timeout)},
            {"resume_window_secs", to_secs(transfer.resume_window)},
            {"auto_resume", transfer.auto_resume},
        }},
        {"stream", {
            {"max_queue_depth", stream.max_queue_depth},
            {"high_water", stream.high_water},
            {"congestion_ticks", stream.congestion_ticks},
            {"degrade_step", stream.degrade_step},
            {"min_quality", stream.min_quality},
            {"recover_ticks", stream.recover_ticks},
            {"retention_secs", to_secs(stream.retention)},
        }},
        {"logging", {
            {"level", logging.level},
            {"pattern", logging.pattern},
            {"file", logging.file},
        }},
        {"runtime", {
            {"worker_threads", runtime.worker_threads},
            {"shutdown_grace_ms", runtime.shutdown_grace.count()},
        }},
    };
}

EngineConfig load_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        throw std::system_error(errc::invalid_config, "cannot open config file: " + path);

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded())
        throw std::system_error(errc::invalid_config, "malformed JSON in " + path);
    return EngineConfig::from_json(j);
}

} // namespace kizuna
