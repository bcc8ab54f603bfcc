/**
 * TrustStore: persistent trust decisions as a JSON file.
 */

#include "security/trust_store.h"

#include <chrono>
#include <filesystem>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/error.h"

namespace kizuna {

using json = nlohmann::json;

namespace {

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

const char* level_name(TrustLevel level) {
    return level == TrustLevel::trusted ? "trusted" : "allowlisted";
}

} // namespace

TrustStore::TrustStore(std::string path)
    : path_(std::move(path)) {}

std::error_code TrustStore::load() {
    if (path_.empty() || !std::filesystem::exists(path_))
        return {};

    std::ifstream file(path_);
    if (!file.is_open())
        return errc::io_error;

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        spdlog::warn("Trust: trust store {} is malformed, ignoring it", path_);
        return errc::invalid_config;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    blocked_.clear();
    try {
        for (const auto& item : j.value("peers", json::array())) {
            TrustEntry entry;
            entry.peer_id = item.at("peer_id").get<std::string>();
            entry.nickname = item.value("nickname", std::string{});
            entry.level = item.value("level", std::string{"trusted"}) == "allowlisted"
                ? TrustLevel::allowlisted : TrustLevel::trusted;
            entry.first_seen = item.value("first_seen", int64_t{0});
            entry.last_seen = item.value("last_seen", int64_t{0});
            entries_[entry.peer_id] = entry;
        }
        for (const auto& id : j.value("blocked", json::array()))
            blocked_.insert(id.get<std::string>());
    } catch (const json::exception& e) {
        spdlog::warn("Trust: trust store {} has invalid entries: {}", path_, e.what());
        return errc::invalid_config;
    }
    return {};
}

std::error_code TrustStore::save() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return save_locked();
}

std::error_code TrustStore::save_locked() const {
    if (path_.empty())
        return {};

    json peers = json::array();
    for (const auto& [id, entry] : entries_) {
        peers.push_back({
            {"peer_id", id},
            {"nickname", entry.nickname},
            {"level", level_name(entry.level)},
            {"first_seen", entry.first_seen},
            {"last_seen", entry.last_seen},
        });
    }
    json j = {{"version", 1}, {"peers", peers}, {"blocked", blocked_}};

    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent, ec);

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open())
        return errc::io_error;
    file << j.dump(2);
    return file ? std::error_code{} : make_error_code(errc::io_error);
}

void TrustStore::persist_locked() const {
    if (auto ec = save_locked())
        spdlog::warn("Trust: failed to write trust store {}: {}", path_, ec.message());
}

void TrustStore::trust(const PeerId& peer, const std::string& nickname) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = unix_now();
    auto& entry = entries_[peer];
    if (entry.peer_id.empty()) {
        entry.peer_id = peer;
        entry.first_seen = now;
    }
    if (!nickname.empty())
        entry.nickname = nickname;
    entry.level = TrustLevel::trusted;
    entry.last_seen = now;
    blocked_.erase(peer);
    persist_locked();
}

void TrustStore::allowlist(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(peer);
    if (it != entries_.end())
        return;
    TrustEntry entry;
    entry.peer_id = peer;
    entry.level = TrustLevel::allowlisted;
    entry.first_seen = unix_now();
    entries_.emplace(peer, entry);
    persist_locked();
}

void TrustStore::block(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blocked_.insert(peer).second)
        persist_locked();
}

void TrustStore::unblock(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (blocked_.erase(peer) != 0)
        persist_locked();
}

void TrustStore::forget(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(peer) != 0)
        persist_locked();
}

void TrustStore::touch(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(peer);
    if (it == entries_.end())
        return;
    it->second.last_seen = unix_now();
    persist_locked();
}

bool TrustStore::is_blocked(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocked_.count(peer) != 0;
}

bool TrustStore::is_known(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(peer) != 0;
}

std::optional<TrustEntry> TrustStore::entry(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(peer);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

std::vector<TrustEntry> TrustStore::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<TrustEntry> out;
    out.reserve(entries_.size());
    for (const auto& [id, entry] : entries_)
        out.push_back(entry);
    return out;
}

std::vector<PeerId> TrustStore::blocked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {blocked_.begin(), blocked_.end()};
}

} // namespace kizuna
