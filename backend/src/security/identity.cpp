/**
 * Identity: the device key pair and its on-disk form.
 */

#include "security/identity.h"

#include <filesystem>

#include <spdlog/spdlog.h>

#include "common/error.h"
#include "crypto/hash.h"

namespace kizuna {

Identity::Identity(std::string device_name, std::string user_name)
    : device_name_(std::move(device_name))
    , user_name_(std::move(user_name)) {}

std::unique_ptr<Identity> Identity::load_or_create(const std::string& path,
                                                   std::string device_name,
                                                   std::string user_name,
                                                   std::error_code& ec) {
    ec = {};
    std::unique_ptr<Identity> identity(new Identity(std::move(device_name), std::move(user_name)));

    if (!path.empty() && std::filesystem::exists(path)) {
        if (!identity->crypto_.load_keypair(path)) {
            spdlog::error("Trust: identity file {} is unreadable", path);
            ec = errc::io_error;
            return nullptr;
        }
        identity->persisted_ = true;
    }

    if (!identity->crypto_.has_keypair()) {
        identity->crypto_.generate_keypair();
        if (!path.empty()) {
            std::error_code ec;
            auto parent = std::filesystem::path(path).parent_path();
            if (!parent.empty())
                std::filesystem::create_directories(parent, ec);
            identity->persisted_ = identity->crypto_.save_keypair(path);
            if (!identity->persisted_)
                spdlog::warn("Trust: could not persist identity to {}", path);
        }
    }

    identity->peer_id_ = peer_id_for(identity->crypto_.signing_public_key());
    spdlog::info("Trust: local identity {} ({})", identity->peer_id_.substr(0, 16), identity->device_name_);
    return identity;
}

PeerId Identity::peer_id_for(const Bytes& signing_public_key) {
    return to_hex(sha256(signing_public_key));
}

} // namespace kizuna
