#pragma once

#include <memory>
#include <string>
#include <system_error>

#include "common/types.h"
#include "crypto/crypto_manager.h"

namespace kizuna {

/**
 * This device's identity: an Ed25519 key pair plus human-readable names.
 *
 * Created once when the engine initialises and never mutated afterwards.
 */
class Identity {
public:
    /// Load keys from `path`, or generate and persist them. Empty path keeps keys in memory.
    /// An existing file that cannot be loaded is left untouched and yields io_error.
    static std::unique_ptr<Identity> load_or_create(const std::string& path,
                                                    std::string device_name,
                                                    std::string user_name,
                                                    std::error_code& ec);

    /// Peer id derived from a signing public key.
    static PeerId peer_id_for(const Bytes& signing_public_key);

    [[nodiscard]] const PeerId& peer_id() const { return peer_id_; }
    [[nodiscard]] const std::string& device_name() const { return device_name_; }
    [[nodiscard]] const std::string& user_name() const { return user_name_; }
    [[nodiscard]] const Bytes& signing_public_key() const { return crypto_.signing_public_key(); }
    [[nodiscard]] bool persisted() const { return persisted_; }

    Bytes sign(const Bytes& message) const { return crypto_.sign(message); }

private:
    Identity(std::string device_name, std::string user_name);

    CryptoManager crypto_;
    PeerId peer_id_;
    std::string device_name_;
    std::string user_name_;
    bool persisted_ = false;
};

} // namespace kizuna
