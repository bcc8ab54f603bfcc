#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "common/types.h"

namespace kizuna {

/// Ephemeral X25519 key pair used for one handshake.
struct KxKeyPair {
    Bytes public_key;
    Bytes secret_key;
};

/// Directional session keys derived from a key exchange.
struct SessionKeys {
    Bytes rx;
    Bytes tx;
};

/**
 * Wraps libsodium for identity keys, signing, and key exchange.
 *
 * Identity:      Ed25519 (crypto_sign_keypair / crypto_sign_detached)
 * Key exchange:  X25519  (crypto_kx_keypair / crypto_kx_*_session_keys)
 */
class CryptoManager {
public:
    CryptoManager() = default;
    ~CryptoManager();

    CryptoManager(const CryptoManager&) = delete;
    CryptoManager& operator=(const CryptoManager&) = delete;

    /// Must be called once before any other method.
    static bool init();

    /// Generate a fresh Ed25519 key pair.
    void generate_keypair();

    /// Persist keys to disk (JSON, hex encoded).
    bool save_keypair(const std::string& path) const;

    /// Load keys from disk. Fails on missing file or malformed keys.
    bool load_keypair(const std::string& path);

    /// Detached Ed25519 signature over a message.
    Bytes sign(const Bytes& message) const;

    /// Verify an Ed25519 signature.
    static bool verify(const Bytes& message,
                       const Bytes& signature,
                       const Bytes& signing_public_key);

    static KxKeyPair generate_kx_keypair();

    /// Derive session keys; the initiator is the crypto_kx "client".
    static bool derive_session_keys(bool initiator,
                                    const KxKeyPair& local,
                                    const Bytes& remote_public_key,
                                    SessionKeys& out);

    [[nodiscard]] bool has_keypair() const { return !signing_secret_key_.empty(); }
    [[nodiscard]] const Bytes& signing_public_key() const { return signing_public_key_; }

private:
    Bytes signing_public_key_;  // Ed25519
    Bytes signing_secret_key_;  // Ed25519
};

} // namespace kizuna
