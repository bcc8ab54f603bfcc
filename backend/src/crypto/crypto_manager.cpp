/**
 * CryptoManager — Handles all libsodium identity and key-exchange operations.
 *
 * - Ed25519 key generation, persistence, signing and verification
 * - X25519 ephemeral key exchange for per-session keys
 */

#include "crypto/crypto_manager.h"

#include <fstream>

#include <nlohmann/json.hpp>
#include <sodium.h>
#include <spdlog/spdlog.h>

#include "crypto/hash.h"

namespace kizuna {

using json = nlohmann::json;

CryptoManager::~CryptoManager() {
    if (!signing_secret_key_.empty())
        sodium_memzero(signing_secret_key_.data(), signing_secret_key_.size());
}

bool CryptoManager::init() {
    return sodium_init() >= 0;
}

void CryptoManager::generate_keypair() {
    signing_public_key_.assign(crypto_sign_PUBLICKEYBYTES, 0);
    signing_secret_key_.assign(crypto_sign_SECRETKEYBYTES, 0);
    crypto_sign_keypair(signing_public_key_.data(), signing_secret_key_.data());
}

bool CryptoManager::save_keypair(const std::string& path) const {
    if (!has_keypair())
        return false;

    json j = {
        {"version", 1},
        {"sign_pk", to_hex(signing_public_key_)},
        {"sign_sk", to_hex(signing_secret_key_)},
    };

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        spdlog::error("Trust: cannot write key file {}", path);
        return false;
    }
    file << j.dump(2);
    return static_cast<bool>(file);
}

bool CryptoManager::load_keypair(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open())
        return false;

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return false;

    auto pk = from_hex(j.value("sign_pk", std::string{}));
    auto sk = from_hex(j.value("sign_sk", std::string{}));
    if (!pk || !sk || pk->size() != crypto_sign_PUBLICKEYBYTES || sk->size() != crypto_sign_SECRETKEYBYTES)
        return false;

    // The public half is embedded in the Ed25519 secret key; reject mismatched files.
    Bytes embedded(crypto_sign_PUBLICKEYBYTES);
    crypto_sign_ed25519_sk_to_pk(embedded.data(), sk->data());
    if (embedded != *pk)
        return false;

    signing_public_key_ = std::move(*pk);
    signing_secret_key_ = std::move(*sk);
    return true;
}

Bytes CryptoManager::sign(const Bytes& message) const {
    Bytes signature(crypto_sign_BYTES);
    crypto_sign_detached(signature.data(), nullptr,
                         message.data(), message.size(),
                         signing_secret_key_.data());
    return signature;
}

bool CryptoManager::verify(const Bytes& message,
                           const Bytes& signature,
                           const Bytes& signing_public_key) {
    if (signature.size() != crypto_sign_BYTES || signing_public_key.size() != crypto_sign_PUBLICKEYBYTES)
        return false;
    return crypto_sign_verify_detached(signature.data(),
                                       message.data(), message.size(),
                                       signing_public_key.data()) == 0;
}

KxKeyPair CryptoManager::generate_kx_keypair() {
    KxKeyPair pair;
    pair.public_key.assign(crypto_kx_PUBLICKEYBYTES, 0);
    pair.secret_key.assign(crypto_kx_SECRETKEYBYTES, 0);
    crypto_kx_keypair(pair.public_key.data(), pair.secret_key.data());
    return pair;
}

bool CryptoManager::derive_session_keys(bool initiator,
                                        const KxKeyPair& local,
                                        const Bytes& remote_public_key,
                                        SessionKeys& out) {
    if (remote_public_key.size() != crypto_kx_PUBLICKEYBYTES)
        return false;

    out.rx.assign(crypto_kx_SESSIONKEYBYTES, 0);
    out.tx.assign(crypto_kx_SESSIONKEYBYTES, 0);

    int rc = initiator
        ? crypto_kx_client_session_keys(out.rx.data(), out.tx.data(),
                                        local.public_key.data(), local.secret_key.data(),
                                        remote_public_key.data())
        : crypto_kx_server_session_keys(out.rx.data(), out.tx.data(),
                                        local.public_key.data(), local.secret_key.data(),
                                        remote_public_key.data());
    return rc == 0;
}

} // namespace kizuna
