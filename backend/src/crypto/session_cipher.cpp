/**
 * SessionCipher: per-direction AEAD with counter nonces.
 *
 * Each side counts the frames it has opened, so a replayed or
 * reordered frame fails to decrypt.
 */

#include "crypto/session_cipher.h"

#include <sodium.h>

namespace kizuna {

namespace {

void counter_nonce(uint64_t counter, unsigned char* nonce) {
    sodium_memzero(nonce, crypto_aead_xchacha20poly1305_ietf_NPUBBYTES);
    for (int i = 0; i < 8; ++i)
        nonce[i] = static_cast<unsigned char>(counter >> (8 * i));
}

} // namespace

SessionCipher::SessionCipher(SessionKeys keys)
    : keys_(std::move(keys)) {}

SessionCipher::~SessionCipher() {
    sodium_memzero(keys_.rx.data(), keys_.rx.size());
    sodium_memzero(keys_.tx.data(), keys_.tx.size());
}

Bytes SessionCipher::seal(const Bytes& plaintext) {
    unsigned char nonce[crypto_aead_xchacha20poly1305_ietf_NPUBBYTES];
    counter_nonce(tx_counter_++, nonce);

    Bytes out(plaintext.size() + crypto_aead_xchacha20poly1305_ietf_ABYTES);
    unsigned long long written = 0;
    crypto_aead_xchacha20poly1305_ietf_encrypt(out.data(), &written,
                                               plaintext.data(), plaintext.size(),
                                               nullptr, 0, nullptr,
                                               nonce, keys_.tx.data());
    out.resize(static_cast<std::size_t>(written));
    return out;
}

std::optional<Bytes> SessionCipher::open(const Bytes& ciphertext) {
    if (ciphertext.size() < crypto_aead_xchacha20poly1305_ietf_ABYTES)
        return std::nullopt;

    unsigned char nonce[crypto_aead_xchacha20poly1305_ietf_NPUBBYTES];
    counter_nonce(rx_counter_, nonce);

    Bytes out(ciphertext.size() - crypto_aead_xchacha20poly1305_ietf_ABYTES);
    unsigned long long written = 0;
    if (crypto_aead_xchacha20poly1305_ietf_decrypt(out.data(), &written, nullptr,
                                                   ciphertext.data(), ciphertext.size(),
                                                   nullptr, 0,
                                                   nonce, keys_.rx.data()) != 0)
        return std::nullopt;

    ++rx_counter_;
    out.resize(static_cast<std::size_t>(written));
    return out;
}

} // namespace kizuna
