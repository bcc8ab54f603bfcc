#pragma once

#include <cstdint>
#include <optional>

#include "common/types.h"
#include "crypto/crypto_manager.h"

namespace kizuna {

/**
 * XChaCha20-Poly1305 framing for one established session.
 *
 * Each direction has its own key and a counter nonce; a frame is accepted
 * only with the next expected counter, so reordered or replayed frames fail.
 */
class SessionCipher {
public:
    explicit SessionCipher(SessionKeys keys);
    ~SessionCipher();

    SessionCipher(const SessionCipher&) = delete;
    SessionCipher& operator=(const SessionCipher&) = delete;

    Bytes seal(const Bytes& plaintext);
    std::optional<Bytes> open(const Bytes& ciphertext);

private:
    SessionKeys keys_;
    uint64_t tx_counter_ = 0;
    uint64_t rx_counter_ = 0;
};

} // namespace kizuna
