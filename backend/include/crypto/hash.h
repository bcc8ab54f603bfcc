#pragma once

#include <optional>
#include <string>

#include <sodium.h>

#include "common/types.h"

namespace kizuna {

/// Incremental SHA-256 (libsodium crypto_hash_sha256).
class Sha256 {
public:
    Sha256();

    void update(const uint8_t* data, std::size_t size);
    void update(const Bytes& data) { update(data.data(), data.size()); }

    /// Finish and return the 32-byte digest. The object must not be reused.
    Bytes finish();

private:
    crypto_hash_sha256_state state_;
};

Bytes sha256(const Bytes& data);
Bytes sha256(const std::string& data);

std::string to_hex(const Bytes& data);
std::optional<Bytes> from_hex(const std::string& hex);

/// Checksum of a whole file as lowercase hex, or nullopt when unreadable.
std::optional<std::string> file_sha256(const std::string& path);

} // namespace kizuna
