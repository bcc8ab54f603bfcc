/**
 * SHA-256 helpers over libsodium.
 */

#include "crypto/hash.h"

#include <fstream>

namespace kizuna {

Sha256::Sha256() {
    crypto_hash_sha256_init(&state_);
}

void Sha256::update(const uint8_t* data, std::size_t size) {
    crypto_hash_sha256_update(&state_, data, size);
}

Bytes Sha256::finish() {
    Bytes digest(crypto_hash_sha256_BYTES);
    crypto_hash_sha256_final(&state_, digest.data());
    return digest;
}

Bytes sha256(const Bytes& data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finish();
}

Bytes sha256(const std::string& data) {
    Sha256 hasher;
    hasher.update(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    return hasher.finish();
}

std::string to_hex(const Bytes& data) {
    std::string hex(data.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data.data(), data.size());
    hex.resize(data.size() * 2);
    return hex;
}

std::optional<Bytes> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0)
        return std::nullopt;

    Bytes out(hex.size() / 2);
    std::size_t written = 0;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(),
                       nullptr, &written, nullptr) != 0 || written != out.size())
        return std::nullopt;
    return out;
}

std::optional<std::string> file_sha256(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open())
        return std::nullopt;

    Sha256 hasher;
    std::vector<char> buffer(64 * 1024);
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto n = file.gcount();
        if (n > 0)
            hasher.update(reinterpret_cast<const uint8_t*>(buffer.data()), static_cast<std::size_t>(n));
    }
    if (file.bad())
        return std::nullopt;
    return to_hex(hasher.finish());
}

} // namespace kizuna
