#pragma once

#include <optional>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "common/types.h"
#include "crypto/crypto_manager.h"
#include "security/identity.h"

namespace kizuna {

/// Protection of session traffic. The remote identity is verified at either level.
enum class SecurityLevel {
    plaintext,       // frames neither encrypted nor authenticated
    authenticated,   // frames sealed with the negotiated session keys
};

const char* to_string(SecurityLevel level);

struct HandshakeOptions {
    bool encryption = true;
    bool require_authentication = true;   // refuse plaintext sessions
};

/// Outcome of a completed handshake, from the local side's point of view.
struct HandshakeResult {
    PeerId peer_id;
    std::string name;
    std::string user_name;
    std::string session_id;
    SecurityLevel security = SecurityLevel::plaintext;
    bool verified = false;                // remote signed the transcript with the key behind peer_id
    std::optional<SessionKeys> keys;
};

/**
 * Initiator half of the session handshake:
 *   hello -> hello_ack -> finish -> verdict
 *
 * Both sides always sign the transcript of both hellos with their identity
 * key, whatever the encryption settings; a peer id is only accepted when it
 * is the hash of the key that signed.
 */
class HandshakeInitiator {
public:
    HandshakeInitiator(const Identity& identity, HandshakeOptions options, PeerId expected_peer);

    nlohmann::json hello();

    /// Verify the responder and produce the finish message.
    std::error_code on_hello_ack(const nlohmann::json& message, nlohmann::json& finish);

    /// Map the responder's verdict to success or the reported failure.
    std::error_code on_verdict(const nlohmann::json& message);

    /// The responder refused because its own attempt to us wins the tie.
    static bool is_duplicate(const nlohmann::json& verdict);

    [[nodiscard]] const HandshakeResult& result() const { return result_; }

private:
    const Identity& identity_;
    HandshakeOptions options_;
    PeerId expected_peer_;
    KxKeyPair kx_;
    Bytes nonce_;
    Bytes transcript_;
    HandshakeResult result_;
};

/// Responder half; trust is decided by the caller between on_finish and verdict.
class HandshakeResponder {
public:
    HandshakeResponder(const Identity& identity, HandshakeOptions options);

    std::error_code on_hello(const nlohmann::json& message, nlohmann::json& hello_ack);
    std::error_code on_finish(const nlohmann::json& message);

    /// Verdict message carrying the local decision; success accepts.
    static nlohmann::json verdict(std::error_code decision);

    /// Refusal sent when both sides dialled each other and ours should survive.
    static nlohmann::json duplicate_verdict();

    [[nodiscard]] const HandshakeResult& result() const { return result_; }

private:
    const Identity& identity_;
    HandshakeOptions options_;
    KxKeyPair kx_;
    Bytes remote_signing_key_;
    Bytes transcript_;
    HandshakeResult result_;
};

} // namespace kizuna
