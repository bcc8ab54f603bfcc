/**
 * Handshake: mutual authentication and session key agreement.
 *
 * Both sides sign the transcript with their identity key. Session keys
 * come from an X25519 exchange when encryption is enabled.
 */

#include "security/handshake.h"

#include <sodium.h>
#include <spdlog/spdlog.h>

#include "common/error.h"
#include "common/wire.h"
#include "crypto/hash.h"

namespace kizuna {

using json = nlohmann::json;

namespace {

constexpr const char* kHandshakeChannel = "hs";
constexpr std::size_t kNonceSize = 32;

struct HelloFields {
    PeerId id;
    std::string name;
    std::string user;
    Bytes sign_pk;
    Bytes kx_pk;
    Bytes nonce;
    bool encryption = false;
};

Bytes random_bytes(std::size_t n) {
    Bytes out(n);
    randombytes_buf(out.data(), out.size());
    return out;
}

void append_field(Bytes& out, const Bytes& field) {
    auto header = wire::encode_header(static_cast<std::uint32_t>(field.size()));
    out.insert(out.end(), header.begin(), header.end());
    out.insert(out.end(), field.begin(), field.end());
}

void append_field(Bytes& out, const std::string& field) {
    append_field(out, Bytes(field.begin(), field.end()));
}

Bytes build_transcript(const HelloFields& initiator, const HelloFields& responder, bool encryption) {
    Bytes t;
    append_field(t, std::string("kizuna-handshake-v1"));
    for (const auto* side : {&initiator, &responder}) {
        append_field(t, side->id);
        append_field(t, side->sign_pk);
        append_field(t, side->kx_pk);
        append_field(t, side->nonce);
    }
    t.push_back(encryption ? 1 : 0);
    return t;
}

Bytes with_role(const Bytes& transcript, const char* role) {
    Bytes out = transcript;
    out.insert(out.end(), role, role + std::char_traits<char>::length(role));
    return out;
}

std::string session_id_for(const Bytes& transcript) {
    auto digest = sha256(transcript);
    digest.resize(16);
    return to_hex(digest);
}

std::optional<Bytes> binary_field(const json& message, const char* key, std::size_t expected_size) {
    auto it = message.find(key);
    if (it == message.end() || !it->is_binary())
        return std::nullopt;
    const auto& bin = it->get_binary();
    Bytes out(bin.begin(), bin.end());
    if (expected_size != 0 && out.size() != expected_size)
        return std::nullopt;
    return out;
}

std::optional<HelloFields> parse_hello(const json& message, const char* type) {
    if (message.value("ch", std::string{}) != kHandshakeChannel || message.value("t", std::string{}) != type)
        return std::nullopt;
    if (message.value("proto", std::string{}) != "kizuna" || message.value("v", 0) < wire::kProtocolVersion)
        return std::nullopt;

    HelloFields hello;
    hello.id = message.value("id", std::string{});
    hello.name = message.value("name", std::string{});
    hello.user = message.value("user", std::string{});
    hello.encryption = message.value("enc", false);

    auto sign_pk = binary_field(message, "sign_pk", crypto_sign_PUBLICKEYBYTES);
    auto kx_pk = binary_field(message, "kx_pk", crypto_kx_PUBLICKEYBYTES);
    auto nonce = binary_field(message, "nonce", kNonceSize);
    if (hello.id.empty() || !sign_pk || !kx_pk || !nonce)
        return std::nullopt;

    hello.sign_pk = std::move(*sign_pk);
    hello.kx_pk = std::move(*kx_pk);
    hello.nonce = std::move(*nonce);
    return hello;
}

json make_hello(const char* type, const HelloFields& fields) {
    json message = wire::make_message(kHandshakeChannel, type);
    message["proto"] = "kizuna";
    message["v"] = wire::kProtocolVersion;
    message["id"] = fields.id;
    message["name"] = fields.name;
    message["user"] = fields.user;
    message["sign_pk"] = json::binary(fields.sign_pk);
    message["kx_pk"] = json::binary(fields.kx_pk);
    message["nonce"] = json::binary(fields.nonce);
    message["enc"] = fields.encryption;
    return message;
}

HelloFields local_fields(const Identity& identity, const KxKeyPair& kx, const Bytes& nonce, bool encryption) {
    HelloFields fields;
    fields.id = identity.peer_id();
    fields.name = identity.device_name();
    fields.user = identity.user_name();
    fields.sign_pk = identity.signing_public_key();
    fields.kx_pk = kx.public_key;
    fields.nonce = nonce;
    fields.encryption = encryption;
    return fields;
}

SecurityLevel level_for(bool encryption) {
    return encryption ? SecurityLevel::authenticated : SecurityLevel::plaintext;
}

std::error_code reason_to_error(const std::string& reason) {
    if (reason == "trust_denied")
        return errc::trust_denied;
    if (reason == "approval_timeout")
        return errc::approval_timeout;
    if (reason == "cancelled")
        return errc::cancelled;
    return errc::handshake_failed;
}

} // namespace

const char* to_string(SecurityLevel level) {
    switch (level) {
    case SecurityLevel::plaintext:     return "plaintext";
    case SecurityLevel::authenticated: return "authenticated";
    }
    return "plaintext";
}

// ── Initiator ───────────────────────────────────────────────────────────────

HandshakeInitiator::HandshakeInitiator(const Identity& identity, HandshakeOptions options, PeerId expected_peer)
    : identity_(identity)
    , options_(options)
    , expected_peer_(std::move(expected_peer))
    , kx_(CryptoManager::generate_kx_keypair())
    , nonce_(random_bytes(kNonceSize)) {}

json HandshakeInitiator::hello() {
    return make_hello("hello", local_fields(identity_, kx_, nonce_, options_.encryption));
}

std::error_code HandshakeInitiator::on_hello_ack(const json& message, json& finish) {
    auto remote = parse_hello(message, "hello_ack");
    if (!remote)
        return errc::protocol_error;

    if (remote->id != Identity::peer_id_for(remote->sign_pk)) {
        spdlog::warn("Connection: responder id does not match its signing key");
        return errc::handshake_failed;
    }
    if (!expected_peer_.empty() && remote->id != expected_peer_) {
        spdlog::warn("Connection: expected peer {} but {} answered", expected_peer_.substr(0, 16), remote->id.substr(0, 16));
        return errc::handshake_failed;
    }
    if (remote->encryption && !options_.encryption)
        return errc::protocol_error;
    if (options_.require_authentication && !remote->encryption)
        return errc::handshake_failed;

    auto local = local_fields(identity_, kx_, nonce_, options_.encryption);
    transcript_ = build_transcript(local, *remote, remote->encryption);

    // The claimed id is only worth anything once the key behind it has signed.
    auto sig = binary_field(message, "sig", crypto_sign_BYTES);
    if (!sig || !CryptoManager::verify(with_role(transcript_, "responder"), *sig, remote->sign_pk)) {
        spdlog::warn("Connection: responder signature rejected for {}", remote->id.substr(0, 16));
        return errc::handshake_failed;
    }

    if (remote->encryption) {
        SessionKeys keys;
        if (!CryptoManager::derive_session_keys(true, kx_, remote->kx_pk, keys))
            return errc::handshake_failed;
        result_.keys = std::move(keys);
    }

    result_.peer_id = remote->id;
    result_.name = remote->name;
    result_.user_name = remote->user;
    result_.session_id = session_id_for(transcript_);
    result_.verified = true;
    result_.security = level_for(remote->encryption);

    finish = wire::make_message(kHandshakeChannel, "finish");
    finish["sig"] = json::binary(identity_.sign(with_role(transcript_, "initiator")));
    return {};
}

std::error_code HandshakeInitiator::on_verdict(const json& message) {
    if (message.value("ch", std::string{}) != kHandshakeChannel || message.value("t", std::string{}) != "verdict")
        return errc::protocol_error;
    if (message.value("ok", false))
        return {};
    return reason_to_error(message.value("reason", std::string{}));
}

bool HandshakeInitiator::is_duplicate(const json& verdict) {
    return !verdict.value("ok", false) && verdict.value("reason", std::string{}) == "duplicate";
}

// ── Responder ───────────────────────────────────────────────────────────────

HandshakeResponder::HandshakeResponder(const Identity& identity, HandshakeOptions options)
    : identity_(identity)
    , options_(options)
    , kx_(CryptoManager::generate_kx_keypair()) {}

std::error_code HandshakeResponder::on_hello(const json& message, json& hello_ack) {
    auto remote = parse_hello(message, "hello");
    if (!remote)
        return errc::protocol_error;

    if (remote->id != Identity::peer_id_for(remote->sign_pk)) {
        spdlog::warn("Connection: initiator id does not match its signing key");
        return errc::handshake_failed;
    }

    bool encryption = options_.encryption && remote->encryption;
    if (options_.require_authentication && !encryption)
        return errc::handshake_failed;

    auto local = local_fields(identity_, kx_, random_bytes(kNonceSize), encryption);
    transcript_ = build_transcript(*remote, local, encryption);

    if (encryption) {
        SessionKeys keys;
        if (!CryptoManager::derive_session_keys(false, kx_, remote->kx_pk, keys))
            return errc::handshake_failed;
        result_.keys = std::move(keys);
    }

    remote_signing_key_ = remote->sign_pk;
    result_.peer_id = remote->id;
    result_.name = remote->name;
    result_.user_name = remote->user;
    result_.session_id = session_id_for(transcript_);

    hello_ack = make_hello("hello_ack", local);
    hello_ack["sig"] = json::binary(identity_.sign(with_role(transcript_, "responder")));
    return {};
}

std::error_code HandshakeResponder::on_finish(const json& message) {
    if (message.value("ch", std::string{}) != kHandshakeChannel || message.value("t", std::string{}) != "finish")
        return errc::protocol_error;

    auto sig = binary_field(message, "sig", crypto_sign_BYTES);
    if (!sig || !CryptoManager::verify(with_role(transcript_, "initiator"), *sig, remote_signing_key_)) {
        spdlog::warn("Connection: initiator signature rejected for {}", result_.peer_id.substr(0, 16));
        return errc::handshake_failed;
    }
    result_.verified = true;
    result_.security = level_for(result_.keys.has_value());
    return {};
}

json HandshakeResponder::verdict(std::error_code decision) {
    json message = wire::make_message(kHandshakeChannel, "verdict");
    message["ok"] = !decision;
    if (decision) {
        if (decision == errc::trust_denied)
            message["reason"] = "trust_denied";
        else if (decision == errc::approval_timeout)
            message["reason"] = "approval_timeout";
        else if (decision == errc::cancelled)
            message["reason"] = "cancelled";
        else
            message["reason"] = "handshake_failed";
    }
    return message;
}

json HandshakeResponder::duplicate_verdict() {
    json message = wire::make_message(kHandshakeChannel, "verdict");
    message["ok"] = false;
    message["reason"] = "duplicate";
    return message;
}

} // namespace kizuna
