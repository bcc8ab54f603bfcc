#include <doctest/doctest.h>

#include "common/error.h"
#include "crypto/session_cipher.h"
#include "security/handshake.h"
#include "security/identity.h"

using namespace kizuna;
using json = nlohmann::json;

namespace {

struct Pair {
    Pair() {
        REQUIRE(CryptoManager::init());
        std::error_code ec;
        alice = Identity::load_or_create("", "alice-laptop", "alice", ec);
        REQUIRE_FALSE(ec);
        bob = Identity::load_or_create("", "bob-desktop", "bob", ec);
        REQUIRE_FALSE(ec);
    }

    std::unique_ptr<Identity> alice;
    std::unique_ptr<Identity> bob;
};

} // namespace

TEST_CASE("handshake authenticates both sides") {
    Pair ids;
    HandshakeInitiator initiator(*ids.alice, HandshakeOptions{}, ids.bob->peer_id());
    HandshakeResponder responder(*ids.bob, HandshakeOptions{});

    json ack;
    REQUIRE_FALSE(responder.on_hello(initiator.hello(), ack));
    json finish;
    REQUIRE_FALSE(initiator.on_hello_ack(ack, finish));
    REQUIRE_FALSE(responder.on_finish(finish));
    CHECK_FALSE(initiator.on_verdict(HandshakeResponder::verdict({})));

    const auto& mine = initiator.result();
    const auto& theirs = responder.result();
    CHECK(mine.peer_id == ids.bob->peer_id());
    CHECK(theirs.peer_id == ids.alice->peer_id());
    CHECK(mine.name == "bob-desktop");
    CHECK(theirs.user_name == "alice");
    CHECK(mine.session_id == theirs.session_id);
    CHECK(mine.security == SecurityLevel::authenticated);
    CHECK(theirs.security == SecurityLevel::authenticated);
    REQUIRE(mine.keys);
    REQUIRE(theirs.keys);

    SessionCipher sender(*mine.keys);
    SessionCipher receiver(*theirs.keys);
    Bytes plain{'h', 'i'};
    auto sealed = sender.seal(plain);
    auto opened = receiver.open(sealed);
    REQUIRE(opened);
    CHECK(*opened == plain);
    CHECK_FALSE(receiver.open(sealed));   // replay
}

TEST_CASE("tampered responder signature is rejected") {
    Pair ids;
    HandshakeInitiator initiator(*ids.alice, HandshakeOptions{}, ids.bob->peer_id());
    HandshakeResponder responder(*ids.bob, HandshakeOptions{});

    json ack;
    REQUIRE_FALSE(responder.on_hello(initiator.hello(), ack));
    ack["sig"].get_binary()[0] ^= 0x01;

    json finish;
    CHECK(initiator.on_hello_ack(ack, finish) == errc::handshake_failed);
}

TEST_CASE("tampered initiator signature is rejected") {
    Pair ids;
    HandshakeInitiator initiator(*ids.alice, HandshakeOptions{}, ids.bob->peer_id());
    HandshakeResponder responder(*ids.bob, HandshakeOptions{});

    json ack;
    REQUIRE_FALSE(responder.on_hello(initiator.hello(), ack));
    json finish;
    REQUIRE_FALSE(initiator.on_hello_ack(ack, finish));
    finish["sig"].get_binary()[5] ^= 0x80;
    CHECK(responder.on_finish(finish) == errc::handshake_failed);
}

TEST_CASE("a claimed id must match the signing key") {
    Pair ids;
    std::error_code ec;
    auto mallory = Identity::load_or_create("", "mallory", "mallory", ec);
    REQUIRE(mallory);

    SUBCASE("spoofed initiator") {
        HandshakeInitiator initiator(*mallory, HandshakeOptions{}, ids.bob->peer_id());
        HandshakeResponder responder(*ids.bob, HandshakeOptions{});
        auto hello = initiator.hello();
        hello["id"] = ids.alice->peer_id();
        json ack;
        CHECK(responder.on_hello(hello, ack) == errc::handshake_failed);
    }

    SUBCASE("someone else answers") {
        HandshakeInitiator initiator(*ids.alice, HandshakeOptions{}, ids.bob->peer_id());
        HandshakeResponder impostor(*mallory, HandshakeOptions{});
        json ack;
        REQUIRE_FALSE(impostor.on_hello(initiator.hello(), ack));
        json finish;
        CHECK(initiator.on_hello_ack(ack, finish) == errc::handshake_failed);
    }
}

TEST_CASE("a copied signing key does not pass for its owner") {
    Pair ids;
    std::error_code ec;
    auto mallory = Identity::load_or_create("", "mallory", "mallory", ec);
    REQUIRE(mallory);

    for (auto options : {HandshakeOptions{}, HandshakeOptions{false, false}}) {
        CAPTURE(options.encryption);
        {
            HandshakeInitiator initiator(*mallory, options, ids.bob->peer_id());
            HandshakeResponder responder(*ids.bob, options);
            auto hello = initiator.hello();
            hello["id"] = ids.alice->peer_id();
            hello["sign_pk"] = json::binary(ids.alice->signing_public_key());

            json ack;
            REQUIRE_FALSE(responder.on_hello(hello, ack));
            json finish;
            REQUIRE_FALSE(initiator.on_hello_ack(ack, finish));
            CHECK(responder.on_finish(finish) == errc::handshake_failed);
            CHECK_FALSE(responder.result().verified);

            finish.erase("sig");
            CHECK(responder.on_finish(finish) == errc::handshake_failed);
        }
        {
            HandshakeInitiator initiator(*ids.bob, options, ids.alice->peer_id());
            HandshakeResponder responder(*mallory, options);
            json ack;
            REQUIRE_FALSE(responder.on_hello(initiator.hello(), ack));
            ack["id"] = ids.alice->peer_id();
            ack["sign_pk"] = json::binary(ids.alice->signing_public_key());

            json finish;
            CHECK(initiator.on_hello_ack(ack, finish) == errc::handshake_failed);
            CHECK_FALSE(initiator.result().verified);
        }
    }
}

TEST_CASE("plaintext sessions need authentication switched off") {
    Pair ids;
    HandshakeOptions plaintext{false, false};

    SUBCASE("both sides allow it") {
        HandshakeInitiator initiator(*ids.alice, plaintext, ids.bob->peer_id());
        HandshakeResponder responder(*ids.bob, plaintext);
        json ack;
        REQUIRE_FALSE(responder.on_hello(initiator.hello(), ack));
        json finish;
        REQUIRE_FALSE(initiator.on_hello_ack(ack, finish));
        REQUIRE_FALSE(responder.on_finish(finish));
        CHECK(initiator.result().security == SecurityLevel::plaintext);
        CHECK_FALSE(initiator.result().keys);
        CHECK(initiator.result().verified);
        CHECK(responder.result().verified);
    }

    SUBCASE("the responder insists on authentication") {
        HandshakeInitiator initiator(*ids.alice, plaintext, ids.bob->peer_id());
        HandshakeResponder responder(*ids.bob, HandshakeOptions{});
        json ack;
        CHECK(responder.on_hello(initiator.hello(), ack) == errc::handshake_failed);
    }
}

TEST_CASE("verdicts") {
    Pair ids;
    HandshakeInitiator initiator(*ids.alice, HandshakeOptions{}, ids.bob->peer_id());
    CHECK(initiator.on_verdict(HandshakeResponder::verdict(errc::trust_denied)) == errc::trust_denied);
    CHECK(initiator.on_verdict(HandshakeResponder::verdict(errc::approval_timeout)) == errc::approval_timeout);
    CHECK(HandshakeInitiator::is_duplicate(HandshakeResponder::duplicate_verdict()));
    CHECK_FALSE(HandshakeInitiator::is_duplicate(HandshakeResponder::verdict({})));
    CHECK(initiator.on_verdict(json{{"ch", "hs"}, {"t", "hello"}}) == errc::protocol_error);
}
