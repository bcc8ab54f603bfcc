#include <doctest/doctest.h>

#include <future>

#include "common/error.h"
#include "common/wire.h"
#include "connection/connection_state.h"
#include "security/identity.h"
#include "test_support.h"

using namespace kizuna;
using namespace std::chrono_literals;

using S = ConnectionState;
using E = ConnectionEvent;

TEST_CASE("connection state machine") {
    SUBCASE("happy path") {
        CHECK(transition(S::discovered, E::connect_requested) == S::evaluating);
        CHECK(transition(S::evaluating, E::trust_allowed) == S::handshaking);
        CHECK(transition(S::handshaking, E::handshake_succeeded) == S::established);
        CHECK(transition(S::established, E::close_requested) == S::closing);
        CHECK(transition(S::closing, E::closed) == S::closed);
    }

    SUBCASE("manual approval") {
        CHECK(transition(S::evaluating, E::approval_required) == S::approving);
        CHECK(transition(S::approving, E::approval_granted) == S::handshaking);
        CHECK(transition(S::approving, E::trust_denied) == S::rejected);
    }

    SUBCASE("failures end the attempt") {
        CHECK(transition(S::handshaking, E::handshake_failed) == S::failed);
        CHECK(transition(S::handshaking, E::connect_failed) == S::failed);
        CHECK(transition(S::evaluating, E::cancelled) == S::failed);
        CHECK(transition(S::established, E::session_lost) == S::closing);
    }

    SUBCASE("an inbound session resolves any attempt state") {
        CHECK(transition(S::evaluating, E::inbound_accepted) == S::established);
        CHECK(transition(S::approving, E::inbound_accepted) == S::established);
        CHECK(transition(S::handshaking, E::inbound_accepted) == S::established);
    }

    SUBCASE("terminal states only accept a new request") {
        for (auto state : {S::closed, S::rejected, S::failed, S::discovered}) {
            CHECK(is_terminal(state));
            CHECK(transition(state, E::connect_requested) == S::evaluating);
            CHECK_FALSE(transition(state, E::handshake_succeeded));
            CHECK_FALSE(transition(state, E::session_lost));
        }
    }

    SUBCASE("illegal events are refused") {
        CHECK_FALSE(transition(S::established, E::connect_requested));
        CHECK_FALSE(transition(S::closing, E::handshake_succeeded));
        CHECK_FALSE(transition(S::evaluating, E::handshake_succeeded));
    }

    CHECK(is_attempting(S::approving));
    CHECK_FALSE(is_attempting(S::established));
}

TEST_CASE("two engines connect over the loopback hub") {
    test::Mesh mesh;
    test::EventLog alice_events;
    test::EventLog bob_events;
    auto alice = mesh.node("alice");
    auto bob = mesh.node("bob");
    alice->set_event_handler(alice_events.handler());
    bob->set_event_handler(bob_events.handler());
    REQUIRE_FALSE(alice->init());
    REQUIRE_FALSE(bob->init());

    std::error_code ec;
    auto peers = alice->discover_peers(ec);
    REQUIRE_FALSE(ec);
    REQUIRE(peers.size() == 1);
    CHECK(peers[0].id == bob->local_peer_id());
    CHECK(peers[0].name == "bob");
    CHECK(peers[0].found_by("scripted"));
    CHECK(peers[0].addresses.count("websocket://bob") == 1);
    CHECK(alice_events.count(EngineEventType::peer_discovered) >= 1);

    auto session = alice->connect_to_peer(bob->local_peer_id(), ec);
    REQUIRE_FALSE(ec);
    REQUIRE(session);
    CHECK(session->info().transport == TransportKind::websocket);
    CHECK(session->info().security == SecurityLevel::authenticated);
    CHECK(alice->connection_state(bob->local_peer_id()) == ConnectionState::established);
    REQUIRE(test::wait_until([&] { return bob->session(alice->local_peer_id()) != nullptr; }));
    CHECK(bob->session(alice->local_peer_id())->id() == session->id());
    CHECK(bob->connection_state(alice->local_peer_id()) == ConnectionState::established);
    CHECK(test::wait_until([&] { return bob_events.count(EngineEventType::session_established) == 1; }));

    SUBCASE("connecting again reuses the session") {
        auto again = alice->connect_to_peer(bob->local_peer_id(), ec);
        REQUIRE_FALSE(ec);
        CHECK(again == session);
    }

    SUBCASE("disconnect closes both ends") {
        alice->disconnect_peer(bob->local_peer_id(), ec);
        REQUIRE_FALSE(ec);
        CHECK(test::wait_until([&] {
            return alice->connection_state(bob->local_peer_id()) == ConnectionState::closed
                && bob->connection_state(alice->local_peer_id()) == ConnectionState::closed;
        }));
        REQUIRE(test::wait_until([&] { return bob_events.count(EngineEventType::session_closed) == 1; }));
        CHECK(bob_events.of(EngineEventType::session_closed)[0].error == errc::session_lost);
        REQUIRE(test::wait_until([&] { return alice_events.count(EngineEventType::session_closed) == 1; }));
        CHECK_FALSE(alice_events.of(EngineEventType::session_closed)[0].error);

        alice->disconnect_peer(bob->local_peer_id(), ec);
        CHECK(ec == errc::session_required);
    }

    SUBCASE("a dropped link is reported as lost") {
        mesh.hub->sever("websocket://bob");
        CHECK(test::wait_until([&] { return alice_events.count(EngineEventType::session_closed) == 1; }));
        CHECK(alice_events.of(EngineEventType::session_closed)[0].error == errc::session_lost);
        CHECK(alice->connection_state(bob->local_peer_id()) == ConnectionState::closed);
    }
}

TEST_CASE("a silent peer is dropped after missed keepalives") {
    test::Mesh mesh;
    test::EventLog alice_events;
    const auto quick = [](EngineConfig& c) {
        c.networking.keepalive_interval = 100ms;
        c.networking.keepalive_misses = 3;
    };
    auto alice = mesh.node("alice", quick);
    auto bob = mesh.node("bob", quick);
    alice->set_event_handler(alice_events.handler());
    REQUIRE_FALSE(alice->init());
    REQUIRE_FALSE(bob->init());

    std::error_code ec;
    auto session = test::discover_and_connect(*alice, bob->local_peer_id(), ec);
    REQUIRE_FALSE(ec);
    REQUIRE(session);

    // Keepalives keep a quiet but healthy session open.
    std::this_thread::sleep_for(500ms);
    CHECK(session->is_open());
    CHECK(alice_events.count(EngineEventType::session_closed) == 0);

    const auto started = std::chrono::steady_clock::now();
    mesh.hub->set_frame_filter([](const std::string& from, Bytes&) { return from != "websocket://bob"; });

    REQUIRE(test::wait_until([&] { return alice_events.count(EngineEventType::session_closed) == 1; }));
    CHECK(alice_events.of(EngineEventType::session_closed)[0].error == errc::session_lost);
    CHECK(std::chrono::steady_clock::now() - started >= 200ms);
    CHECK_FALSE(session->is_open());
    CHECK(test::wait_until([&] { return alice->connection_state(bob->local_peer_id()) == ConnectionState::closed; }));
}

TEST_CASE("unknown peers cannot be dialed") {
    test::Mesh mesh;
    auto alice = mesh.node("alice");
    REQUIRE_FALSE(alice->init());

    std::error_code ec;
    auto session = alice->connect_to_peer(std::string(64, 'f'), ec);
    CHECK(ec == errc::peer_not_found);
    CHECK_FALSE(session);
}

TEST_CASE("concurrent connects share one attempt") {
    test::Mesh mesh;
    auto alice = mesh.node("alice");
    auto bob = mesh.node("bob");
    REQUIRE_FALSE(alice->init());
    REQUIRE_FALSE(bob->init());

    std::error_code ec;
    alice->discover_peers(ec);
    REQUIRE(alice->find_peer(bob->local_peer_id()));

    std::promise<std::shared_ptr<Session>> first;
    std::promise<std::shared_ptr<Session>> second;
    alice->async_connect_to_peer(bob->local_peer_id(), [&](std::error_code, std::shared_ptr<Session> s) {
        first.set_value(s);
    });
    alice->async_connect_to_peer(bob->local_peer_id(), [&](std::error_code, std::shared_ptr<Session> s) {
        second.set_value(s);
    });

    auto a = first.get_future();
    auto b = second.get_future();
    REQUIRE(a.wait_for(5s) == std::future_status::ready);
    REQUIRE(b.wait_for(5s) == std::future_status::ready);
    auto session = a.get();
    REQUIRE(session);
    CHECK(b.get() == session);
    CHECK(mesh.hub->connect_attempts("websocket://bob") == 1);
}

TEST_CASE("transports are tried in priority order with fallback") {
    test::Mesh mesh;
    const std::vector<TransportKind> kinds = {TransportKind::webrtc, TransportKind::websocket};
    auto alice = mesh.node("alice", {}, kinds);
    auto bob = mesh.node("bob", {}, kinds);
    REQUIRE_FALSE(alice->init());
    REQUIRE_FALSE(bob->init());

    std::error_code ec;
    alice->discover_peers(ec);
    auto record = alice->find_peer(bob->local_peer_id());
    REQUIRE(record);
    CHECK(record->addresses.count("webrtc://bob") == 1);
    CHECK(record->addresses.count("websocket://bob") == 1);

    SUBCASE("the preferred transport wins when it works") {
        auto session = alice->connect_to_peer(bob->local_peer_id(), ec);
        REQUIRE_FALSE(ec);
        CHECK(session->info().transport == TransportKind::webrtc);
        CHECK(mesh.hub->connect_attempts("websocket://bob") == 0);
    }

    SUBCASE("a transient failure is retried once on the same transport") {
        mesh.hub->fail_next_connects("webrtc://bob", 1);
        auto session = alice->connect_to_peer(bob->local_peer_id(), ec);
        REQUIRE_FALSE(ec);
        CHECK(session->info().transport == TransportKind::webrtc);
        CHECK(mesh.hub->connect_attempts("webrtc://bob") == 2);
    }

    SUBCASE("an unreachable transport falls back to the next") {
        mesh.hub->set_unreachable("webrtc://bob", true);
        auto session = alice->connect_to_peer(bob->local_peer_id(), ec);
        REQUIRE_FALSE(ec);
        CHECK(session->info().transport == TransportKind::websocket);
        CHECK(mesh.hub->connect_attempts("webrtc://bob") == 2);
        CHECK(mesh.hub->connect_attempts("websocket://bob") == 1);
    }

    SUBCASE("every transport failing fails the attempt") {
        mesh.hub->set_unreachable("webrtc://bob", true);
        mesh.hub->set_unreachable("websocket://bob", true);
        auto session = alice->connect_to_peer(bob->local_peer_id(), ec);
        CHECK(ec == errc::connection_failed);
        CHECK_FALSE(session);
        CHECK(alice->connection_state(bob->local_peer_id()) == ConnectionState::failed);
    }
}

TEST_CASE("a silent responder times the handshake out") {
    test::Mesh mesh;
    const auto quick = [](EngineConfig& c) { c.networking.connection_timeout = 300ms; };
    auto alice = mesh.node("alice", quick);
    auto bob = mesh.node("bob", quick);
    REQUIRE_FALSE(alice->init());
    REQUIRE_FALSE(bob->init());
    mesh.hub->set_frame_filter([](const std::string& from, Bytes&) { return from != "websocket://bob"; });

    std::error_code ec;
    alice->discover_peers(ec);
    REQUIRE(alice->find_peer(bob->local_peer_id()));

    const auto started = std::chrono::steady_clock::now();
    auto session = alice->connect_to_peer(bob->local_peer_id(), ec);
    CHECK(ec == errc::connection_failed);
    CHECK_FALSE(session);
    CHECK(std::chrono::steady_clock::now() - started >= 600ms);
    CHECK(mesh.hub->connect_attempts("websocket://bob") == 2);
    CHECK(alice->connection_state(bob->local_peer_id()) == ConnectionState::failed);
    CHECK(test::wait_until([&] { return bob->session(alice->local_peer_id()) == nullptr; }));
}

TEST_CASE("trust policy is enforced by the responder") {
    test::Mesh mesh;

    SUBCASE("allowlist_only refuses strangers") {
        auto alice = mesh.node("alice");
        auto bob = mesh.node("bob", [](EngineConfig& c) { c.security.trust_mode = TrustMode::allowlist_only; });
        REQUIRE_FALSE(alice->init());
        REQUIRE_FALSE(bob->init());

        std::error_code ec;
        auto session = test::discover_and_connect(*alice, bob->local_peer_id(), ec);
        CHECK(ec == errc::trust_denied);
        CHECK_FALSE(session);
        CHECK(alice->connection_state(bob->local_peer_id()) == ConnectionState::rejected);
        CHECK_FALSE(bob->session(alice->local_peer_id()));
    }

    SUBCASE("a borrowed key does not pass the allowlist") {
        std::error_code ec;
        auto friendly = Identity::load_or_create(mesh.scratch.file("friend.json"), "friend", "friend", ec);
        REQUIRE(friendly);
        const auto plaintext = [&](EngineConfig& c) {
            c.security.enable_encryption = false;
            c.security.require_authentication = false;
        };
        auto mallory = mesh.node("mallory", plaintext);
        auto bob = mesh.node("bob", [&](EngineConfig& c) {
            plaintext(c);
            c.security.trust_mode = TrustMode::allowlist_only;
            c.security.allowlist = {friendly->peer_id()};
        });

        // Mallory's hello claims the friend's id and public key; only the signature can tell.
        mesh.hub->set_frame_filter([&](const std::string& from, Bytes& frame) {
            if (from != "websocket://mallory")
                return true;
            auto message = wire::decode_message(frame);
            if (!message || message->value("ch", std::string{}) != "hs" || message->value("t", std::string{}) != "hello")
                return true;
            (*message)["id"] = friendly->peer_id();
            (*message)["sign_pk"] = nlohmann::json::binary(friendly->signing_public_key());
            frame = wire::encode_message(*message);
            return true;
        });
        REQUIRE_FALSE(mallory->init());
        REQUIRE_FALSE(bob->init());

        auto session = test::discover_and_connect(*mallory, bob->local_peer_id(), ec);
        CHECK(ec == errc::handshake_failed);
        CHECK_FALSE(session);
        CHECK_FALSE(bob->session(friendly->peer_id()));
        CHECK_FALSE(bob->session(mallory->local_peer_id()));
        mesh.hub->set_frame_filter({});
    }

    SUBCASE("manual approval admits the peer and remembers it") {
        auto alice = mesh.node("alice");
        auto bob = mesh.node("bob", [](EngineConfig& c) { c.security.trust_mode = TrustMode::manual; });
        std::mutex mutex;
        std::vector<std::string> asked;
        bob->set_approval_handler([&](const PeerRecord& peer, TrustManager::ApprovalResponder respond) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                asked.push_back(peer.name);
            }
            respond(true);
        });
        REQUIRE_FALSE(alice->init());
        REQUIRE_FALSE(bob->init());

        std::error_code ec;
        auto session = test::discover_and_connect(*alice, bob->local_peer_id(), ec);
        REQUIRE_FALSE(ec);
        CHECK(session);
        {
            std::lock_guard<std::mutex> lock(mutex);
            REQUIRE(asked.size() == 1);
            CHECK(asked[0] == "alice");
        }

        auto trusted = bob->trusted_peers();
        REQUIRE(trusted.size() == 1);
        CHECK(trusted[0].peer_id == alice->local_peer_id());
    }

    SUBCASE("a blocked peer is refused") {
        auto alice = mesh.node("alice");
        auto bob = mesh.node("bob");
        REQUIRE_FALSE(alice->init());
        REQUIRE_FALSE(bob->init());

        std::error_code ec;
        bob->block_peer(alice->local_peer_id(), ec);
        REQUIRE_FALSE(ec);
        test::discover_and_connect(*alice, bob->local_peer_id(), ec);
        CHECK(ec == errc::trust_denied);

        bob->unblock_peer(alice->local_peer_id(), ec);
        REQUIRE_FALSE(ec);
        auto session = alice->connect_to_peer(bob->local_peer_id(), ec);
        CHECK_FALSE(ec);
        CHECK(session);
    }
}

TEST_CASE("a pending connect can be cancelled") {
    test::Mesh mesh;
    auto alice = mesh.node("alice");
    auto bob = mesh.node("bob", [](EngineConfig& c) {
        c.security.trust_mode = TrustMode::manual;
        c.security.approval_timeout = 10s;
    });
    bob->set_approval_handler([](const PeerRecord&, TrustManager::ApprovalResponder) {});
    REQUIRE_FALSE(alice->init());
    REQUIRE_FALSE(bob->init());

    std::error_code ec;
    alice->discover_peers(ec);
    REQUIRE(alice->find_peer(bob->local_peer_id()));

    std::promise<std::error_code> outcome;
    alice->async_connect_to_peer(bob->local_peer_id(), [&](std::error_code ec, std::shared_ptr<Session>) {
        outcome.set_value(ec);
    });
    REQUIRE(test::wait_until(
        [&] { return alice->connection_state(bob->local_peer_id()) == ConnectionState::handshaking; }));

    alice->cancel_connect(bob->local_peer_id(), ec);
    REQUIRE_FALSE(ec);
    auto future = outcome.get_future();
    REQUIRE(future.wait_for(2s) == std::future_status::ready);
    CHECK(future.get() == errc::cancelled);
    CHECK(alice->connection_state(bob->local_peer_id()) == ConnectionState::failed);
}

TEST_CASE("simultaneous dials settle on one session") {
    test::Mesh mesh;
    auto alice = mesh.node("alice");
    auto bob = mesh.node("bob");
    REQUIRE_FALSE(alice->init());
    REQUIRE_FALSE(bob->init());

    std::error_code ec;
    alice->discover_peers(ec);
    bob->discover_peers(ec);
    REQUIRE(alice->find_peer(bob->local_peer_id()));
    REQUIRE(bob->find_peer(alice->local_peer_id()));

    std::promise<std::error_code> from_alice;
    std::promise<std::error_code> from_bob;
    alice->async_connect_to_peer(bob->local_peer_id(), [&](std::error_code ec, std::shared_ptr<Session>) {
        from_alice.set_value(ec);
    });
    bob->async_connect_to_peer(alice->local_peer_id(), [&](std::error_code ec, std::shared_ptr<Session>) {
        from_bob.set_value(ec);
    });

    auto a = from_alice.get_future();
    auto b = from_bob.get_future();
    REQUIRE(a.wait_for(5s) == std::future_status::ready);
    REQUIRE(b.wait_for(5s) == std::future_status::ready);
    CHECK_FALSE(a.get());
    CHECK_FALSE(b.get());

    CHECK(test::wait_until([&] {
        auto mine = alice->session(bob->local_peer_id());
        auto theirs = bob->session(alice->local_peer_id());
        return mine && theirs && mine->id() == theirs->id();
    }));
}
