#include <doctest/doctest.h>

#include <future>

#include "common/error.h"
#include "security/trust_manager.h"
#include "security/trust_store.h"
#include "test_support.h"

using namespace kizuna;
using namespace std::chrono_literals;

namespace {

PeerRecord peer(const PeerId& id) {
    PeerRecord record;
    record.id = id;
    record.name = "device-" + id;
    return record;
}

/// Drives async_authorize to completion on a private io_context.
std::error_code authorize(asio::io_context& io, TrustManager& trust, const PeerRecord& record) {
    std::error_code result = errc::protocol_error;
    bool done = false;
    trust.async_authorize(record, [&](std::error_code ec) {
        result = ec;
        done = true;
    });
    io.restart();
    while (!done && io.run_one_for(5s) > 0) {
    }
    return result;
}

} // namespace

TEST_CASE("TrustStore persists decisions") {
    test::TempDir dir;
    const auto path = dir.file("trust.json");

    {
        TrustStore store(path);
        REQUIRE_FALSE(store.load());
        store.trust("alice", "Alice's phone");
        store.allowlist("bob");
        store.block("mallory");
    }

    TrustStore reloaded(path);
    REQUIRE_FALSE(reloaded.load());
    CHECK(reloaded.is_known("alice"));
    CHECK(reloaded.is_known("bob"));
    CHECK(reloaded.is_blocked("mallory"));
    REQUIRE(reloaded.entry("alice"));
    CHECK(reloaded.entry("alice")->nickname == "Alice's phone");
    CHECK(reloaded.entry("bob")->level == TrustLevel::allowlisted);

    reloaded.forget("alice");
    reloaded.unblock("mallory");
    CHECK_FALSE(reloaded.is_known("alice"));
    CHECK_FALSE(reloaded.is_blocked("mallory"));

    SUBCASE("a malformed file is reported") {
        std::ofstream(path, std::ios::trunc) << "[1, 2";
        TrustStore broken(path);
        CHECK(broken.load() == errc::invalid_config);
    }
}

TEST_CASE("trusting a blocked peer lifts the block") {
    TrustStore store;
    store.block("carol");
    store.trust("carol");
    CHECK_FALSE(store.is_blocked("carol"));
    CHECK(store.is_known("carol"));
}

TEST_CASE("TrustManager modes") {
    asio::io_context io;
    TrustStore store;
    SecurityConfig config;

    SUBCASE("open") {
        config.trust_mode = TrustMode::open;
        TrustManager trust(io, config, store);
        CHECK(trust.evaluate("stranger") == TrustDecision::allow);
        CHECK_FALSE(authorize(io, trust, peer("stranger")));
    }

    SUBCASE("allowlist_only") {
        config.trust_mode = TrustMode::allowlist_only;
        config.allowlist = {"friend"};
        TrustManager trust(io, config, store);
        CHECK(trust.evaluate("friend") == TrustDecision::allow);
        CHECK(trust.evaluate("stranger") == TrustDecision::deny);
        CHECK(authorize(io, trust, peer("stranger")) == errc::trust_denied);
        CHECK(trust.trust_state("friend") == TrustState::trusted);
    }

    SUBCASE("blocked peers are denied in every mode") {
        config.trust_mode = TrustMode::open;
        config.blocklist = {"mallory"};
        TrustManager trust(io, config, store);
        CHECK(trust.evaluate("mallory") == TrustDecision::deny);
        CHECK(trust.trust_state("mallory") == TrustState::blocked);
        CHECK(authorize(io, trust, peer("mallory")) == errc::trust_denied);
    }

    SUBCASE("manual approval granted") {
        config.trust_mode = TrustMode::manual;
        TrustManager trust(io, config, store);
        std::string asked;
        trust.set_approval_handler([&](const PeerRecord& record, TrustManager::ApprovalResponder respond) {
            asked = record.id;
            respond(true);
        });
        CHECK(trust.evaluate("dave") == TrustDecision::require_manual_approval);
        CHECK_FALSE(authorize(io, trust, peer("dave")));
        CHECK(asked == "dave");
        CHECK(store.is_known("dave"));
        CHECK(store.entry("dave")->nickname == "device-dave");
        CHECK(trust.evaluate("dave") == TrustDecision::allow);
    }

    SUBCASE("manual approval declined") {
        config.trust_mode = TrustMode::manual;
        TrustManager trust(io, config, store);
        trust.set_approval_handler([](const PeerRecord&, TrustManager::ApprovalResponder respond) { respond(false); });
        CHECK(authorize(io, trust, peer("erin")) == errc::trust_denied);
        CHECK_FALSE(store.is_known("erin"));
    }

    SUBCASE("manual approval never answered") {
        config.trust_mode = TrustMode::manual;
        config.approval_timeout = 50ms;
        TrustManager trust(io, config, store);
        trust.set_approval_handler([](const PeerRecord&, TrustManager::ApprovalResponder) {});
        CHECK(authorize(io, trust, peer("frank")) == errc::approval_timeout);
    }

    SUBCASE("no approval handler installed") {
        config.trust_mode = TrustMode::manual;
        TrustManager trust(io, config, store);
        CHECK(authorize(io, trust, peer("grace")) == errc::approval_timeout);
    }
}
