#include <doctest/doctest.h>

#include <atomic>

#include "common/error.h"
#include "stream/stream_types.h"
#include "test_support.h"

using namespace kizuna;
using namespace std::chrono_literals;

namespace {

struct Pair {
    explicit Pair(const std::function<void(EngineConfig&)>& adjust = {}) {
        alice = mesh.node("alice", adjust);
        bob = mesh.node("bob", adjust);
        alice->set_event_handler(alice_events.handler());
        bob->set_event_handler(bob_events.handler());
        bob->set_frame_sink([this](const StreamStatus&, const Frame&) { ++frames_seen; });
        REQUIRE_FALSE(alice->init());
        REQUIRE_FALSE(bob->init());
    }

    void connect() {
        std::error_code ec;
        test::discover_and_connect(*alice, bob->local_peer_id(), ec);
        REQUIRE_FALSE(ec);
        REQUIRE(test::wait_until([&] { return bob->session(alice->local_peer_id()) != nullptr; }));
    }

    std::vector<int> outgoing_qualities() const {
        std::vector<int> out;
        for (const auto& event : alice_events.of(EngineEventType::stream_quality_changed)) {
            if (event.stream && event.stream->outgoing)
                out.push_back(event.stream->quality);
        }
        return out;
    }

    std::atomic<int> frames_seen{0};
    test::Mesh mesh;
    test::EventLog alice_events;
    test::EventLog bob_events;
    std::unique_ptr<Engine> alice;
    std::unique_ptr<Engine> bob;
};

} // namespace

TEST_CASE("quality maps onto encoder presets") {
    auto low = encode_params(StreamKind::camera, 0);
    CHECK(low.width == 854);
    CHECK(low.height == 480);
    CHECK(low.fps == 15);
    CHECK(low.bitrate_kbps == 250);

    auto mid = encode_params(StreamKind::screen, 50);
    CHECK(mid.height == 1080);
    CHECK(mid.fps == 30);
    CHECK(mid.bitrate_kbps == 1500);

    auto top = encode_params(StreamKind::camera, 100);
    CHECK(top.fps == 60);
    CHECK(top.bitrate_kbps == 6000);

    auto voice = encode_params(StreamKind::audio, 30);
    CHECK(voice.width == 0);
    CHECK(voice.sample_rate_hz == 24000);
    CHECK(voice.fps == 50);

    CHECK(encode_params(StreamKind::camera, 150).bitrate_kbps == top.bitrate_kbps);
    CHECK(valid_quality(0));
    CHECK(valid_quality(100));
    CHECK_FALSE(valid_quality(-1));
    CHECK_FALSE(valid_quality(101));
}

TEST_CASE("stream kinds by name") {
    CHECK(stream_kind_from_string("camera") == StreamKind::camera);
    CHECK(stream_kind_from_string("screen") == StreamKind::screen);
    CHECK(stream_kind_from_string("audio") == StreamKind::audio);
    CHECK_FALSE(stream_kind_from_string("hologram"));
    CHECK(std::string(to_string(StreamKind::screen)) == "screen");
}

TEST_CASE("a stream reaches the peer and stops cleanly") {
    Pair pair;
    pair.connect();

    std::error_code ec;
    auto id = pair.alice->start_stream("camera", pair.bob->local_peer_id(), 40, ec);
    REQUIRE_FALSE(ec);
    REQUIRE_FALSE(id.empty());

    REQUIRE(test::wait_until([&] { return pair.bob_events.count(EngineEventType::stream_started) == 1; }));
    auto incoming = pair.bob_events.of(EngineEventType::stream_started)[0].stream;
    REQUIRE(incoming);
    CHECK(incoming->id == id);
    CHECK_FALSE(incoming->outgoing);
    CHECK(incoming->kind == StreamKind::camera);
    CHECK(incoming->quality == 40);
    CHECK(incoming->params.height == 720);

    CHECK(test::wait_until([&] { return pair.frames_seen >= 5; }));
    auto status = pair.alice->stream_status(id);
    REQUIRE(status);
    CHECK(status->state == StreamState::active);
    CHECK(status->frames_sent >= 5);

    pair.alice->stop_stream(id, ec);
    REQUIRE_FALSE(ec);
    CHECK(test::wait_until([&] { return pair.bob_events.count(EngineEventType::stream_stopped) == 1; }));
    CHECK(test::wait_until([&] { return pair.alice->stream_status(id)->state == StreamState::stopped; }));
    CHECK_FALSE(pair.alice->stream_status(id)->error);

    SUBCASE("stopping twice is harmless") {
        pair.alice->stop_stream(id, ec);
        CHECK_FALSE(ec);
        CHECK(test::wait_until([&] { return pair.alice_events.count(EngineEventType::stream_stopped) == 1; }));
        std::this_thread::sleep_for(100ms);
        CHECK(pair.alice_events.count(EngineEventType::stream_stopped) == 1);
    }
}

TEST_CASE("stopped streams are forgotten after the retention period") {
    Pair pair([](EngineConfig& config) { config.stream.retention = 300ms; });
    pair.connect();

    std::error_code ec;
    for (int round = 0; round < 3; ++round) {
        auto id = pair.alice->start_stream(StreamKind::audio, pair.bob->local_peer_id(), 50, ec);
        REQUIRE_FALSE(ec);
        REQUIRE(test::wait_until([&] { return pair.bob->stream_status(id).has_value(); }));
        pair.alice->stop_stream(id, ec);
        REQUIRE_FALSE(ec);
    }
    REQUIRE(test::wait_until([&] { return pair.bob_events.count(EngineEventType::stream_stopped) == 3; }));

    CHECK(test::wait_until([&] { return pair.alice->streams().empty() && pair.bob->streams().empty(); }));
    CHECK(pair.alice_events.count(EngineEventType::stream_stopped) == 3);
}

TEST_CASE("a lost session stops its streams") {
    Pair pair;
    pair.connect();

    std::error_code ec;
    auto id = pair.alice->start_stream(StreamKind::audio, pair.bob->local_peer_id(), 70, ec);
    REQUIRE_FALSE(ec);
    REQUIRE(test::wait_until([&] { return pair.frames_seen > 0; }));

    pair.mesh.hub->sever("websocket://bob");
    REQUIRE(test::wait_until([&] { return pair.alice->stream_status(id)->state == StreamState::stopped; }));
    CHECK(pair.alice->stream_status(id)->error == errc::session_lost);
    CHECK(test::wait_until([&] { return pair.bob_events.count(EngineEventType::stream_stopped) == 1; }));
}

TEST_CASE("congestion lowers quality down to the floor") {
    Pair pair([](EngineConfig& config) {
        config.runtime.worker_threads = 1;
        config.stream.recover_ticks = 1000000;
    });
    pair.connect();
    pair.mesh.hub->set_send_delay(200ms);

    std::error_code ec;
    auto id = pair.alice->start_stream(StreamKind::screen, pair.bob->local_peer_id(), 60, ec);
    REQUIRE_FALSE(ec);

    const int floor = pair.alice->config().stream.min_quality;
    REQUIRE(test::wait_until([&] {
        auto qualities = pair.outgoing_qualities();
        return !qualities.empty() && qualities.back() == floor;
    }, 10s));

    auto qualities = pair.outgoing_qualities();
    int previous = 60;
    for (int quality : qualities) {
        CHECK(quality < previous);
        previous = quality;
    }

    CHECK(test::wait_until([&] { return pair.alice->stream_status(id)->frames_dropped > 0; }));
    auto status = pair.alice->stream_status(id);
    CHECK(status->quality == floor);
    CHECK(static_cast<std::size_t>(status->degradations) == qualities.size());
    CHECK(status->peak_queue_depth <= pair.alice->config().stream.max_queue_depth);
    CHECK(status->params.height == 480);

    pair.mesh.hub->set_send_delay(0ms);
    pair.alice->stop_stream(id, ec);
    CHECK_FALSE(ec);
}

TEST_CASE("stream errors") {
    Pair pair;
    std::error_code ec;

    SUBCASE("unknown kind") {
        pair.alice->start_stream("hologram", pair.bob->local_peer_id(), 50, ec);
        CHECK(ec == errc::invalid_stream_kind);
    }

    SUBCASE("quality out of range") {
        pair.connect();
        pair.alice->start_stream("camera", pair.bob->local_peer_id(), 101, ec);
        CHECK(ec == errc::invalid_quality);
        pair.alice->start_stream("camera", pair.bob->local_peer_id(), -5, ec);
        CHECK(ec == errc::invalid_quality);
    }

    SUBCASE("no session") {
        pair.alice->start_stream("screen", pair.bob->local_peer_id(), 50, ec);
        CHECK(ec == errc::session_required);
    }

    SUBCASE("unknown stream") {
        pair.alice->stop_stream("nope", ec);
        CHECK(ec == errc::stream_not_found);
        CHECK_FALSE(pair.alice->stream_status("nope"));
    }
}
