#include <doctest/doctest.h>

#include <algorithm>
#include <atomic>

#include "common/error.h"
#include "common/wire.h"
#include "transfer/transfer_types.h"
#include "test_support.h"

using namespace kizuna;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

void plaintext(EngineConfig& config) {
    config.security.enable_encryption = false;
    config.security.require_authentication = false;
}

/// Chunk sequence number of a plaintext transfer frame, or -1.
long chunk_seq(const Bytes& frame) {
    auto message = wire::decode_message(frame);
    if (!message || message->value("ch", std::string{}) != wire::kTransfer ||
        message->value("t", std::string{}) != "chunk")
        return -1;
    return message->value("seq", -1L);
}

/// Type of a plaintext transfer frame, or an empty string.
std::string transfer_type(const Bytes& frame) {
    auto message = wire::decode_message(frame);
    if (!message || message->value("ch", std::string{}) != wire::kTransfer)
        return {};
    return message->value("t", std::string{});
}

bool finished(const Engine& engine, const TransferId& id, TransferState state) {
    auto status = engine.transfer_status(id);
    return status && status->state == state;
}

struct Pair {
    explicit Pair(const std::function<void(EngineConfig&)>& adjust = {}) {
        alice = mesh.node("alice", adjust);
        bob = mesh.node("bob", adjust);
        alice->set_event_handler(alice_events.handler());
        bob->set_event_handler(bob_events.handler());
        REQUIRE_FALSE(alice->init());
        REQUIRE_FALSE(bob->init());
    }

    std::shared_ptr<Session> connect() {
        std::error_code ec;
        auto session = test::discover_and_connect(*alice, bob->local_peer_id(), ec);
        REQUIRE_FALSE(ec);
        REQUIRE(test::wait_until([&] { return bob->session(alice->local_peer_id()) != nullptr; }));
        return session;
    }

    fs::path downloads() const { return mesh.scratch.path() / "bob" / "downloads"; }

    test::Mesh mesh;
    test::EventLog alice_events;
    test::EventLog bob_events;
    std::unique_ptr<Engine> alice;
    std::unique_ptr<Engine> bob;
};

} // namespace

TEST_CASE("chunk_count and progress") {
    CHECK(chunk_count(0, 4096) == 0);
    CHECK(chunk_count(1, 4096) == 1);
    CHECK(chunk_count(4096, 4096) == 1);
    CHECK(chunk_count(4097, 4096) == 2);

    TransferStatus status;
    CHECK(status.progress() == doctest::Approx(0.0));
    status.chunks = 4;
    status.chunks_done = 1;
    CHECK(status.progress() == doctest::Approx(0.25));
}

TEST_CASE("transfer state machine") {
    using S = TransferState;
    using E = TransferEvent;
    CHECK(transition(S::queued, E::accepted) == S::in_progress);
    CHECK(transition(S::in_progress, E::verified) == S::completed);
    CHECK(transition(S::in_progress, E::session_lost) == S::interrupted);
    CHECK(transition(S::interrupted, E::resumed) == S::in_progress);
    CHECK(transition(S::interrupted, E::cancelled) == S::cancelled);
    CHECK(transition(S::in_progress, E::failed) == S::failed);
    CHECK_FALSE(transition(S::completed, E::accepted));
    CHECK_FALSE(transition(S::queued, E::verified));
    CHECK(is_terminal(S::completed));
    CHECK_FALSE(is_terminal(S::interrupted));
}

TEST_CASE("a file arrives intact") {
    Pair pair;
    pair.connect();
    const auto source = test::write_file(pair.mesh.scratch.file("holiday.jpg"), 10 * 4096 + 123);

    std::error_code ec;
    auto id = pair.alice->transfer_file(source, pair.bob->local_peer_id(), ec);
    REQUIRE_FALSE(ec);
    REQUIRE_FALSE(id.empty());

    REQUIRE(test::wait_until([&] { return finished(*pair.alice, id, TransferState::completed); }));
    REQUIRE(test::wait_until([&] { return finished(*pair.bob, id, TransferState::completed); }));

    auto sent = pair.alice->transfer_status(id);
    CHECK(sent->direction == TransferDirection::outgoing);
    CHECK(sent->chunks == 11);
    CHECK(sent->chunks_done == 11);
    CHECK(sent->progress() == doctest::Approx(1.0));

    auto received = pair.bob->transfer_status(id);
    CHECK(received->direction == TransferDirection::incoming);
    CHECK(received->file_name == "holiday.jpg");
    CHECK(fs::path(received->path) == pair.downloads() / "holiday.jpg");
    CHECK(test::read_file(received->path) == test::read_file(source));
    CHECK_FALSE(fs::exists(pair.downloads() / ("." + id + ".part")));

    CHECK(test::wait_until([&] { return pair.alice_events.count(EngineEventType::transfer_completed) == 1; }));
    CHECK(test::wait_until([&] { return pair.bob_events.count(EngineEventType::transfer_completed) == 1; }));
    CHECK(pair.bob_events.count(EngineEventType::incoming_transfer) == 1);
    CHECK(pair.alice_events.count(EngineEventType::transfer_progress) >= 1);

    SUBCASE("a second copy gets a fresh name") {
        auto again = pair.alice->transfer_file(source, pair.bob->local_peer_id(), ec);
        REQUIRE_FALSE(ec);
        REQUIRE(test::wait_until([&] { return finished(*pair.bob, again, TransferState::completed); }));
        CHECK(fs::path(pair.bob->transfer_status(again)->path) == pair.downloads() / "holiday (1).jpg");
    }
}

TEST_CASE("an empty file is delivered") {
    Pair pair;
    pair.connect();
    const auto source = test::write_file(pair.mesh.scratch.file("empty.txt"), 0);

    std::error_code ec;
    auto id = pair.alice->transfer_file(source, pair.bob->local_peer_id(), ec);
    REQUIRE_FALSE(ec);
    REQUIRE(test::wait_until([&] { return finished(*pair.alice, id, TransferState::completed); }));
    REQUIRE(test::wait_until([&] { return finished(*pair.bob, id, TransferState::completed); }));
    CHECK(fs::file_size(pair.downloads() / "empty.txt") == 0);
}

TEST_CASE("corrupted chunks fail the checksum and leave nothing behind") {
    Pair pair(plaintext);
    pair.mesh.hub->set_frame_filter([](const std::string& from, Bytes& frame) {
        if (from != "websocket://alice" || chunk_seq(frame) != 2)
            return true;
        auto message = *wire::decode_message(frame);
        message["data"].get_binary()[0] ^= 0xff;
        frame = wire::encode_message(message);
        return true;
    });
    pair.connect();
    const auto source = test::write_file(pair.mesh.scratch.file("report.pdf"), 5 * 4096);

    std::error_code ec;
    auto id = pair.alice->transfer_file(source, pair.bob->local_peer_id(), ec);
    REQUIRE_FALSE(ec);

    REQUIRE(test::wait_until([&] { return finished(*pair.alice, id, TransferState::failed); }));
    CHECK(pair.alice->transfer_status(id)->error == errc::integrity_error);
    REQUIRE(test::wait_until([&] { return finished(*pair.bob, id, TransferState::failed); }));
    CHECK(pair.bob->transfer_status(id)->error == errc::integrity_error);

    CHECK_FALSE(fs::exists(pair.downloads() / "report.pdf"));
    CHECK_FALSE(fs::exists(pair.downloads() / ("." + id + ".part")));
    CHECK(test::wait_until([&] { return pair.alice_events.count(EngineEventType::transfer_failed) == 1; }));
}

TEST_CASE("an interrupted transfer resumes without resending chunks") {
    constexpr long kDelivered = 4;
    std::mutex mutex;
    std::map<long, int> kept;
    std::atomic<bool> dropping{true};
    Pair pair([](EngineConfig& config) {
        plaintext(config);
        config.transfer.ack_timeout = 2s;
        config.transfer.max_chunk_retries = 10;
    });

    pair.mesh.hub->set_frame_filter([&](const std::string& from, Bytes& frame) {
        if (from != "websocket://alice")
            return true;
        const long seq = chunk_seq(frame);
        if (seq < 0)
            return true;
        if (dropping && seq >= kDelivered)
            return false;
        std::lock_guard<std::mutex> lock(mutex);
        ++kept[seq];
        return true;
    });

    pair.connect();
    const auto source = test::write_file(pair.mesh.scratch.file("album.zip"), 12 * 4096);

    std::error_code ec;
    auto id = pair.alice->transfer_file(source, pair.bob->local_peer_id(), ec);
    REQUIRE_FALSE(ec);
    REQUIRE(test::wait_until([&] {
        auto status = pair.bob->transfer_status(id);
        return status && status->chunks_done == kDelivered;
    }));

    pair.mesh.hub->sever("websocket://bob");
    REQUIRE(test::wait_until([&] { return finished(*pair.alice, id, TransferState::interrupted); }));
    REQUIRE(test::wait_until([&] { return finished(*pair.bob, id, TransferState::interrupted); }));
    CHECK(fs::exists(pair.downloads() / ("." + id + ".part")));
    REQUIRE(test::wait_until([&] {
        return pair.alice->connection_state(pair.bob->local_peer_id()) != ConnectionState::established;
    }));

    dropping = false;
    auto session = pair.alice->connect_to_peer(pair.bob->local_peer_id(), ec);
    REQUIRE_FALSE(ec);
    REQUIRE(session);

    REQUIRE(test::wait_until([&] { return finished(*pair.alice, id, TransferState::completed); }));
    REQUIRE(test::wait_until([&] { return finished(*pair.bob, id, TransferState::completed); }));
    CHECK(pair.alice->transfer_status(id)->session_id == session->id());
    CHECK(test::read_file(pair.bob->transfer_status(id)->path) == test::read_file(source));

    std::lock_guard<std::mutex> lock(mutex);
    CHECK(kept.size() == 12);
    for (const auto& entry : kept) {
        INFO("chunk " << entry.first);
        CHECK(entry.second == 1);
    }
}

TEST_CASE("a transfer can be cancelled by the sender") {
    Pair pair(plaintext);
    pair.mesh.hub->set_frame_filter(
        [](const std::string& from, Bytes& frame) { return from != "websocket://alice" || chunk_seq(frame) < 1; });
    pair.connect();
    const auto source = test::write_file(pair.mesh.scratch.file("movie.mkv"), 8 * 4096);

    std::error_code ec;
    auto id = pair.alice->transfer_file(source, pair.bob->local_peer_id(), ec);
    REQUIRE_FALSE(ec);
    REQUIRE(test::wait_until([&] {
        auto status = pair.bob->transfer_status(id);
        return status && status->chunks_done == 1;
    }));

    pair.alice->cancel_transfer(id, ec);
    REQUIRE_FALSE(ec);
    REQUIRE(test::wait_until([&] { return finished(*pair.alice, id, TransferState::cancelled); }));
    REQUIRE(test::wait_until([&] { return finished(*pair.bob, id, TransferState::cancelled); }));
    CHECK_FALSE(fs::exists(pair.downloads() / ("." + id + ".part")));

    pair.alice->cancel_transfer(id, ec);
    CHECK_FALSE(ec);
}

TEST_CASE("an unconfirmed transfer times out at the sender") {
    Pair pair([](EngineConfig& config) {
        plaintext(config);
        config.transfer.complete_timeout = 500ms;
    });
    pair.mesh.hub->set_frame_filter(
        [](const std::string& from, Bytes& frame) { return from != "websocket://bob" || transfer_type(frame) != "complete"; });
    pair.connect();
    const auto source = test::write_file(pair.mesh.scratch.file("thesis.docx"), 3 * 4096);

    std::error_code ec;
    auto id = pair.alice->transfer_file(source, pair.bob->local_peer_id(), ec);
    REQUIRE_FALSE(ec);

    REQUIRE(test::wait_until([&] { return finished(*pair.bob, id, TransferState::completed); }));
    REQUIRE(test::wait_until([&] { return finished(*pair.alice, id, TransferState::failed); }));
    CHECK(pair.alice->transfer_status(id)->error == errc::timed_out);
    CHECK(pair.alice->transfer_status(id)->chunks_done == 3);
    CHECK(test::read_file(pair.bob->transfer_status(id)->path) == test::read_file(source));
}

TEST_CASE("unacknowledged chunks exhaust their retries") {
    Pair pair([](EngineConfig& config) {
        plaintext(config);
        config.transfer.ack_timeout = 200ms;
        config.transfer.retry_backoff = 50ms;
        config.transfer.max_chunk_retries = 2;
    });
    pair.mesh.hub->set_frame_filter(
        [](const std::string& from, Bytes& frame) { return from != "websocket://alice" || chunk_seq(frame) < 0; });
    pair.connect();
    const auto source = test::write_file(pair.mesh.scratch.file("slides.key"), 4 * 4096);

    std::error_code ec;
    auto id = pair.alice->transfer_file(source, pair.bob->local_peer_id(), ec);
    REQUIRE_FALSE(ec);

    REQUIRE(test::wait_until([&] { return finished(*pair.alice, id, TransferState::failed); }));
    CHECK(pair.alice->transfer_status(id)->error == errc::timed_out);
    CHECK(pair.alice->transfer_status(id)->chunks_done == 0);
    REQUIRE(test::wait_until([&] { return finished(*pair.bob, id, TransferState::cancelled); }));
    CHECK_FALSE(fs::exists(pair.downloads() / ("." + id + ".part")));
    CHECK_FALSE(fs::exists(pair.downloads() / "slides.key"));
}

TEST_CASE("no more than a window of chunks is in flight") {
    std::mutex mutex;
    long acked = 0;
    long most_in_flight = 0;
    Pair pair([](EngineConfig& config) {
        plaintext(config);
        config.transfer.window = 3;
    });
    pair.mesh.hub->set_frame_filter([&](const std::string& from, Bytes& frame) {
        std::lock_guard<std::mutex> lock(mutex);
        if (from == "websocket://bob" && transfer_type(frame) == "ack") {
            acked = std::max(acked, wire::decode_message(frame)->value("next", 0L));
        } else if (from == "websocket://alice") {
            const long seq = chunk_seq(frame);
            if (seq >= 0)
                most_in_flight = std::max(most_in_flight, seq + 1 - acked);
        }
        return true;
    });
    pair.connect();
    pair.mesh.hub->set_send_delay(30ms);
    const auto source = test::write_file(pair.mesh.scratch.file("scan.tiff"), 16 * 4096);

    std::error_code ec;
    auto id = pair.alice->transfer_file(source, pair.bob->local_peer_id(), ec);
    REQUIRE_FALSE(ec);
    REQUIRE(test::wait_until([&] { return finished(*pair.bob, id, TransferState::completed); }, 10s));
    pair.mesh.hub->set_send_delay(0ms);
    CHECK(test::read_file(pair.bob->transfer_status(id)->path) == test::read_file(source));

    std::lock_guard<std::mutex> lock(mutex);
    CHECK(most_in_flight == 3);
}

TEST_CASE("an interrupted transfer expires after the resume window") {
    Pair pair([](EngineConfig& config) {
        plaintext(config);
        config.transfer.resume_window = 300ms;
    });
    pair.mesh.hub->set_frame_filter(
        [](const std::string& from, Bytes& frame) { return from != "websocket://alice" || chunk_seq(frame) < 2; });
    pair.connect();
    const auto source = test::write_file(pair.mesh.scratch.file("logs.tgz"), 6 * 4096);

    std::error_code ec;
    auto id = pair.alice->transfer_file(source, pair.bob->local_peer_id(), ec);
    REQUIRE_FALSE(ec);
    REQUIRE(test::wait_until([&] {
        auto status = pair.bob->transfer_status(id);
        return status && status->chunks_done == 2;
    }));

    pair.mesh.hub->sever("websocket://bob");
    REQUIRE(test::wait_until([&] { return finished(*pair.alice, id, TransferState::interrupted); }));
    REQUIRE(test::wait_until([&] { return finished(*pair.bob, id, TransferState::interrupted); }));

    REQUIRE(test::wait_until([&] { return finished(*pair.alice, id, TransferState::failed); }));
    CHECK(pair.alice->transfer_status(id)->error == errc::timed_out);
    REQUIRE(test::wait_until([&] { return finished(*pair.bob, id, TransferState::failed); }));
    CHECK(pair.bob->transfer_status(id)->error == errc::timed_out);
    CHECK_FALSE(fs::exists(pair.downloads() / ("." + id + ".part")));

    pair.alice->resume_transfer(id, ec);
    CHECK(ec == errc::transfer_not_found);
}

TEST_CASE("a source changed while interrupted cannot resume") {
    std::atomic<bool> dropping{true};
    Pair pair(plaintext);
    pair.mesh.hub->set_frame_filter([&](const std::string& from, Bytes& frame) {
        return from != "websocket://alice" || !dropping || chunk_seq(frame) < 2;
    });
    pair.connect();
    const auto source = test::write_file(pair.mesh.scratch.file("draft.odt"), 6 * 4096);

    std::error_code ec;
    auto id = pair.alice->transfer_file(source, pair.bob->local_peer_id(), ec);
    REQUIRE_FALSE(ec);
    REQUIRE(test::wait_until([&] {
        auto status = pair.bob->transfer_status(id);
        return status && status->chunks_done == 2;
    }));
    const auto offered = pair.alice->transfer_status(id)->checksum;
    CHECK(offered.size() == 64);

    pair.mesh.hub->sever("websocket://bob");
    REQUIRE(test::wait_until([&] { return finished(*pair.alice, id, TransferState::interrupted); }));
    REQUIRE(test::wait_until([&] { return finished(*pair.bob, id, TransferState::interrupted); }));
    REQUIRE(test::wait_until([&] {
        return pair.alice->connection_state(pair.bob->local_peer_id()) != ConnectionState::established;
    }));

    {
        std::fstream edit(source, std::ios::in | std::ios::out | std::ios::binary);
        edit.seekp(5 * 4096);
        edit.put('!');
    }
    dropping = false;
    pair.alice->connect_to_peer(pair.bob->local_peer_id(), ec);
    REQUIRE_FALSE(ec);

    REQUIRE(test::wait_until([&] { return finished(*pair.alice, id, TransferState::failed); }));
    CHECK(pair.alice->transfer_status(id)->error == errc::resume_mismatch);
    CHECK(pair.alice->transfer_status(id)->checksum == offered);
    REQUIRE(test::wait_until([&] { return finished(*pair.bob, id, TransferState::cancelled); }));
    CHECK_FALSE(fs::exists(pair.downloads() / ("." + id + ".part")));
    CHECK_FALSE(fs::exists(pair.downloads() / "draft.odt"));
}

TEST_CASE("transfer errors") {
    Pair pair;
    std::error_code ec;
    const auto source = test::write_file(pair.mesh.scratch.file("notes.txt"), 100);

    SUBCASE("unknown peer") {
        pair.alice->transfer_file(source, std::string(64, 'e'), ec);
        CHECK(ec == errc::peer_not_found);
    }

    SUBCASE("known peer without a session") {
        pair.alice->discover_peers(ec);
        REQUIRE(pair.alice->find_peer(pair.bob->local_peer_id()));
        pair.alice->transfer_file(source, pair.bob->local_peer_id(), ec);
        CHECK(ec == errc::session_required);
    }

    SUBCASE("missing source file") {
        pair.connect();
        pair.alice->transfer_file(pair.mesh.scratch.file("nowhere.txt"), pair.bob->local_peer_id(), ec);
        CHECK(ec == errc::io_error);
    }

    SUBCASE("unknown transfer ids") {
        pair.alice->resume_transfer("nope", ec);
        CHECK(ec == errc::transfer_not_found);
        pair.alice->cancel_transfer("nope", ec);
        CHECK(ec == errc::transfer_not_found);
        CHECK_FALSE(pair.alice->transfer_status("nope"));
    }
}
