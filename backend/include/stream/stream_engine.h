#pragma once

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/engine_config.h"
#include "connection/session.h"
#include "stream/stream_types.h"

namespace kizuna {

/**
 * Best-effort media streams over established sessions.
 *
 * Each outgoing stream ticks at its frame rate. A tick drops the frame when
 * the stream already has `max_queue_depth` frames waiting on the session,
 * and lowers quality after `congestion_ticks` consecutive ticks above
 * `high_water`. Quality only climbs back after `recover_ticks` quiet ticks.
 *
 * Messages on the "stream" channel:
 *   stream_start {id, kind, quality, params}
 *   frame {id, seq, ts, key, data}
 *   stream_quality {id, quality, params}
 *   stream_end {id}
 */
class StreamEngine {
public:
    enum class Change {
        started,
        quality,
        stopped,
    };

    using Observer = std::function<void(Change, const StreamStatus&)>;
    using FrameSink = std::function<void(const StreamStatus&, const Frame&)>;
    using SourceFactory = std::function<std::unique_ptr<FrameSource>(StreamKind)>;
    using DoneHandler = std::function<void()>;

    StreamEngine(asio::io_context& io, const StreamConfig& config);

    /// State changes and quality changes, on the engine strand.
    void set_observer(Observer observer);
    /// Frames of incoming streams, on the engine strand.
    void set_frame_sink(FrameSink sink);
    /// Defaults to SyntheticFrameSource.
    void set_source_factory(SourceFactory factory);

    void attach(const std::shared_ptr<Session>& session);
    void session_closing(const std::shared_ptr<Session>& session);
    void session_closed(const std::shared_ptr<Session>& session, std::error_code reason);

    StreamId start(StreamKind kind, const std::shared_ptr<Session>& session, int quality, std::error_code& ec);

    /// Idempotent. No frame is handed to the session once this returns.
    void stop(const StreamId& id, std::error_code& ec);

    /// Stopped streams stay visible for `retention`, then are forgotten.
    std::optional<StreamStatus> status(const StreamId& id) const;
    std::vector<StreamStatus> streams() const;

    void shutdown(DoneHandler done);

private:
    /// Closed by stop() before it returns; every frame send holds it.
    struct Gate {
        std::mutex mutex;
        bool open = true;
    };

    struct Stream {
        explicit Stream(asio::strand<asio::io_context::executor_type>& strand) : tick(strand) {}

        StreamStatus status;
        std::shared_ptr<Session> session;
        std::unique_ptr<FrameSource> source;
        std::shared_ptr<Gate> gate;
        std::shared_ptr<std::atomic<std::size_t>> in_flight = std::make_shared<std::atomic<std::size_t>>(0);
        unsigned congested = 0;
        unsigned calm = 0;
        asio::steady_timer tick;
    };

    void on_message(const std::shared_ptr<Session>& session, const nlohmann::json& message);
    void schedule_tick(Stream& s, std::chrono::milliseconds delay);
    void on_tick(const StreamId& id);
    void adjust_quality(Stream& s, std::size_t depth);
    void set_quality(Stream& s, int quality);
    void finish(const StreamId& id, std::error_code reason, bool announce);
    void schedule_retention(const StreamId& id);
    void publish(const Stream& s);
    void notify(Change change, const Stream& s);
    Stream* find(const StreamId& id);

    asio::io_context& io_;
    asio::strand<asio::io_context::executor_type> strand_;
    StreamConfig config_;
    Observer observer_;
    FrameSink sink_;
    SourceFactory source_factory_;

    // Strand-only state.
    std::map<StreamId, std::unique_ptr<Stream>> streams_;
    std::map<StreamId, std::unique_ptr<asio::steady_timer>> retention_;
    bool stopped_ = false;

    mutable std::mutex view_mutex_;
    std::map<StreamId, StreamStatus> view_;
    std::map<StreamId, std::shared_ptr<Gate>> gates_;
};

} // namespace kizuna
