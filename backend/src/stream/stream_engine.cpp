/**
 * StreamEngine: outgoing and incoming media streams.
 *
 * Frames are produced on a timer at the preset rate. A send queue that
 * stays deep lowers the quality; a drained one raises it again.
 */

#include "stream/stream_engine.h"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "common/error.h"
#include "common/wire.h"

namespace kizuna {

using json = nlohmann::json;

namespace {

json stream_message(const char* type, const StreamId& id) {
    auto message = wire::make_message(wire::kStream, type);
    message["id"] = id;
    return message;
}

json params_to_json(const EncodeParams& p) {
    return json{{"w", p.width}, {"h", p.height}, {"fps", p.fps}, {"kbps", p.bitrate_kbps}, {"rate", p.sample_rate_hz}};
}

EncodeParams params_from_json(const json& j) {
    EncodeParams p;
    p.width = j.value("w", 0);
    p.height = j.value("h", 0);
    p.fps = j.value("fps", 0);
    p.bitrate_kbps = j.value("kbps", 0);
    p.sample_rate_hz = j.value("rate", 0);
    return p;
}

} // namespace

StreamEngine::StreamEngine(asio::io_context& io, const StreamConfig& config)
    : io_(io)
    , strand_(asio::make_strand(io))
    , config_(config)
    , source_factory_([](StreamKind) { return std::make_unique<SyntheticFrameSource>(); }) {}

void StreamEngine::set_observer(Observer observer) {
    observer_ = std::move(observer);
}

void StreamEngine::set_frame_sink(FrameSink sink) {
    sink_ = std::move(sink);
}

void StreamEngine::set_source_factory(SourceFactory factory) {
    source_factory_ = std::move(factory);
}

// ── Sessions ────────────────────────────────────────────────────────────────

void StreamEngine::attach(const std::shared_ptr<Session>& session) {
    std::weak_ptr<Session> weak = session;
    session->set_message_handler(wire::kStream, [this, weak](const json& message) {
        auto session = weak.lock();
        if (!session)
            return;
        asio::post(strand_, [this, session, message] { on_message(session, message); });
    });
}

void StreamEngine::session_closing(const std::shared_ptr<Session>& session) {
    std::vector<StreamId> ids;
    {
        std::lock_guard<std::mutex> lock(view_mutex_);
        for (auto& entry : view_) {
            auto& st = entry.second;
            if (st.session_id != session->id() || st.state == StreamState::stopped)
                continue;
            ids.push_back(entry.first);
            if (!st.outgoing)
                continue;
            auto gate = gates_.find(entry.first);
            if (gate != gates_.end()) {
                std::lock_guard<std::mutex> gate_lock(gate->second->mutex);
                gate->second->open = false;
            }
            st.state = StreamState::stopping;
            session->send(stream_message("stream_end", entry.first));
        }
    }

    asio::post(strand_, [this, ids] {
        for (const auto& id : ids)
            finish(id, {}, false);
    });
}

void StreamEngine::session_closed(const std::shared_ptr<Session>& session, std::error_code reason) {
    asio::post(strand_, [this, session, reason] {
        std::vector<StreamId> ids;
        for (const auto& entry : streams_) {
            if (entry.second->session == session)
                ids.push_back(entry.first);
        }
        for (const auto& id : ids) {
            if (reason)
                spdlog::warn("Stream: {} stopped, session lost: {}", id, reason.message());
            finish(id, reason, false);
        }
    });
}

// ── Public operations ───────────────────────────────────────────────────────

StreamId StreamEngine::start(StreamKind kind, const std::shared_ptr<Session>& session, int quality,
                             std::error_code& ec) {
    if (!valid_quality(quality)) {
        ec = errc::invalid_quality;
        return {};
    }
    if (!session || !session->is_open()) {
        ec = errc::session_required;
        return {};
    }

    auto s = std::make_unique<Stream>(strand_);
    auto& st = s->status;
    st.id = random_id(8);
    st.peer_id = session->peer_id();
    st.session_id = session->id();
    st.kind = kind;
    st.outgoing = true;
    st.requested_quality = quality;
    st.quality = quality;
    st.params = encode_params(kind, quality);
    s->session = session;
    s->source = source_factory_(kind);
    s->gate = std::make_shared<Gate>();

    const StreamId id = st.id;
    {
        std::lock_guard<std::mutex> lock(view_mutex_);
        view_[id] = st;
        gates_[id] = s->gate;
    }

    asio::post(strand_, [this, s = std::move(s)]() mutable {
        auto& ref = *s;
        const auto id = ref.status.id;
        streams_[id] = std::move(s);
        if (stopped_) {
            finish(id, errc::cancelled, false);
            return;
        }
        {
            std::lock_guard<std::mutex> gate_lock(ref.gate->mutex);
            if (!ref.gate->open)
                return;   // stopped before it started; finish is already queued
            auto message = stream_message("stream_start", id);
            message["kind"] = to_string(ref.status.kind);
            message["quality"] = ref.status.quality;
            message["params"] = params_to_json(ref.status.params);
            ref.session->send(std::move(message));
        }
        ref.status.state = StreamState::active;
        spdlog::info("Stream: {} {} to {} at quality {} ({}x{} {} fps {} kbps)", to_string(ref.status.kind), id,
                     ref.status.peer_id.substr(0, 16), ref.status.quality, ref.status.params.width,
                     ref.status.params.height, ref.status.params.fps, ref.status.params.bitrate_kbps);
        publish(ref);
        notify(Change::started, ref);
        schedule_tick(ref, std::chrono::milliseconds(0));
    });

    ec = {};
    return id;
}

void StreamEngine::stop(const StreamId& id, std::error_code& ec) {
    {
        std::lock_guard<std::mutex> lock(view_mutex_);
        auto it = view_.find(id);
        if (it == view_.end()) {
            ec = errc::stream_not_found;
            return;
        }
        ec = {};
        auto& st = it->second;
        if (st.state == StreamState::stopping || st.state == StreamState::stopped)
            return;

        auto gate = gates_.find(id);
        if (gate != gates_.end()) {
            std::lock_guard<std::mutex> gate_lock(gate->second->mutex);
            gate->second->open = false;
        }
        st.state = StreamState::stopping;
    }

    asio::post(strand_, [this, id] { finish(id, {}, true); });
}

std::optional<StreamStatus> StreamEngine::status(const StreamId& id) const {
    std::lock_guard<std::mutex> lock(view_mutex_);
    auto it = view_.find(id);
    if (it == view_.end())
        return std::nullopt;
    return it->second;
}

std::vector<StreamStatus> StreamEngine::streams() const {
    std::lock_guard<std::mutex> lock(view_mutex_);
    std::vector<StreamStatus> out;
    for (const auto& entry : view_)
        out.push_back(entry.second);
    return out;
}

void StreamEngine::shutdown(DoneHandler done) {
    {
        std::lock_guard<std::mutex> lock(view_mutex_);
        for (auto& entry : gates_) {
            std::lock_guard<std::mutex> gate_lock(entry.second->mutex);
            entry.second->open = false;
        }
    }
    asio::post(strand_, [this, done = std::move(done)] {
        stopped_ = true;
        std::vector<StreamId> ids;
        for (const auto& entry : streams_)
            ids.push_back(entry.first);
        for (const auto& id : ids)
            finish(id, errc::cancelled, true);
        if (!ids.empty())
            spdlog::info("Stream: stopped {} stream(s) for shutdown", ids.size());
        for (auto& entry : retention_)
            entry.second->cancel();
        retention_.clear();
        asio::post(io_, done);
    });
}

// ── Sending ─────────────────────────────────────────────────────────────────

void StreamEngine::schedule_tick(Stream& s, std::chrono::milliseconds delay) {
    s.tick.expires_after(delay);
    s.tick.async_wait([this, id = s.status.id](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted)
            return;
        on_tick(id);
    });
}

void StreamEngine::on_tick(const StreamId& id) {
    auto* s = find(id);
    if (!s || s->status.state != StreamState::active || !s->session)
        return;

    auto& st = s->status;
    const std::size_t depth = s->in_flight->load();
    st.queue_depth = depth;
    st.peak_queue_depth = std::max(st.peak_queue_depth, depth);
    adjust_quality(*s, depth);

    if (depth >= config_.max_queue_depth) {
        ++st.frames_dropped;
    } else {
        Frame frame = s->source->next_frame(st.params);
        auto message = stream_message("frame", id);
        message["seq"] = frame.seq;
        message["ts"] = frame.timestamp_us;
        message["key"] = frame.keyframe;
        const auto size = frame.data.size();
        message["data"] = json::binary(std::move(frame.data));

        std::lock_guard<std::mutex> gate_lock(s->gate->mutex);
        if (!s->gate->open)
            return;
        ++*s->in_flight;
        s->session->send(std::move(message), [in_flight = s->in_flight](std::error_code) { --*in_flight; });
        ++st.frames_sent;
        st.bytes += size;
    }

    publish(*s);
    const int fps = std::max(st.params.fps, 1);
    schedule_tick(*s, std::chrono::milliseconds(1000 / fps));
}

void StreamEngine::adjust_quality(Stream& s, std::size_t depth) {
    auto& st = s.status;
    if (depth > config_.high_water) {
        s.calm = 0;
        if (++s.congested < config_.congestion_ticks)
            return;
        s.congested = 0;
        const int lowered = std::max(config_.min_quality, st.quality - config_.degrade_step);
        if (lowered < st.quality) {
            ++st.degradations;
            spdlog::warn("Stream: {} congested ({} frames queued), quality {} -> {}", st.id, depth, st.quality,
                         lowered);
            set_quality(s, lowered);
        }
        return;
    }

    s.congested = 0;
    if (st.quality >= st.requested_quality) {
        s.calm = 0;
        return;
    }
    if (++s.calm < config_.recover_ticks)
        return;
    s.calm = 0;
    const int raised = std::min(st.requested_quality, st.quality + config_.degrade_step);
    spdlog::info("Stream: {} congestion cleared, quality {} -> {}", st.id, st.quality, raised);
    set_quality(s, raised);
}

void StreamEngine::set_quality(Stream& s, int quality) {
    auto& st = s.status;
    st.quality = quality;
    st.params = encode_params(st.kind, quality);

    auto message = stream_message("stream_quality", st.id);
    message["quality"] = quality;
    message["params"] = params_to_json(st.params);
    {
        std::lock_guard<std::mutex> gate_lock(s.gate->mutex);
        if (s.gate->open)
            s.session->send(std::move(message));
    }
    publish(s);
    notify(Change::quality, s);
}

// ── Receiving ───────────────────────────────────────────────────────────────

void StreamEngine::on_message(const std::shared_ptr<Session>& session, const json& message) {
    if (stopped_)
        return;

    const std::string type = message.value("t", std::string{});
    const StreamId id = message.value("id", std::string{});
    try {
        if (type == "stream_start") {
            if (id.empty() || find(id))
                return;
            auto kind = stream_kind_from_string(message.at("kind").get<std::string>());
            if (!kind) {
                spdlog::warn("Stream: peer {} started a stream of unknown kind", session->peer_id().substr(0, 16));
                return;
            }
            auto s = std::make_unique<Stream>(strand_);
            auto& st = s->status;
            st.id = id;
            st.peer_id = session->peer_id();
            st.session_id = session->id();
            st.kind = *kind;
            st.outgoing = false;
            st.state = StreamState::active;
            st.requested_quality = st.quality = message.at("quality").get<int>();
            st.params = params_from_json(message.value("params", json::object()));
            s->session = session;

            auto& ref = *s;
            streams_[id] = std::move(s);
            spdlog::info("Stream: receiving {} {} from {}", to_string(st.kind), id, st.peer_id.substr(0, 16));
            publish(ref);
            notify(Change::started, ref);
            return;
        }

        auto* s = find(id);
        if (!s || s->status.outgoing || s->session != session || s->status.state != StreamState::active)
            return;
        auto& st = s->status;

        if (type == "frame") {
            Frame frame;
            frame.seq = message.at("seq").get<uint64_t>();
            frame.timestamp_us = message.at("ts").get<int64_t>();
            frame.keyframe = message.value("key", false);
            frame.data = message.at("data").get_binary();
            ++st.frames_sent;
            st.bytes += frame.data.size();
            publish(*s);
            if (sink_)
                sink_(st, frame);
        } else if (type == "stream_quality") {
            st.quality = message.at("quality").get<int>();
            st.params = params_from_json(message.value("params", json::object()));
            publish(*s);
            notify(Change::quality, *s);
        } else if (type == "stream_end") {
            finish(id, {}, false);
        }
    } catch (const json::exception& e) {
        spdlog::warn("Stream: malformed '{}' message from {}: {}", type, session->peer_id().substr(0, 16), e.what());
    }
}

// ── Bookkeeping ─────────────────────────────────────────────────────────────

void StreamEngine::finish(const StreamId& id, std::error_code reason, bool announce) {
    auto it = streams_.find(id);
    if (it == streams_.end())
        return;
    auto& s = *it->second;
    s.tick.cancel();

    if (announce && s.status.outgoing && s.session && s.session->is_open())
        s.session->send(stream_message("stream_end", id));

    s.status.state = StreamState::stopped;
    s.status.error = reason;
    s.status.queue_depth = 0;
    spdlog::info("Stream: {} stopped after {} frames ({} dropped)", id, s.status.frames_sent,
                 s.status.frames_dropped);

    auto final_status = s.status;
    streams_.erase(it);
    {
        std::lock_guard<std::mutex> lock(view_mutex_);
        view_[id] = final_status;
        gates_.erase(id);
    }
    if (!stopped_)
        schedule_retention(id);
    if (observer_)
        observer_(Change::stopped, final_status);
}

void StreamEngine::schedule_retention(const StreamId& id) {
    auto& timer = retention_[id];
    timer = std::make_unique<asio::steady_timer>(strand_, config_.retention);
    timer->async_wait([this, id](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted)
            return;
        retention_.erase(id);
        std::lock_guard<std::mutex> lock(view_mutex_);
        view_.erase(id);
    });
}

void StreamEngine::publish(const Stream& s) {
    std::lock_guard<std::mutex> lock(view_mutex_);
    auto& view = view_[s.status.id];
    // stop() may already have marked it stopping.
    const auto state = view.state;
    view = s.status;
    if (state == StreamState::stopping && s.status.state == StreamState::active)
        view.state = StreamState::stopping;
}

void StreamEngine::notify(Change change, const Stream& s) {
    if (observer_)
        observer_(change, s.status);
}

StreamEngine::Stream* StreamEngine::find(const StreamId& id) {
    auto it = streams_.find(id);
    return it == streams_.end() ? nullptr : it->second.get();
}

} // namespace kizuna
