/**
 * TransferEngine: chunked file transfer with acknowledgements,
 * retries and resume.
 *
 * State lives on one strand. File hashing runs on a separate pool and
 * its result is posted back to the strand.
 */

#include "transfer/transfer_engine.h"

#include <algorithm>
#include <filesystem>

#include <spdlog/spdlog.h>

#include "common/error.h"
#include "common/wire.h"
#include "crypto/hash.h"

namespace kizuna {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr uint32_t kMaxChunkSize = 4u * 1024u * 1024u;

json transfer_message(const char* type, const TransferId& id) {
    auto message = wire::make_message(wire::kTransfer, type);
    message["id"] = id;
    return message;
}

std::error_code reason_to_error(const std::string& reason) {
    if (reason == "resume_mismatch")
        return errc::resume_mismatch;
    if (reason == "io")
        return errc::io_error;
    if (reason == "integrity")
        return errc::integrity_error;
    if (reason == "cancelled")
        return errc::cancelled;
    return errc::protocol_error;
}

const char* error_to_reason(std::error_code ec) {
    if (ec == errc::resume_mismatch)
        return "resume_mismatch";
    if (ec == errc::io_error)
        return "io";
    if (ec == errc::integrity_error)
        return "integrity";
    if (ec == errc::cancelled)
        return "cancelled";
    return "protocol";
}

/// "name.ext", then "name (1).ext", "name (2).ext", ... whichever is free.
fs::path unique_destination(const fs::path& dir, const std::string& file_name) {
    fs::path candidate = dir / file_name;
    std::error_code ec;
    if (!fs::exists(candidate, ec))
        return candidate;

    const fs::path name(file_name);
    const auto stem = name.stem().string();
    const auto ext = name.extension().string();
    for (int n = 1;; ++n) {
        candidate = dir / (stem + " (" + std::to_string(n) + ")" + ext);
        if (!fs::exists(candidate, ec))
            return candidate;
    }
}

} // namespace

TransferEngine::TransferEngine(asio::io_context& io, const TransferConfig& config)
    : io_(io)
    , strand_(asio::make_strand(io))
    , config_(config) {}

void TransferEngine::set_observer(Observer observer) {
    observer_ = std::move(observer);
}

// ── Sessions ────────────────────────────────────────────────────────────────

void TransferEngine::attach(const std::shared_ptr<Session>& session) {
    std::weak_ptr<Session> weak = session;
    session->set_message_handler(wire::kTransfer, [this, weak](const json& message) {
        auto session = weak.lock();
        if (!session)
            return;
        asio::post(strand_, [this, session, message] { on_message(session, message); });
    });

    asio::post(strand_, [this, session] {
        if (stopped_)
            return;
        attached_[session->peer_id()] = session;
        if (!config_.auto_resume)
            return;
        for (auto& entry : transfers_) {
            auto& t = *entry.second;
            if (t.status.direction == TransferDirection::outgoing && t.status.peer_id == session->peer_id() &&
                t.status.state == TransferState::interrupted && !t.session) {
                spdlog::info("Transfer: resuming {} on new session {}", t.status.id, session->id());
                resume_on(t, session);
            }
        }
    });
}

void TransferEngine::session_closing(const std::shared_ptr<Session>& session) {
    // Runs before the session says goodbye, so the cancels go out ahead of it.
    std::vector<TransferId> ids;
    {
        std::lock_guard<std::mutex> lock(view_mutex_);
        for (const auto& entry : view_) {
            if (entry.second.session_id == session->id() && !is_terminal(entry.second.state))
                ids.push_back(entry.first);
        }
    }
    for (const auto& id : ids)
        session->send(transfer_message("cancel", id));

    asio::post(strand_, [this, session, ids] {
        for (const auto& id : ids) {
            auto* t = find(id);
            if (t && t->session == session && !is_terminal(t->status.state)) {
                spdlog::info("Transfer: {} cancelled, session {} is closing", id, session->id());
                fail(*t, errc::cancelled, false);
            }
        }
    });
}

void TransferEngine::session_closed(const std::shared_ptr<Session>& session, std::error_code reason) {
    asio::post(strand_, [this, session, reason] {
        auto it = attached_.find(session->peer_id());
        if (it != attached_.end() && it->second.lock() == session)
            attached_.erase(it);

        std::vector<Transfer*> interrupted;
        for (auto& entry : transfers_) {
            auto& t = *entry.second;
            if (t.session != session || is_terminal(t.status.state))
                continue;
            if (!reason) {
                fail(t, errc::cancelled, false);
                continue;
            }
            t.ack_timer.cancel();
            t.awaiting_accept = false;
            t.session.reset();
            if (t.file.is_open())
                t.file.close();
            if (t.status.state != TransferState::interrupted) {
                spdlog::warn("Transfer: {} interrupted after {}/{} chunks: {}", t.status.id, t.status.chunks_done,
                             t.status.chunks, reason.message());
                apply(t, TransferEvent::session_lost, errc::session_lost);
            }
            interrupted.push_back(&t);
        }

        // A replacement session may already be up.
        auto replacement = attached_.find(session->peer_id());
        if (!config_.auto_resume || replacement == attached_.end())
            return;
        auto next = replacement->second.lock();
        if (!next || !next->is_open())
            return;
        for (auto* t : interrupted) {
            if (t->status.direction == TransferDirection::outgoing)
                resume_on(*t, next);
        }
    });
}

// ── Public operations ───────────────────────────────────────────────────────

TransferId TransferEngine::start(const std::string& path, const std::shared_ptr<Session>& session,
                                 std::error_code& ec) {
    if (!session || !session->is_open()) {
        ec = errc::session_required;
        return {};
    }

    std::error_code fec;
    if (!fs::is_regular_file(path, fec)) {
        spdlog::warn("Transfer: {} is not a readable file", path);
        ec = errc::io_error;
        return {};
    }
    const auto size = fs::file_size(path, fec);
    auto t = std::make_unique<Transfer>(strand_);
    t->file.open(path, std::ios::in | std::ios::binary);
    if (fec || !t->file.is_open()) {
        spdlog::warn("Transfer: cannot read {}", path);
        ec = errc::io_error;
        return {};
    }

    auto& st = t->status;
    st.id = random_id(8);
    st.direction = TransferDirection::outgoing;
    st.peer_id = session->peer_id();
    st.session_id = session->id();
    st.file_name = fs::path(path).filename().string();
    st.path = path;
    st.size = size;
    st.chunk_size = config_.chunk_size;
    st.chunks = chunk_count(size, config_.chunk_size);
    t->session = session;
    publish(*t);

    const TransferId id = st.id;
    spdlog::info("Transfer: offering {} ({} bytes, {} chunks) to {} as {}", st.file_name, size, st.chunks,
                 st.peer_id.substr(0, 16), id);

    asio::post(strand_, [this, t = std::move(t)]() mutable {
        auto& ref = *t;
        transfers_[ref.status.id] = std::move(t);
        if (stopped_) {
            apply(ref, TransferEvent::cancelled, errc::cancelled);
            return;
        }
        notify(ref);
        hash_file(ref.status.path, [this, id = ref.status.id](std::optional<std::string> checksum) {
            on_source_hashed(id, std::move(checksum));
        });
    });

    ec = {};
    return id;
}

void TransferEngine::resume(const TransferId& id, const std::shared_ptr<Session>& session, std::error_code& ec) {
    auto current = status(id);
    if (!current || is_terminal(current->state)) {
        ec = errc::transfer_not_found;
        return;
    }
    if (!session || !session->is_open()) {
        ec = errc::session_required;
        return;
    }
    if (session->peer_id() != current->peer_id) {
        ec = errc::resume_mismatch;
        return;
    }
    ec = {};
    // The receiving side waits for the sender to reoffer.
    if (current->direction == TransferDirection::incoming || current->state != TransferState::interrupted)
        return;

    asio::post(strand_, [this, id, session] {
        auto* t = find(id);
        if (t && t->status.state == TransferState::interrupted && !t->session)
            resume_on(*t, session);
    });
}

void TransferEngine::cancel(const TransferId& id, std::error_code& ec) {
    auto current = status(id);
    if (!current) {
        ec = errc::transfer_not_found;
        return;
    }
    ec = {};
    if (is_terminal(current->state))
        return;

    asio::post(strand_, [this, id] {
        auto* t = find(id);
        if (!t || is_terminal(t->status.state))
            return;
        spdlog::info("Transfer: {} cancelled", id);
        fail(*t, errc::cancelled, true);
    });
}

std::optional<TransferStatus> TransferEngine::status(const TransferId& id) const {
    std::lock_guard<std::mutex> lock(view_mutex_);
    auto it = view_.find(id);
    if (it == view_.end())
        return std::nullopt;
    return it->second;
}

std::vector<TransferStatus> TransferEngine::transfers() const {
    std::lock_guard<std::mutex> lock(view_mutex_);
    std::vector<TransferStatus> out;
    out.reserve(view_.size());
    for (const auto& entry : view_)
        out.push_back(entry.second);
    return out;
}

void TransferEngine::shutdown(DoneHandler done) {
    asio::post(strand_, [this, done = std::move(done)] {
        stopped_ = true;
        std::size_t cancelled = 0;
        for (auto& entry : transfers_) {
            auto& t = *entry.second;
            t.retention.cancel();
            if (is_terminal(t.status.state))
                continue;
            fail(t, errc::cancelled, true);
            ++cancelled;
        }
        if (cancelled)
            spdlog::info("Transfer: cancelled {} transfer(s) for shutdown", cancelled);
        transfers_.clear();
        attached_.clear();
        {
            std::lock_guard<std::mutex> lock(view_mutex_);
            view_.clear();
        }
        asio::post(io_, done);
    });
}

// ── Dispatch ────────────────────────────────────────────────────────────────

void TransferEngine::on_message(const std::shared_ptr<Session>& session, const json& message) {
    if (stopped_)
        return;

    const std::string type = message.value("t", std::string{});
    try {
        if (type == "offer") {
            on_offer(session, message);
            return;
        }

        auto* t = find(message.value("id", std::string{}));
        if (!t || is_terminal(t->status.state))
            return;
        // An interrupted transfer has no session yet; its peer may still cancel it.
        const bool waiting = !t->session && t->status.peer_id == session->peer_id();
        if (t->session != session && !(waiting && type == "cancel"))
            return;

        if (type == "cancel") {
            spdlog::info("Transfer: {} cancelled by peer", t->status.id);
            fail(*t, errc::cancelled, false);
        } else if (t->status.direction == TransferDirection::outgoing) {
            if (type == "accept") {
                on_accept(*t, message.at("from").get<uint32_t>());
            } else if (type == "reject") {
                auto reason = message.value("reason", std::string{});
                spdlog::warn("Transfer: {} rejected by peer: {}", t->status.id, reason);
                fail(*t, reason_to_error(reason), false);
            } else if (type == "ack") {
                on_ack(*t, message.at("next").get<uint32_t>());
            } else if (type == "complete") {
                on_complete(*t, message.at("ok").get<bool>());
            }
        } else if (type == "chunk") {
            on_chunk(*t, message.at("seq").get<uint32_t>(), message.at("data").get_binary());
        }
    } catch (const json::exception& e) {
        spdlog::warn("Transfer: malformed '{}' message from {}: {}", type, session->peer_id().substr(0, 16),
                     e.what());
    }
}

// ── Sender ──────────────────────────────────────────────────────────────────

void TransferEngine::on_source_hashed(const TransferId& id, std::optional<std::string> checksum) {
    auto* t = find(id);
    if (!t || stopped_ || (t->status.state != TransferState::queued && t->status.state != TransferState::interrupted))
        return;
    if (!checksum) {
        spdlog::warn("Transfer: cannot read {}", t->status.path);
        fail(*t, errc::io_error, false);
        return;
    }
    t->status.checksum = std::move(*checksum);
    publish(*t);
    // Lost the session while hashing: the transfer waits to be resumed.
    if (t->status.state == TransferState::queued && t->session)
        send_offer(*t);
}

void TransferEngine::resume_on(Transfer& t, const std::shared_ptr<Session>& session) {
    t.session = session;
    t.status.session_id = session->id();
    t.retries = 0;
    publish(t);

    // The source must still be the file that was offered.
    hash_file(t.status.path, [this, id = t.status.id, session](std::optional<std::string> checksum) {
        auto* t = find(id);
        if (!t || stopped_ || t->session != session || t->status.state != TransferState::interrupted)
            return;
        auto& st = t->status;
        std::error_code fec;
        const auto size = fs::file_size(st.path, fec);
        if (fec || !checksum || size != st.size || (!st.checksum.empty() && *checksum != st.checksum)) {
            spdlog::warn("Transfer: {} changed on disk since the transfer began, cannot resume", st.path);
            fail(*t, errc::resume_mismatch, true);
            return;
        }
        st.checksum = std::move(*checksum);

        t->file.clear();
        t->file.open(st.path, std::ios::in | std::ios::binary);
        if (!t->file.is_open()) {
            spdlog::warn("Transfer: cannot reopen {}", st.path);
            fail(*t, errc::io_error, true);
            return;
        }
        send_offer(*t);
    });
}

void TransferEngine::send_offer(Transfer& t) {
    auto message = transfer_message("offer", t.status.id);
    message["name"] = t.status.file_name;
    message["size"] = t.status.size;
    message["sha256"] = t.status.checksum;
    message["chunk_size"] = t.status.chunk_size;
    message["resume"] = t.status.state == TransferState::interrupted;
    t.awaiting_accept = true;
    send(t, std::move(message));
    arm_ack_timer(t);
}

void TransferEngine::on_accept(Transfer& t, uint32_t from) {
    if (!t.awaiting_accept)
        return;
    t.awaiting_accept = false;
    t.ack_timer.cancel();
    t.retries = 0;

    if (from > t.status.chunks) {
        fail(t, errc::protocol_error, true);
        return;
    }
    const bool resumed = t.status.state == TransferState::interrupted;
    if (!apply(t, resumed ? TransferEvent::resumed : TransferEvent::accepted))
        return;
    if (resumed)
        spdlog::info("Transfer: {} resumes at chunk {}/{}", t.status.id, from, t.status.chunks);

    t.status.chunks_done = from;
    t.status.bytes_done = std::min<uint64_t>(t.status.size, uint64_t{from} * t.status.chunk_size);
    t.next_to_send = from;
    publish(t);
    pump(t);
}

void TransferEngine::pump(Transfer& t) {
    if (t.status.state != TransferState::in_progress || !t.session)
        return;

    auto& st = t.status;
    while (t.next_to_send < st.chunks && t.next_to_send - st.chunks_done < config_.window) {
        const uint64_t offset = uint64_t{t.next_to_send} * st.chunk_size;
        const auto length = static_cast<std::size_t>(std::min<uint64_t>(st.chunk_size, st.size - offset));

        Bytes data(length);
        t.file.clear();
        t.file.seekg(static_cast<std::streamoff>(offset));
        t.file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(length));
        if (static_cast<std::size_t>(t.file.gcount()) != length) {
            spdlog::error("Transfer: read of {} failed at offset {}", st.path, offset);
            fail(t, errc::io_error, true);
            return;
        }

        auto message = transfer_message("chunk", st.id);
        message["seq"] = t.next_to_send;
        message["data"] = json::binary(std::move(data));
        send(t, std::move(message));
        ++t.next_to_send;
    }

    if (st.chunks_done < st.chunks)
        arm_ack_timer(t);
    else
        arm_complete_timer(t);
}

void TransferEngine::arm_ack_timer(Transfer& t) {
    t.ack_timer.expires_after(config_.ack_timeout);
    t.ack_timer.async_wait([this, id = t.status.id](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted)
            return;
        on_ack_timeout(id);
    });
}

void TransferEngine::arm_complete_timer(Transfer& t) {
    t.ack_timer.expires_after(config_.complete_timeout);
    t.ack_timer.async_wait([this, id = t.status.id](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted)
            return;
        auto* t = find(id);
        if (!t || t->status.state != TransferState::in_progress)
            return;
        spdlog::warn("Transfer: {} sent in full but the receiver never confirmed it", id);
        fail(*t, errc::timed_out, true);
    });
}

void TransferEngine::on_ack_timeout(const TransferId& id) {
    auto* t = find(id);
    if (!t || !t->session || is_terminal(t->status.state))
        return;

    if (++t->retries > config_.max_chunk_retries) {
        spdlog::warn("Transfer: {} gave up after {} retries", id, config_.max_chunk_retries);
        fail(*t, errc::timed_out, true);
        return;
    }

    if (t->awaiting_accept)
        spdlog::warn("Transfer: offer {} unanswered, resending ({}/{})", id, t->retries, config_.max_chunk_retries);
    else
        spdlog::warn("Transfer: chunk {} of {} unacknowledged, retrying ({}/{})", t->status.chunks_done, id,
                     t->retries, config_.max_chunk_retries);

    t->ack_timer.expires_after(config_.retry_backoff * t->retries);
    t->ack_timer.async_wait([this, id](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted)
            return;
        auto* t = find(id);
        if (!t || !t->session || is_terminal(t->status.state))
            return;
        if (t->awaiting_accept) {
            send_offer(*t);
        } else {
            t->next_to_send = t->status.chunks_done;
            pump(*t);
        }
    });
}

void TransferEngine::on_ack(Transfer& t, uint32_t next) {
    auto& st = t.status;
    if (st.state != TransferState::in_progress || next <= st.chunks_done)
        return;
    if (next > st.chunks || next > t.next_to_send) {
        fail(t, errc::protocol_error, true);
        return;
    }

    st.chunks_done = next;
    st.bytes_done = std::min<uint64_t>(st.size, uint64_t{next} * st.chunk_size);
    t.retries = 0;
    publish(t);
    notify(t);
    pump(t);
}

void TransferEngine::on_complete(Transfer& t, bool ok) {
    if (t.status.state != TransferState::in_progress)
        return;
    if (!ok) {
        spdlog::warn("Transfer: {} failed verification at the receiver", t.status.id);
        fail(t, errc::integrity_error, false);
        return;
    }
    spdlog::info("Transfer: {} delivered ({} bytes)", t.status.id, t.status.size);
    apply(t, TransferEvent::verified);
}

// ── Receiver ────────────────────────────────────────────────────────────────

void TransferEngine::on_offer(const std::shared_ptr<Session>& session, const json& message) {
    const TransferId id = message.at("id").get<std::string>();
    const std::string name = message.at("name").get<std::string>();
    const uint64_t size = message.at("size").get<uint64_t>();
    const std::string checksum = message.at("sha256").get<std::string>();
    const uint32_t chunk_size = message.at("chunk_size").get<uint32_t>();

    auto reply_reject = [&](const char* reason) {
        auto reject = transfer_message("reject", id);
        reject["reason"] = reason;
        session->send(std::move(reject));
    };
    auto reply_accept = [&](uint32_t from) {
        auto accept = transfer_message("accept", id);
        accept["from"] = from;
        session->send(std::move(accept));
    };

    if (id.empty() || chunk_size == 0 || chunk_size > kMaxChunkSize) {
        reply_reject("protocol");
        return;
    }

    if (auto* existing = find(id)) {
        auto& st = existing->status;
        if (st.direction != TransferDirection::incoming || st.peer_id != session->peer_id()) {
            reply_reject("protocol");
            return;
        }

        if (st.state == TransferState::completed) {
            auto complete = transfer_message("complete", id);
            complete["ok"] = true;
            session->send(std::move(complete));
            return;
        }

        if (!is_terminal(st.state)) {
            if (existing->session == session) {
                reply_accept(st.chunks_done);
                return;
            }
            if (st.state == TransferState::in_progress) {
                existing->session.reset();
                apply(*existing, TransferEvent::session_lost, errc::session_lost);
            }
            if (st.file_name != fs::path(name).filename().string() || st.size != size || st.checksum != checksum ||
                st.chunk_size != chunk_size) {
                spdlog::warn("Transfer: resume of {} does not match the partial file", id);
                reply_reject("resume_mismatch");
                fail(*existing, errc::resume_mismatch, false);
                return;
            }

            std::error_code fec;
            fs::resize_file(existing->part_path, st.bytes_done, fec);
            existing->file.close();
            existing->file.clear();
            existing->file.open(existing->part_path, std::ios::in | std::ios::out | std::ios::binary);
            if (fec || !existing->file.is_open()) {
                reply_reject("io");
                fail(*existing, errc::io_error, false);
                return;
            }

            existing->session = session;
            st.session_id = session->id();
            apply(*existing, TransferEvent::resumed);
            spdlog::info("Transfer: {} resumes at chunk {}/{}", id, st.chunks_done, st.chunks);
            reply_accept(st.chunks_done);
            if (st.chunks_done == st.chunks)
                finalize_incoming(*existing);
            return;
        }

        // A failed or cancelled transfer offered again starts over.
        transfers_.erase(id);
    }

    const std::string file_name = fs::path(name).filename().string();
    if (file_name.empty() || file_name == "." || file_name == "..") {
        spdlog::warn("Transfer: refusing offer {} with unusable name '{}'", id, name);
        reply_reject("protocol");
        return;
    }

    std::error_code fec;
    const fs::path dir(config_.download_dir);
    fs::create_directories(dir, fec);
    if (fec) {
        spdlog::error("Transfer: cannot create {}: {}", dir.string(), fec.message());
        reply_reject("io");
        return;
    }

    auto t = std::make_unique<Transfer>(strand_);
    t->part_path = (dir / ("." + id + ".part")).string();
    t->file.open(t->part_path, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
    if (!t->file.is_open()) {
        spdlog::error("Transfer: cannot open {}", t->part_path);
        reply_reject("io");
        return;
    }

    auto& st = t->status;
    st.id = id;
    st.direction = TransferDirection::incoming;
    st.peer_id = session->peer_id();
    st.session_id = session->id();
    st.file_name = file_name;
    st.path = (dir / file_name).string();
    st.size = size;
    st.checksum = checksum;
    st.chunk_size = chunk_size;
    st.chunks = chunk_count(size, chunk_size);
    t->session = session;

    auto& ref = *t;
    transfers_[id] = std::move(t);
    publish(ref);
    notify(ref);
    spdlog::info("Transfer: receiving {} ({} bytes) from {} as {}", file_name, size, st.peer_id.substr(0, 16), id);

    apply(ref, TransferEvent::accepted);
    reply_accept(0);
    if (ref.status.chunks == 0)
        finalize_incoming(ref);
}

void TransferEngine::on_chunk(Transfer& t, uint32_t seq, const Bytes& data) {
    auto& st = t.status;
    if (st.state != TransferState::in_progress)
        return;

    auto ack = [&] {
        auto message = transfer_message("ack", st.id);
        message["next"] = st.chunks_done;
        send(t, std::move(message));
    };

    if (seq < st.chunks_done) {
        ack();
        return;
    }
    if (seq >= st.chunks) {
        fail(t, errc::protocol_error, true);
        return;
    }
    if (seq > st.chunks_done)
        return;   // gap; the sender goes back to the first unacknowledged chunk

    const uint64_t offset = uint64_t{seq} * st.chunk_size;
    const uint64_t expected = std::min<uint64_t>(st.chunk_size, st.size - offset);
    if (data.size() != expected) {
        spdlog::warn("Transfer: chunk {} of {} has {} bytes, expected {}", seq, st.id, data.size(), expected);
        fail(t, errc::protocol_error, true);
        return;
    }

    t.file.seekp(static_cast<std::streamoff>(offset));
    t.file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!t.file) {
        spdlog::error("Transfer: write to {} failed", t.part_path);
        fail(t, errc::io_error, true);
        return;
    }

    ++st.chunks_done;
    st.bytes_done += data.size();
    publish(t);
    notify(t);
    ack();

    if (st.chunks_done == st.chunks)
        finalize_incoming(t);
}

void TransferEngine::finalize_incoming(Transfer& t) {
    t.file.close();
    hash_file(t.part_path, [this, id = t.status.id, session = t.session](std::optional<std::string> actual) {
        auto* t = find(id);
        if (!t || stopped_ || t->session != session || t->status.state != TransferState::in_progress)
            return;
        on_part_hashed(*t, std::move(actual));
    });
}

void TransferEngine::on_part_hashed(Transfer& t, std::optional<std::string> actual) {
    auto& st = t.status;
    if (!actual) {
        fail(t, errc::io_error, true);
        return;
    }

    auto complete = transfer_message("complete", st.id);
    if (*actual != st.checksum) {
        spdlog::warn("Transfer: {} checksum mismatch, expected {} got {}", st.id, st.checksum, *actual);
        complete["ok"] = false;
        send(t, std::move(complete));
        fail(t, errc::integrity_error, false);
        return;
    }

    std::error_code fec;
    const auto destination = unique_destination(fs::path(config_.download_dir), st.file_name);
    fs::rename(t.part_path, destination, fec);
    if (fec) {
        spdlog::error("Transfer: cannot move {} into place: {}", t.part_path, fec.message());
        fail(t, errc::io_error, true);
        return;
    }
    st.path = destination.string();

    complete["ok"] = true;
    send(t, std::move(complete));
    spdlog::info("Transfer: {} saved to {}", st.id, st.path);
    apply(t, TransferEvent::verified);
}

// ── Bookkeeping ─────────────────────────────────────────────────────────────

bool TransferEngine::apply(Transfer& t, TransferEvent event, std::error_code ec) {
    auto next = transition(t.status.state, event);
    if (!next) {
        spdlog::error("Transfer: illegal event {} in state {} for {}", to_string(event), to_string(t.status.state),
                      t.status.id);
        return false;
    }
    spdlog::debug("Transfer: {} {} -> {}", t.status.id, to_string(t.status.state), to_string(*next));
    t.status.state = *next;
    if (ec)
        t.status.error = ec;

    if (*next == TransferState::interrupted)
        arm_expiry(t);
    else
        t.expiry.cancel();

    if (is_terminal(*next)) {
        release(t);
        schedule_retention(t);
    }
    publish(t);
    notify(t);
    return true;
}

void TransferEngine::fail(Transfer& t, std::error_code ec, bool tell_peer) {
    if (tell_peer && t.session) {
        auto message = transfer_message("cancel", t.status.id);
        message["reason"] = error_to_reason(ec);
        send(t, std::move(message));
    }
    const bool incoming = t.status.direction == TransferDirection::incoming;
    apply(t, ec == errc::cancelled ? TransferEvent::cancelled : TransferEvent::failed, ec);

    if (incoming && !t.part_path.empty()) {
        std::error_code fec;
        fs::remove(t.part_path, fec);
        if (fec)
            spdlog::warn("Transfer: cannot remove {}: {}", t.part_path, fec.message());
    }
}

void TransferEngine::send(Transfer& t, json message) {
    if (t.session)
        t.session->send(std::move(message));
}

void TransferEngine::release(Transfer& t) {
    t.ack_timer.cancel();
    t.awaiting_accept = false;
    if (t.file.is_open())
        t.file.close();
    t.session.reset();
}

void TransferEngine::publish(const Transfer& t) {
    std::lock_guard<std::mutex> lock(view_mutex_);
    view_[t.status.id] = t.status;
}

void TransferEngine::notify(const Transfer& t) {
    if (observer_)
        observer_(t.status);
}

void TransferEngine::arm_expiry(Transfer& t) {
    t.expiry.expires_after(config_.resume_window);
    t.expiry.async_wait([this, id = t.status.id](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted)
            return;
        auto* t = find(id);
        if (!t || t->status.state != TransferState::interrupted)
            return;
        spdlog::warn("Transfer: {} was not resumed in time, giving up", id);
        fail(*t, errc::timed_out, false);
    });
}

void TransferEngine::schedule_retention(Transfer& t) {
    t.retention.expires_after(config_.retention);
    t.retention.async_wait([this, id = t.status.id](const asio::error_code& ec) {
        if (ec == asio::error::operation_aborted)
            return;
        transfers_.erase(id);
        std::lock_guard<std::mutex> lock(view_mutex_);
        view_.erase(id);
    });
}

void TransferEngine::hash_file(const std::string& path, HashHandler done) {
    asio::post(hasher_, [this, path, done = std::move(done)]() mutable {
        auto checksum = file_sha256(path);
        asio::post(strand_, [done = std::move(done), checksum = std::move(checksum)]() mutable {
            done(std::move(checksum));
        });
    });
}

TransferEngine::Transfer* TransferEngine::find(const TransferId& id) {
    auto it = transfers_.find(id);
    return it == transfers_.end() ? nullptr : it->second.get();
}

} // namespace kizuna
