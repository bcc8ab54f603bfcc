#pragma once

#include <asio.hpp>
#include <fstream>
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
#include "transfer/transfer_types.h"

namespace kizuna {

/**
 * Chunked, resumable file transfer over established sessions.
 *
 * Messages on the "transfer" channel:
 *   offer {id, name, size, sha256, chunk_size, resume}
 *   accept {id, from} | reject {id, reason}
 *   chunk {id, seq, data} -> ack {id, next}
 *   complete {id, ok}
 *   cancel {id}
 *
 * The sender keeps at most `window` chunks unacknowledged. Acks are
 * cumulative: `next` is the count of chunks the receiver has written in
 * order. A stalled window is resent from the first unacknowledged chunk.
 * The receiver writes into `.<id>.part` and only renames it once the whole
 * file matches the declared checksum. After the last ack the sender waits
 * `complete_timeout` for that verdict.
 *
 * An interrupted transfer closes its file and fails with timed_out unless it
 * resumes within `resume_window`.
 *
 * All state lives on one strand; status() reads a snapshot. Whole-file
 * hashes run on a separate thread and post their result back.
 */
class TransferEngine {
public:
    using Observer = std::function<void(const TransferStatus&)>;
    using DoneHandler = std::function<void()>;

    TransferEngine(asio::io_context& io, const TransferConfig& config);

    /// Runs on the engine strand on every state change and progress step.
    void set_observer(Observer observer);

    /// Route this session's transfer messages here and resume interrupted transfers to its peer.
    void attach(const std::shared_ptr<Session>& session);

    /// Local close: cancel every transfer still using `session`.
    void session_closing(const std::shared_ptr<Session>& session);

    /// The session ended. Transfers on it are interrupted when `reason` is set.
    void session_closed(const std::shared_ptr<Session>& session, std::error_code reason);

    /**
     * Offer `path` to the peer on `session`. Fails with io_error when the file
     * cannot be read and session_required when the session is gone.
     */
    TransferId start(const std::string& path, const std::shared_ptr<Session>& session, std::error_code& ec);

    /// Resume an interrupted outgoing transfer on `session`.
    void resume(const TransferId& id, const std::shared_ptr<Session>& session, std::error_code& ec);

    void cancel(const TransferId& id, std::error_code& ec);

    std::optional<TransferStatus> status(const TransferId& id) const;
    std::vector<TransferStatus> transfers() const;

    /// Cancel everything and release files and timers; `done` runs afterwards.
    void shutdown(DoneHandler done);

private:
    struct Transfer {
        explicit Transfer(asio::strand<asio::io_context::executor_type>& strand)
            : ack_timer(strand)
            , expiry(strand)
            , retention(strand) {}

        TransferStatus status;
        std::shared_ptr<Session> session;
        std::fstream file;
        std::string part_path;         // receiver only

        // Sender cursor.
        uint32_t next_to_send = 0;
        unsigned retries = 0;
        bool awaiting_accept = false;

        asio::steady_timer ack_timer;   // acks, then the completion verdict
        asio::steady_timer expiry;      // while interrupted
        asio::steady_timer retention;
    };

    using HashHandler = std::function<void(std::optional<std::string>)>;

    void on_message(const std::shared_ptr<Session>& session, const nlohmann::json& message);

    // Sender.
    void resume_on(Transfer& t, const std::shared_ptr<Session>& session);
    void send_offer(Transfer& t);
    void on_accept(Transfer& t, uint32_t from);
    void on_source_hashed(const TransferId& id, std::optional<std::string> checksum);
    void pump(Transfer& t);
    void arm_ack_timer(Transfer& t);
    void arm_complete_timer(Transfer& t);
    void on_ack_timeout(const TransferId& id);
    void on_ack(Transfer& t, uint32_t next);
    void on_complete(Transfer& t, bool ok);

    // Receiver.
    void on_offer(const std::shared_ptr<Session>& session, const nlohmann::json& message);
    void on_chunk(Transfer& t, uint32_t seq, const Bytes& data);
    void finalize_incoming(Transfer& t);
    void on_part_hashed(Transfer& t, std::optional<std::string> actual);

    bool apply(Transfer& t, TransferEvent event, std::error_code ec = {});
    void fail(Transfer& t, std::error_code ec, bool tell_peer);
    void send(Transfer& t, nlohmann::json message);
    void release(Transfer& t);
    void publish(const Transfer& t);
    void notify(const Transfer& t);
    void arm_expiry(Transfer& t);
    void schedule_retention(Transfer& t);
    void hash_file(const std::string& path, HashHandler done);
    Transfer* find(const TransferId& id);

    asio::io_context& io_;
    asio::strand<asio::io_context::executor_type> strand_;
    TransferConfig config_;
    Observer observer_;

    // Strand-only state.
    std::map<TransferId, std::unique_ptr<Transfer>> transfers_;
    std::map<PeerId, std::weak_ptr<Session>> attached_;
    bool stopped_ = false;

    mutable std::mutex view_mutex_;
    std::map<TransferId, TransferStatus> view_;

    // Last member: joined first on destruction.
    asio::thread_pool hasher_{1};
};

} // namespace kizuna
