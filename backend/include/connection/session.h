#pragma once

#include <asio.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "config/engine_config.h"
#include "crypto/session_cipher.h"
#include "network/transport.h"
#include "security/handshake.h"

namespace kizuna {

struct SessionInfo {
    std::string id;
    PeerId peer_id;
    std::string peer_name;
    std::string user_name;
    TransportKind transport = TransportKind::tcp;
    SecurityLevel security = SecurityLevel::plaintext;
    std::string remote_address;
    bool initiator = false;

    [[nodiscard]] bool encrypted() const { return security != SecurityLevel::plaintext; }
    [[nodiscard]] bool authenticated() const { return security == SecurityLevel::authenticated; }
};

/**
 * An established channel to one peer.
 *
 * Owned by the ConnectionManager. Transfer and stream engines hold shared
 * references and exchange messages on their own named channel; every write
 * goes through one queue so frames never interleave on the transport.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
    using MessageHandler = std::function<void(const nlohmann::json& message)>;
    using SendHandler = std::function<void(std::error_code)>;
    using CloseHandler = std::function<void(std::error_code reason)>;

    Session(asio::io_context& io,
            std::shared_ptr<Channel> channel,
            HandshakeResult handshake,
            bool initiator,
            const NetworkingConfig& config);

    [[nodiscard]] const SessionInfo& info() const { return info_; }
    [[nodiscard]] const std::string& id() const { return info_.id; }
    [[nodiscard]] const PeerId& peer_id() const { return info_.peer_id; }

    /// Route messages whose "ch" equals `channel` to `handler` (runs on the session strand).
    void set_message_handler(const std::string& channel, MessageHandler handler);

    /// Runs once when the session ends; an empty reason means a local close.
    void set_close_handler(CloseHandler handler);

    /// Begin reading and keepalive.
    void start();

    /// Queue a message; `done` runs after it is written or the session ends.
    void send(nlohmann::json message, SendHandler done = {});

    /// Messages queued or being written.
    [[nodiscard]] std::size_t queue_depth() const { return depth_.load(); }
    [[nodiscard]] bool is_open() const { return open_.load(); }

    /// Say goodbye to the peer, then close.
    void close();

    /// Close immediately, reporting `reason`.
    void abort(std::error_code reason);

private:
    struct Outgoing {
        nlohmann::json message;
        SendHandler done;
    };

    void do_read();
    void on_read(std::error_code ec, Bytes frame);
    void handle_frame(Bytes frame);
    void do_write();
    void on_written(std::error_code ec);
    void schedule_keepalive();
    void finish(std::error_code reason);

    asio::io_context& io_;
    asio::strand<asio::io_context::executor_type> strand_;
    std::shared_ptr<Channel> channel_;
    SessionInfo info_;
    std::unique_ptr<SessionCipher> cipher_;
    NetworkingConfig config_;

    std::mutex handlers_mutex_;
    std::map<std::string, MessageHandler> handlers_;
    CloseHandler close_handler_;

    // Strand-only state.
    std::deque<Outgoing> queue_;
    bool writing_ = false;
    bool closing_ = false;
    bool finished_ = false;
    bool heard_since_tick_ = true;
    unsigned missed_ = 0;
    asio::steady_timer keepalive_;

    std::atomic<std::size_t> depth_{0};
    std::atomic<bool> open_{true};
};

} // namespace kizuna
