#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "common/types.h"

namespace kizuna {

/**
 * A connected, ordered, reliable byte-frame pipe to one remote endpoint.
 *
 * At most one send and one receive may be outstanding at a time; the session
 * layer above serializes writes.
 */
class Channel {
public:
    using SendHandler = std::function<void(std::error_code)>;
    using ReceiveHandler = std::function<void(std::error_code, Bytes)>;

    virtual ~Channel() = default;

    virtual TransportKind kind() const = 0;
    virtual std::string remote_address() const = 0;

    virtual void async_send(Bytes frame, SendHandler handler) = 0;
    virtual void async_receive(ReceiveHandler handler) = 0;

    /// Idempotent. Outstanding operations complete with an error.
    virtual void close() = 0;
};

/**
 * One connection medium (QUIC, WebRTC, WebSocket, TCP, ...).
 *
 * The connection manager is written against this interface only.
 */
class TransportAdapter {
public:
    using AcceptHandler = std::function<void(std::shared_ptr<Channel>)>;
    using ConnectHandler = std::function<void(std::error_code, std::shared_ptr<Channel>)>;

    virtual ~TransportAdapter() = default;

    virtual TransportKind kind() const = 0;

    /// Start accepting inbound channels.
    virtual std::error_code listen(AcceptHandler on_accept) = 0;

    /// Port advertised in discovery beacons; 0 when not IP based.
    virtual uint16_t port() const { return 0; }

    /// Full address advertised in beacons for transports that are not reached by IP and port.
    virtual std::string advertised_address() const { return {}; }

    /// Open a channel to `address` ("<kind>://..."), failing after `timeout`.
    virtual void async_connect(const std::string& address,
                               std::chrono::milliseconds timeout,
                               ConnectHandler handler) = 0;

    /// Stop listening. Channels already handed out stay open.
    virtual void close() = 0;
};

} // namespace kizuna
