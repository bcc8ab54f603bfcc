#pragma once

#include <optional>

namespace kizuna {

/**
 * Per-peer connection state.
 *
 *   discovered -> evaluating -> (approving) -> handshaking -> established
 *   any attempt state -> rejected | failed
 *   established -> closing -> closed
 *
 * An inbound session from the peer resolves an attempt in any attempt state.
 *
 * rejected, failed and closed are terminal for one attempt; a new connect
 * request starts over from evaluating.
 */
enum class ConnectionState {
    discovered,
    evaluating,
    approving,
    handshaking,
    established,
    closing,
    closed,
    rejected,
    failed,
};

/// Inputs that drive the state machine.
enum class ConnectionEvent {
    connect_requested,
    trust_allowed,
    approval_required,
    approval_granted,
    trust_denied,
    handshake_succeeded,
    inbound_accepted,       // the peer's own connection won over ours
    handshake_failed,
    connect_failed,
    cancelled,
    close_requested,
    session_lost,
    closed,
};

const char* to_string(ConnectionState state);
const char* to_string(ConnectionEvent event);

/// Next state, or nullopt when `event` is illegal in `from`.
std::optional<ConnectionState> transition(ConnectionState from, ConnectionEvent event);

/// No attempt in progress and no session held.
bool is_terminal(ConnectionState state);

/// Evaluating, approving or handshaking.
bool is_attempting(ConnectionState state);

} // namespace kizuna
