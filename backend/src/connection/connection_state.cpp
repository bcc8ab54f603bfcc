/**
 * Connection state machine transitions.
 */

#include "connection/connection_state.h"

namespace kizuna {

const char* to_string(ConnectionState state) {
    switch (state) {
    case ConnectionState::discovered:  return "discovered";
    case ConnectionState::evaluating:  return "evaluating";
    case ConnectionState::approving:   return "approving";
    case ConnectionState::handshaking: return "handshaking";
    case ConnectionState::established: return "established";
    case ConnectionState::closing:     return "closing";
    case ConnectionState::closed:      return "closed";
    case ConnectionState::rejected:    return "rejected";
    case ConnectionState::failed:      return "failed";
    }
    return "unknown";
}

const char* to_string(ConnectionEvent event) {
    switch (event) {
    case ConnectionEvent::connect_requested:   return "connect_requested";
    case ConnectionEvent::trust_allowed:       return "trust_allowed";
    case ConnectionEvent::approval_required:   return "approval_required";
    case ConnectionEvent::approval_granted:    return "approval_granted";
    case ConnectionEvent::trust_denied:        return "trust_denied";
    case ConnectionEvent::handshake_succeeded: return "handshake_succeeded";
    case ConnectionEvent::inbound_accepted:    return "inbound_accepted";
    case ConnectionEvent::handshake_failed:    return "handshake_failed";
    case ConnectionEvent::connect_failed:      return "connect_failed";
    case ConnectionEvent::cancelled:           return "cancelled";
    case ConnectionEvent::close_requested:     return "close_requested";
    case ConnectionEvent::session_lost:        return "session_lost";
    case ConnectionEvent::closed:              return "closed";
    }
    return "unknown";
}

std::optional<ConnectionState> transition(ConnectionState from, ConnectionEvent event) {
    using S = ConnectionState;
    using E = ConnectionEvent;

    switch (from) {
    case S::discovered:
    case S::closed:
    case S::rejected:
    case S::failed:
        if (event == E::connect_requested)
            return S::evaluating;
        return std::nullopt;

    case S::evaluating:
        switch (event) {
        case E::trust_allowed:     return S::handshaking;
        case E::approval_required: return S::approving;
        case E::inbound_accepted:  return S::established;
        case E::trust_denied:      return S::rejected;
        case E::cancelled:         return S::failed;
        default:                   return std::nullopt;
        }

    case S::approving:
        switch (event) {
        case E::approval_granted: return S::handshaking;
        case E::inbound_accepted: return S::established;
        case E::trust_denied:     return S::rejected;
        case E::cancelled:        return S::failed;
        default:                  return std::nullopt;
        }

    case S::handshaking:
        switch (event) {
        case E::handshake_succeeded:
        case E::inbound_accepted:    return S::established;
        case E::trust_denied:        return S::rejected;
        case E::handshake_failed:
        case E::connect_failed:
        case E::cancelled:           return S::failed;
        default:                     return std::nullopt;
        }

    case S::established:
        switch (event) {
        case E::close_requested:
        case E::session_lost:    return S::closing;
        default:                 return std::nullopt;
        }

    case S::closing:
        if (event == E::closed)
            return S::closed;
        return std::nullopt;
    }
    return std::nullopt;
}

bool is_terminal(ConnectionState state) {
    switch (state) {
    case ConnectionState::discovered:
    case ConnectionState::closed:
    case ConnectionState::rejected:
    case ConnectionState::failed:
        return true;
    case ConnectionState::evaluating:
    case ConnectionState::approving:
    case ConnectionState::handshaking:
    case ConnectionState::established:
    case ConnectionState::closing:
        return false;
    }
    return false;
}

bool is_attempting(ConnectionState state) {
    return state == ConnectionState::evaluating
        || state == ConnectionState::approving
        || state == ConnectionState::handshaking;
}

} // namespace kizuna
