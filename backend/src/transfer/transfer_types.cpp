/**
 * Transfer state machine and status helpers.
 */

#include "transfer/transfer_types.h"

namespace kizuna {

const char* to_string(TransferDirection direction) {
    return direction == TransferDirection::outgoing ? "outgoing" : "incoming";
}

const char* to_string(TransferState state) {
    switch (state) {
    case TransferState::queued:      return "queued";
    case TransferState::in_progress: return "in_progress";
    case TransferState::interrupted: return "interrupted";
    case TransferState::completed:   return "completed";
    case TransferState::failed:      return "failed";
    case TransferState::cancelled:   return "cancelled";
    }
    return "unknown";
}

const char* to_string(TransferEvent event) {
    switch (event) {
    case TransferEvent::accepted:     return "accepted";
    case TransferEvent::resumed:      return "resumed";
    case TransferEvent::session_lost: return "session_lost";
    case TransferEvent::verified:     return "verified";
    case TransferEvent::failed:       return "failed";
    case TransferEvent::cancelled:    return "cancelled";
    }
    return "unknown";
}

std::optional<TransferState> transition(TransferState from, TransferEvent event) {
    using S = TransferState;
    using E = TransferEvent;

    switch (from) {
    case S::queued:
        switch (event) {
        case E::accepted:     return S::in_progress;
        case E::session_lost: return S::interrupted;
        case E::failed:       return S::failed;
        case E::cancelled:    return S::cancelled;
        default:              return std::nullopt;
        }

    case S::in_progress:
        switch (event) {
        case E::session_lost: return S::interrupted;
        case E::verified:     return S::completed;
        case E::failed:       return S::failed;
        case E::cancelled:    return S::cancelled;
        default:              return std::nullopt;
        }

    case S::interrupted:
        switch (event) {
        case E::resumed:   return S::in_progress;
        case E::failed:    return S::failed;
        case E::cancelled: return S::cancelled;
        default:           return std::nullopt;
        }

    case S::completed:
    case S::failed:
    case S::cancelled:
        return std::nullopt;
    }
    return std::nullopt;
}

bool is_terminal(TransferState state) {
    return state == TransferState::completed || state == TransferState::failed ||
           state == TransferState::cancelled;
}

double TransferStatus::progress() const {
    if (chunks == 0)
        return state == TransferState::completed ? 1.0 : 0.0;
    return static_cast<double>(chunks_done) / static_cast<double>(chunks);
}

uint32_t chunk_count(uint64_t size, uint32_t chunk_size) {
    if (chunk_size == 0)
        return 0;
    return static_cast<uint32_t>((size + chunk_size - 1) / chunk_size);
}

} // namespace kizuna
