#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <system_error>

#include "common/types.h"

namespace kizuna {

using TransferId = std::string;

enum class TransferDirection {
    outgoing,
    incoming,
};

const char* to_string(TransferDirection direction);

/**
 * queued -> in_progress -> completed | failed | cancelled
 * A session drop parks a transfer in `interrupted` until it is resumed on a
 * new session or given up.
 */
enum class TransferState {
    queued,
    in_progress,
    interrupted,
    completed,
    failed,
    cancelled,
};

enum class TransferEvent {
    accepted,        // receiver agreed, chunks start flowing
    resumed,         // reattached to a new session
    session_lost,
    verified,        // receiver confirmed the checksum
    failed,
    cancelled,
};

const char* to_string(TransferState state);
const char* to_string(TransferEvent event);

/// Next state, or nullopt when `event` is illegal in `from`.
std::optional<TransferState> transition(TransferState from, TransferEvent event);

[[nodiscard]] bool is_terminal(TransferState state);

/// Point-in-time view of one transfer, on either side.
struct TransferStatus {
    TransferId id;
    TransferDirection direction = TransferDirection::outgoing;
    PeerId peer_id;
    std::string session_id;
    std::string file_name;
    std::string path;               // source file, or final file once received
    uint64_t size = 0;
    std::string checksum;           // sha256 hex declared by the sender
    uint32_t chunk_size = 0;
    uint32_t chunks = 0;
    uint32_t chunks_done = 0;       // acknowledged (sender) or written (receiver)
    uint64_t bytes_done = 0;
    TransferState state = TransferState::queued;
    std::error_code error;

    /// Fraction complete in [0, 1].
    [[nodiscard]] double progress() const;
};

/// Number of `chunk_size` chunks covering `size` bytes.
uint32_t chunk_count(uint64_t size, uint32_t chunk_size);

} // namespace kizuna
