#pragma once

#include <string>
#include <system_error>

namespace kizuna {

/**
 * Error codes reported by every engine component.
 *
 * Registered as an error_code enum so they travel through asio-style
 * completion handlers unchanged.
 */
enum class errc {
    not_initialized = 1,
    already_initialized,
    discovery_adapter_error,
    peer_not_found,
    trust_denied,
    approval_timeout,
    handshake_failed,
    connection_failed,
    transport_unavailable,
    session_required,
    session_lost,
    integrity_error,
    io_error,
    invalid_stream_kind,
    invalid_quality,
    transfer_not_found,
    stream_not_found,
    resume_mismatch,
    cancelled,
    timed_out,
    protocol_error,
    invalid_config,
};

const std::error_category& error_category() noexcept;

std::error_code make_error_code(errc e) noexcept;

/// True for failures worth one more attempt on the same transport.
bool is_transient(const std::error_code& ec) noexcept;

} // namespace kizuna

namespace std {
template <>
struct is_error_code_enum<kizuna::errc> : true_type {};
} // namespace std
