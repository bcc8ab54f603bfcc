/**
 * kizuna error category.
 */

#include "common/error.h"

#include <asio/error.hpp>

namespace kizuna {

namespace {

class ErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "kizuna"; }

    std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
        case errc::not_initialized:         return "engine not initialized";
        case errc::already_initialized:     return "engine already initialized";
        case errc::discovery_adapter_error: return "discovery adapter failed";
        case errc::peer_not_found:          return "peer not found";
        case errc::trust_denied:            return "peer not trusted";
        case errc::approval_timeout:        return "manual approval timed out";
        case errc::handshake_failed:        return "handshake verification failed";
        case errc::connection_failed:       return "connection failed";
        case errc::transport_unavailable:   return "transport unavailable";
        case errc::session_required:        return "no established session";
        case errc::session_lost:            return "session lost";
        case errc::integrity_error:         return "checksum mismatch";
        case errc::io_error:                return "local i/o error";
        case errc::invalid_stream_kind:     return "invalid stream kind";
        case errc::invalid_quality:         return "quality out of range";
        case errc::transfer_not_found:      return "unknown transfer";
        case errc::stream_not_found:        return "unknown stream";
        case errc::resume_mismatch:         return "file changed since transfer started";
        case errc::cancelled:               return "operation cancelled";
        case errc::timed_out:               return "operation timed out";
        case errc::protocol_error:          return "protocol error";
        case errc::invalid_config:          return "invalid configuration";
        }
        return "unknown kizuna error";
    }
};

} // namespace

const std::error_category& error_category() noexcept {
    static const ErrorCategory category;
    return category;
}

std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), error_category()};
}

bool is_transient(const std::error_code& ec) noexcept {
    if (ec == errc::timed_out || ec == errc::connection_failed || ec == errc::session_lost)
        return true;
    return ec == asio::error::connection_refused
        || ec == asio::error::connection_reset
        || ec == asio::error::connection_aborted
        || ec == asio::error::network_unreachable
        || ec == asio::error::host_unreachable
        || ec == asio::error::timed_out
        || ec == asio::error::eof;
}

} // namespace kizuna
