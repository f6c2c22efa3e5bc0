#include "outbox/core/error.hpp"

namespace outbox {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ConfigurationMissing: return "configuration_missing";
        case ErrorCode::PayloadMissing: return "payload_missing";
        case ErrorCode::ServerRejected: return "server_rejected";
        case ErrorCode::ServerError: return "server_error";
        case ErrorCode::TransportError: return "transport_error";
        case ErrorCode::ResponseUnparseable: return "response_unparseable";
        case ErrorCode::ConnectivityUnavailable: return "connectivity_unavailable";
        case ErrorCode::ServerUnavailable: return "server_unavailable";
        case ErrorCode::Storage: return "storage";
        case ErrorCode::Parse: return "parse";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::NotFound: return "not_found";
    }
    return "unknown";
}

bool is_transient(ErrorCode code) noexcept {
    return code == ErrorCode::ServerError ||
           code == ErrorCode::TransportError ||
           code == ErrorCode::ResponseUnparseable;
}

} // namespace outbox
