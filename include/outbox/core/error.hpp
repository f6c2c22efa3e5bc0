#pragma once

#include <string>

namespace outbox {

/**
 * @brief Failure categories shared by every layer of the upload pipeline
 *
 * The processor decides what happens to a queued item purely from the code:
 * - fatal to the pass (item stays pending): ConfigurationMissing,
 *   ConnectivityUnavailable, ServerUnavailable
 * - fatal to the item (no retry): PayloadMissing, ServerRejected
 * - transient (retried up to the bound): ServerError, TransportError,
 *   ResponseUnparseable
 */
enum class ErrorCode {
    ConfigurationMissing,
    PayloadMissing,
    ServerRejected,
    ServerError,
    TransportError,
    ResponseUnparseable,
    ConnectivityUnavailable,
    ServerUnavailable,
    Storage,
    Parse,
    InvalidArgument,
    NotFound
};

struct Error {
    ErrorCode code = ErrorCode::Storage;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}
};

const char* to_string(ErrorCode code) noexcept;

/// True for failures where another attempt of the same upload may succeed.
bool is_transient(ErrorCode code) noexcept;

} // namespace outbox
