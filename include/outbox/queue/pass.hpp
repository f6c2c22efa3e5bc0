#pragma once

#include <cstddef>

namespace outbox::queue {

/// Why a drain pass ended.
enum class PassOutcome {
    Drained,                 ///< Every eligible item was attempted
    AlreadyRunning,          ///< Another pass held the single-flight guard
    QueueEmpty,
    ConfigurationMissing,
    ServerUnavailable,
    ConnectivityUnavailable,
    TransportNotAllowed
};

struct PassReport {
    PassOutcome outcome = PassOutcome::Drained;
    std::size_t attempted = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t retried = 0;
};

const char* to_string(PassOutcome outcome) noexcept;

/// True for the outcomes produced by a closed pre-flight gate.
inline bool is_gate_failure(PassOutcome outcome) noexcept {
    return outcome == PassOutcome::ConfigurationMissing
        || outcome == PassOutcome::ServerUnavailable
        || outcome == PassOutcome::ConnectivityUnavailable
        || outcome == PassOutcome::TransportNotAllowed;
}

} // namespace outbox::queue
