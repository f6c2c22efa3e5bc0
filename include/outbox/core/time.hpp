#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace outbox {

using Clock = std::chrono::system_clock;

/// Milliseconds since the Unix epoch.
std::int64_t now_ms();

/**
 * @brief Hands out strictly increasing millisecond stamps
 *
 * Queue item IDs double as creation timestamps, so two items enqueued within
 * the same millisecond must still get distinct, ordered values.
 */
class IdGenerator {
public:
    std::int64_t next();

    /// Never issue a value <= `stamp` (used after reloading persisted items).
    void observe(std::int64_t stamp);

private:
    std::mutex mutex_;
    std::int64_t last_ = 0;
};

} // namespace outbox
