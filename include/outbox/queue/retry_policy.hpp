#pragma once

#include <cstdint>

namespace outbox::queue {

/**
 * @brief Retry budget for transient upload failures
 *
 * retry_count counts failed attempts. The item is exhausted once it has
 * failed more than max_retries times, i.e. after max_retries + 1 attempts.
 * The same predicate is used before an attempt and right after a failure.
 */
struct RetryPolicy {
    std::uint32_t max_retries = 3;

    bool exhausted(std::uint32_t retry_count) const noexcept { return retry_count > max_retries; }
    std::uint32_t max_attempts() const noexcept { return max_retries + 1; }
};

} // namespace outbox::queue
