#pragma once

#include "outbox/config/settings.hpp"
#include "outbox/core/result.hpp"
#include "outbox/queue/types.hpp"

#include <functional>

namespace outbox::transfer {

/// Percent complete, 0-100, non-decreasing within one upload.
using ProgressCallback = std::function<void(int percent)>;

/**
 * @brief Performs one upload attempt for one queue item
 *
 * Errors are classified by ErrorCode: ServerRejected and PayloadMissing are
 * permanent, ServerError/TransportError/ResponseUnparseable are transient,
 * ConfigurationMissing means the endpoint became unusable mid-pass.
 */
class TransferExecutor {
public:
    virtual ~TransferExecutor() = default;

    virtual Result<void> upload(const queue::QueueItem& item,
                                const config::EndpointConfig& endpoint,
                                const ProgressCallback& on_progress) = 0;
};

} // namespace outbox::transfer
