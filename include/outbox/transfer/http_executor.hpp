#pragma once

#include "outbox/net/http_client.hpp"
#include "outbox/transfer/executor.hpp"
#include "outbox/transfer/multipart.hpp"

#include <chrono>
#include <string>

namespace outbox::transfer {

/**
 * @brief Uploads an item as multipart/form-data to <base>/_api/v1/upload
 *
 * Form fields: userKey, mediaType, recipients (JSON array), timestamp,
 * textOverlays (JSON array, only when non-empty), media (the payload as
 * media_<timestamp>.jpg|mp4).
 */
class HttpTransferExecutor : public TransferExecutor {
public:
    HttpTransferExecutor(net::HttpClient& client,
                         std::string upload_path = "/_api/v1/upload",
                         std::chrono::milliseconds timeout = std::chrono::milliseconds(120000));

    Result<void> upload(const queue::QueueItem& item,
                        const config::EndpointConfig& endpoint,
                        const ProgressCallback& on_progress) override;

    /// 2xx+JSON ok, 2xx+other unparseable, 403 rejected, anything else server error.
    static Result<void> classify_reply(const net::HttpReply& reply);

    static MultipartBuilder build_form(const queue::QueueItem& item,
                                       const config::EndpointConfig& endpoint,
                                       std::string media);

private:
    net::HttpClient& client_;
    std::string upload_path_;
    std::chrono::milliseconds timeout_;
};

} // namespace outbox::transfer
