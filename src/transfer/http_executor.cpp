#include "outbox/transfer/http_executor.hpp"

#include "outbox/queue/codec.hpp"
#include "outbox/transfer/payload.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>

namespace outbox::transfer {
using json = nlohmann::json;

HttpTransferExecutor::HttpTransferExecutor(net::HttpClient& client,
                                           std::string upload_path,
                                           std::chrono::milliseconds timeout)
    : client_(client)
    , upload_path_(std::move(upload_path))
    , timeout_(timeout) {}

MultipartBuilder HttpTransferExecutor::build_form(const queue::QueueItem& item,
                                                  const config::EndpointConfig& endpoint,
                                                  std::string media) {
    MultipartBuilder builder;
    builder.add_field("userKey", endpoint.user_key);
    builder.add_field("mediaType", queue::to_string(item.media_kind));
    builder.add_field("recipients", json(item.recipients).dump());
    builder.add_field("timestamp", std::to_string(item.timestamp));
    if (!item.overlays.empty()) {
        builder.add_field("textOverlays", json(item.overlays).dump());
    }
    builder.add_file("media",
                     "media_" + std::to_string(item.timestamp) + "." + queue::file_extension(item.media_kind),
                     queue::content_type(item.media_kind),
                     std::move(media));
    return builder;
}

Result<void> HttpTransferExecutor::upload(const queue::QueueItem& item,
                                          const config::EndpointConfig& endpoint,
                                          const ProgressCallback& on_progress) {
    if (endpoint.user_key.empty()) {
        return Err<void>(Error{ErrorCode::ConfigurationMissing, "No user key configured"});
    }
    auto url = net::endpoint_url(endpoint.base_url, upload_path_);
    if (url.is_error()) {
        return Err<void>(url.error());
    }

    auto media = read_payload(item.payload_ref);
    if (media.is_error()) {
        return Err<void>(media.error());
    }

    auto form = build_form(item, endpoint, std::move(media.value()));
    auto body = form.build();
    spdlog::debug("POST {} ({} bytes) for item {}", url.value().to_string(), body.size(), item.id);

    int reported = -1;
    net::SendProgress progress = [&](std::uint64_t sent, std::uint64_t total) {
        if (!on_progress || total == 0) {
            return;
        }
        const int percent = static_cast<int>(std::min<std::uint64_t>(100, sent * 100 / total));
        if (percent > reported) {
            reported = percent;
            on_progress(percent);
        }
    };

    auto reply = client_.post(url.value(), form.content_type(), std::move(body), timeout_, progress);
    if (reply.is_error()) {
        return Err<void>(reply.error());
    }
    return classify_reply(reply.value());
}

Result<void> HttpTransferExecutor::classify_reply(const net::HttpReply& reply) {
    if (reply.is_success()) {
        auto parsed = json::parse(reply.body, nullptr, false);
        if (parsed.is_discarded()) {
            return Err<void>(Error{ErrorCode::ResponseUnparseable,
                                   "Server returned a non-JSON body (HTTP " + std::to_string(reply.status) + ")"});
        }
        return Ok();
    }
    if (reply.status == 403) {
        return Err<void>(Error{ErrorCode::ServerRejected, "Invalid permissions: HTTP 403"});
    }

    std::string detail = reply.body.substr(0, 200);
    return Err<void>(Error{ErrorCode::ServerError,
                           "Server error: HTTP " + std::to_string(reply.status)
                               + (detail.empty() ? std::string{} : " - " + detail)});
}

} // namespace outbox::transfer
