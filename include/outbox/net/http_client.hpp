#pragma once

#include "outbox/core/result.hpp"
#include "outbox/net/url.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace outbox::net {

struct HttpReply {
    int status = 0;
    std::string body;
    std::string content_type;

    bool is_success() const { return status >= 200 && status < 300; }
};

/// Called as request body bytes leave the socket; `sent` never decreases.
using SendProgress = std::function<void(std::uint64_t sent, std::uint64_t total)>;

/**
 * @brief Minimal blocking HTTP/1.1 client used by the probe and the uploader
 *
 * Any non-HTTP failure (resolve, connect, write, read, timeout) comes back as
 * ErrorCode::TransportError. HTTP error statuses are *not* errors here; they
 * are returned in HttpReply for the caller to classify.
 */
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual Result<HttpReply> get(const Url& url, std::chrono::milliseconds timeout) = 0;

    virtual Result<HttpReply> post(const Url& url,
                                   const std::string& content_type,
                                   std::string body,
                                   std::chrono::milliseconds timeout,
                                   const SendProgress& progress) = 0;
};

/**
 * @brief HttpClient over Boost.Beast
 *
 * Each call runs its own io_context to completion on the calling thread.
 * Bodies are written in kWriteChunkSize slices so progress is reported at
 * a useful granularity; the timeout applies to every individual step.
 */
class BeastHttpClient : public HttpClient {
public:
    static constexpr std::size_t kWriteChunkSize = 64 * 1024;

    explicit BeastHttpClient(std::string user_agent = "outbox/1.0");

    Result<HttpReply> get(const Url& url, std::chrono::milliseconds timeout) override;

    Result<HttpReply> post(const Url& url,
                           const std::string& content_type,
                           std::string body,
                           std::chrono::milliseconds timeout,
                           const SendProgress& progress) override;

private:
    Result<HttpReply> execute(const Url& url,
                              bool is_post,
                              const std::string& content_type,
                              std::string body,
                              std::chrono::milliseconds timeout,
                              const SendProgress* progress);

    std::string user_agent_;
};

} // namespace outbox::net
