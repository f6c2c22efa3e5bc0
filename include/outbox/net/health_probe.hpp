#pragma once

#include "outbox/config/settings.hpp"
#include "outbox/net/http_client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace outbox::net {

struct HealthStatus {
    bool available = false;
    std::chrono::milliseconds latency{0};
    std::string detail;
};

/**
 * @brief Answers "is the upload server reachable and healthy right now?"
 */
class HealthProbe {
public:
    virtual ~HealthProbe() = default;
    virtual HealthStatus check(const config::EndpointConfig& endpoint) = 0;
};

/**
 * @brief GET <base>/_api/v1/health, healthy only on 2xx with {"status":"ok"}
 *
 * The last outcome is cached so status displays can read it without
 * issuing a request.
 */
class HttpHealthProbe : public HealthProbe {
public:
    HttpHealthProbe(HttpClient& client,
                    std::string path = "/_api/v1/health",
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    HealthStatus check(const config::EndpointConfig& endpoint) override;

    bool is_available() const { return available_.load(); }
    std::chrono::milliseconds latency() const { return std::chrono::milliseconds(latency_ms_.load()); }

private:
    HealthStatus record(HealthStatus status);

    HttpClient& client_;
    std::string path_;
    std::chrono::milliseconds timeout_;
    std::atomic<bool> available_{false};
    std::atomic<std::int64_t> latency_ms_{0};
};

} // namespace outbox::net
