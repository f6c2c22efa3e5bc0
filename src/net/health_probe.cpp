#include "outbox/net/health_probe.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace outbox::net {
using json = nlohmann::json;

HttpHealthProbe::HttpHealthProbe(HttpClient& client, std::string path, std::chrono::milliseconds timeout)
    : client_(client)
    , path_(std::move(path))
    , timeout_(timeout) {}

HealthStatus HttpHealthProbe::check(const config::EndpointConfig& endpoint) {
    auto url = endpoint_url(endpoint.base_url, path_);
    if (url.is_error()) {
        return record({false, std::chrono::milliseconds(0), url.error().message});
    }

    const auto started = std::chrono::steady_clock::now();
    auto reply = client_.get(url.value(), timeout_);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    if (reply.is_error()) {
        // No answer means no round trip to report.
        return record({false, std::chrono::milliseconds(0), reply.error().message});
    }
    if (!reply.value().is_success()) {
        return record({false, elapsed, "HTTP " + std::to_string(reply.value().status)});
    }

    auto body = json::parse(reply.value().body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return record({false, elapsed, "health response is not JSON"});
    }
    auto status = body.find("status");
    if (status == body.end() || !status->is_string() || status->get<std::string>() != "ok") {
        return record({false, elapsed, "health status is not ok"});
    }
    return record({true, elapsed, "ok"});
}

HealthStatus HttpHealthProbe::record(HealthStatus status) {
    available_ = status.available;
    latency_ms_ = status.latency.count();
    if (status.available) {
        spdlog::debug("Health check ok ({} ms)", status.latency.count());
    } else {
        spdlog::warn("Health check failed: {}", status.detail);
    }
    return status;
}

} // namespace outbox::net
