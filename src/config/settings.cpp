#include "outbox/config/settings.hpp"
#include "outbox/net/url.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace outbox::config {
using json = nlohmann::json;

namespace {

bool is_blank(const std::string& value) {
    return value.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

KeyValueSettingsProvider::KeyValueSettingsProvider(storage::KeyValueStore& kv)
    : kv_(kv) {}

Result<void> KeyValueSettingsProvider::load() {
    auto blob = kv_.get(kStorageKey);
    std::lock_guard lock(mutex_);
    settings_ = Settings{};

    if (blob.is_error()) {
        return Err<void>(blob.error());
    }
    if (!blob.value()) {
        return Ok();
    }

    auto parsed = json::parse(*blob.value(), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        spdlog::warn("Settings blob is unreadable, using defaults");
        return Fail<void>(ErrorCode::Parse, "Invalid settings blob");
    }

    try {
        settings_.user_api_key = parsed.value("userApiKey", std::string{});
        settings_.api_endpoint = net::strip_trailing_slashes(parsed.value("apiEndpoint", std::string{}));
        settings_.message_check_frequency_ms =
            parsed.value("messageCheckFrequency", Settings{}.message_check_frequency_ms);
    } catch (const json::exception& e) {
        settings_ = Settings{};
        return Fail<void>(ErrorCode::Parse, std::string("Invalid settings blob: ") + e.what());
    }
    return Ok();
}

Result<void> KeyValueSettingsProvider::update(const SettingsUpdate& update) {
    if (update.user_api_key && is_blank(*update.user_api_key)) {
        return Fail<void>(ErrorCode::InvalidArgument, "User API Key cannot be empty");
    }
    if (update.api_endpoint && is_blank(*update.api_endpoint)) {
        return Fail<void>(ErrorCode::InvalidArgument, "API Endpoint cannot be empty");
    }
    if (update.message_check_frequency_ms && *update.message_check_frequency_ms < kMinCheckFrequencyMs) {
        return Fail<void>(ErrorCode::InvalidArgument, "Message check frequency must be at least 30 seconds");
    }

    std::lock_guard lock(mutex_);
    Settings next = settings_;
    if (update.user_api_key) {
        next.user_api_key = *update.user_api_key;
    }
    if (update.api_endpoint) {
        next.api_endpoint = net::strip_trailing_slashes(*update.api_endpoint);
    }
    if (update.message_check_frequency_ms) {
        next.message_check_frequency_ms = *update.message_check_frequency_ms;
    }

    if (is_blank(next.user_api_key) || is_blank(next.api_endpoint)) {
        return Fail<void>(ErrorCode::InvalidArgument,
                          "Invalid settings: User API Key and API Endpoint are required");
    }

    const json blob{
        {"userApiKey", next.user_api_key},
        {"apiEndpoint", next.api_endpoint},
        {"messageCheckFrequency", next.message_check_frequency_ms},
    };
    auto written = kv_.set(kStorageKey, blob.dump());
    if (written.is_error()) {
        return written;
    }
    settings_ = std::move(next);
    return Ok();
}

Settings KeyValueSettingsProvider::settings() const {
    std::lock_guard lock(mutex_);
    return settings_;
}

std::optional<EndpointConfig> KeyValueSettingsProvider::endpoint_config() const {
    std::lock_guard lock(mutex_);
    if (is_blank(settings_.user_api_key) || is_blank(settings_.api_endpoint)) {
        return std::nullopt;
    }
    return EndpointConfig{settings_.user_api_key, settings_.api_endpoint};
}

} // namespace outbox::config
