#pragma once

#include "outbox/core/result.hpp"
#include "outbox/storage/kv_store.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace outbox::config {

/**
 * @brief Where uploads go and who they are sent as
 */
struct EndpointConfig {
    std::string user_key;
    std::string base_url;
};

/**
 * @brief Read-only view of the endpoint settings consumed by the processor
 *
 * nullopt when either the user key or the base URL is blank; every
 * pre-flight gate fails closed in that case.
 */
class SettingsProvider {
public:
    virtual ~SettingsProvider() = default;
    virtual std::optional<EndpointConfig> endpoint_config() const = 0;
};

struct Settings {
    std::string user_api_key;
    std::string api_endpoint;
    std::int64_t message_check_frequency_ms = 900000;
};

struct SettingsUpdate {
    std::optional<std::string> user_api_key;
    std::optional<std::string> api_endpoint;
    std::optional<std::int64_t> message_check_frequency_ms;
};

/**
 * @brief Settings persisted under "@app_settings" in the key-value store
 *
 * Blob layout: {userApiKey, apiEndpoint, messageCheckFrequency}.
 */
class KeyValueSettingsProvider : public SettingsProvider {
public:
    static constexpr const char* kStorageKey = "@app_settings";
    static constexpr std::int64_t kMinCheckFrequencyMs = 30000;

    explicit KeyValueSettingsProvider(storage::KeyValueStore& kv);

    /// A missing or corrupt blob resets to defaults (blank endpoint).
    Result<void> load();

    /**
     * Validate, merge and persist
     *
     * Rejects blank key/endpoint and a check frequency under 30 s. Trailing
     * slashes are stripped from the endpoint. Nothing is changed on error.
     */
    Result<void> update(const SettingsUpdate& update);

    Settings settings() const;
    std::optional<EndpointConfig> endpoint_config() const override;

private:
    storage::KeyValueStore& kv_;
    mutable std::mutex mutex_;
    Settings settings_;
};

} // namespace outbox::config
