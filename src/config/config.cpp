#include "outbox/config/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace outbox::config {
using json = nlohmann::json;

namespace {

std::chrono::milliseconds millis_or(const json& section, const char* key, std::chrono::milliseconds fallback) {
    const auto value = section.value(key, static_cast<std::int64_t>(fallback.count()));
    if (value < 0) {
        throw std::invalid_argument(std::string(key) + " must not be negative");
    }
    return std::chrono::milliseconds(value);
}

const json& section_or_empty(const json& root, const char* key) {
    static const json empty = json::object();
    auto it = root.find(key);
    if (it == root.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

} // namespace

Result<AppConfig> parse_config(const std::string& text) {
    auto root = json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return Fail<AppConfig>(ErrorCode::Parse, "Config is not a JSON object");
    }

    AppConfig config;
    try {
        config.data_dir = root.value("data_dir", config.data_dir.string());
        config.log_level = root.value("log_level", config.log_level);

        const auto& processor = section_or_empty(root, "processor");
        config.processor.max_retries = processor.value("max_retries", config.processor.max_retries);
        config.processor.process_interval =
            millis_or(processor, "process_interval_ms", config.processor.process_interval);
        config.processor.require_unmetered = processor.value("require_unmetered", config.processor.require_unmetered);

        const auto& health = section_or_empty(root, "health");
        config.health.path = health.value("path", config.health.path);
        config.health.timeout = millis_or(health, "timeout_ms", config.health.timeout);

        const auto& upload = section_or_empty(root, "upload");
        config.upload.path = upload.value("path", config.upload.path);
        config.upload.timeout = millis_or(upload, "timeout_ms", config.upload.timeout);

        const auto& connectivity = section_or_empty(root, "connectivity");
        config.connectivity.poll_interval =
            millis_or(connectivity, "poll_interval_ms", config.connectivity.poll_interval);
        config.connectivity.sysfs_root =
            connectivity.value("sysfs_root", config.connectivity.sysfs_root.string());
        config.connectivity.metered_interfaces =
            connectivity.value("metered_interfaces", config.connectivity.metered_interfaces);
    } catch (const json::exception& e) {
        return Fail<AppConfig>(ErrorCode::Parse, std::string("Invalid config: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return Fail<AppConfig>(ErrorCode::InvalidArgument, std::string("Invalid config: ") + e.what());
    }

    if (config.health.path.empty() || config.health.path.front() != '/') {
        return Fail<AppConfig>(ErrorCode::InvalidArgument, "health.path must start with '/'");
    }
    if (config.upload.path.empty() || config.upload.path.front() != '/') {
        return Fail<AppConfig>(ErrorCode::InvalidArgument, "upload.path must start with '/'");
    }
    return Ok(config);
}

Result<AppConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Fail<AppConfig>(ErrorCode::NotFound, "Cannot open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return parse_config(buffer.str());
}

} // namespace outbox::config
