#pragma once

/**
 * @file config.hpp
 * @brief Process-level configuration for the outbox runtime
 *
 * Every field has a default, so running without a config file is valid.
 * File layout (all keys optional):
 *
 * {
 *   "data_dir": "./outbox_data",
 *   "log_level": "info",
 *   "processor":    {"max_retries": 3, "process_interval_ms": 2000, "require_unmetered": true},
 *   "health":       {"path": "/_api/v1/health", "timeout_ms": 5000},
 *   "upload":       {"path": "/_api/v1/upload", "timeout_ms": 120000},
 *   "connectivity": {"poll_interval_ms": 5000, "sysfs_root": "/sys/class/net",
 *                    "metered_interfaces": ["wwan", "ppp", "usb", "rmnet"]}
 * }
 */

#include "outbox/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace outbox::config {

struct ProcessorSection {
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds process_interval{2000};
    bool require_unmetered = true;
};

struct HealthSection {
    std::string path = "/_api/v1/health";
    std::chrono::milliseconds timeout{5000};
};

struct UploadSection {
    std::string path = "/_api/v1/upload";
    std::chrono::milliseconds timeout{120000};
};

struct ConnectivitySection {
    std::chrono::milliseconds poll_interval{5000};
    std::filesystem::path sysfs_root = "/sys/class/net";
    std::vector<std::string> metered_interfaces{"wwan", "ppp", "usb", "rmnet"};
};

struct AppConfig {
    std::filesystem::path data_dir = "outbox_data";
    std::string log_level = "info";
    ProcessorSection processor;
    HealthSection health;
    UploadSection upload;
    ConnectivitySection connectivity;
};

/// Parse a config document; missing keys keep their defaults.
Result<AppConfig> parse_config(const std::string& text);

/// Load from disk; a missing file is an error (callers decide whether to fall back).
Result<AppConfig> load_config(const std::filesystem::path& path);

} // namespace outbox::config
