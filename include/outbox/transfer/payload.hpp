#pragma once

#include "outbox/core/result.hpp"

#include <filesystem>
#include <string>

namespace outbox::transfer {

/// Filesystem path behind a payload reference; "file://" is stripped.
std::filesystem::path payload_path(const std::string& payload_ref);

bool payload_exists(const std::string& payload_ref);

/**
 * @brief Whole payload in memory
 *
 * ErrorCode::PayloadMissing when the file is gone, ErrorCode::Storage when
 * it exists but cannot be read.
 */
Result<std::string> read_payload(const std::string& payload_ref);

} // namespace outbox::transfer
