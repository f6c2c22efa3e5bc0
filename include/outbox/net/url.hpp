#pragma once

#include "outbox/core/result.hpp"

#include <cstdint>
#include <string>

namespace outbox::net {

struct Url {
    std::string scheme = "http";
    std::string host;
    std::uint16_t port = 80;
    std::string target = "/";   ///< Path (and query) sent on the request line

    /// "host" or "host:port" when the port is not the scheme default.
    std::string host_header() const;
    std::string to_string() const;
};

std::string strip_trailing_slashes(std::string text);

/**
 * @brief Canonical form of a user-entered endpoint
 *
 * "example.org:8080/" becomes "http://example.org:8080".
 */
std::string normalize_base_url(const std::string& endpoint);

/**
 * @brief Parse an absolute http:// URL
 *
 * https:// is rejected with ErrorCode::ConfigurationMissing since no TLS
 * transport is built in; anything unparseable is ErrorCode::InvalidArgument.
 */
Result<Url> parse_url(const std::string& text);

/// normalize_base_url(base_url) + path, parsed.
Result<Url> endpoint_url(const std::string& base_url, const std::string& path);

} // namespace outbox::net
