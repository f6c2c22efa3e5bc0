#include "outbox/net/url.hpp"

#include <cctype>
#include <stdexcept>

namespace outbox::net {

std::string Url::host_header() const {
    const bool bracket = host.find(':') != std::string::npos;
    std::string header = bracket ? "[" + host + "]" : host;
    if (port != 80) {
        header += ":" + std::to_string(port);
    }
    return header;
}

std::string Url::to_string() const {
    return scheme + "://" + host_header() + target;
}

std::string strip_trailing_slashes(std::string text) {
    while (!text.empty() && text.back() == '/') {
        text.pop_back();
    }
    return text;
}

std::string normalize_base_url(const std::string& endpoint) {
    const auto first = endpoint.find_first_not_of(" \t");
    const auto last = endpoint.find_last_not_of(" \t");
    std::string base = first == std::string::npos
        ? std::string{}
        : strip_trailing_slashes(endpoint.substr(first, last - first + 1));
    if (base.empty()) {
        return base;
    }
    if (base.rfind("http://", 0) != 0 && base.rfind("https://", 0) != 0) {
        base = "http://" + base;
    }
    return base;
}

Result<Url> parse_url(const std::string& text) {
    if (text.rfind("https://", 0) == 0) {
        return Fail<Url>(ErrorCode::ConfigurationMissing, "TLS endpoints are not supported: " + text);
    }
    if (text.rfind("http://", 0) != 0) {
        return Fail<Url>(ErrorCode::InvalidArgument, "Expected an http:// URL: " + text);
    }

    Url url;
    std::string rest = text.substr(7);
    const auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    url.target = slash == std::string::npos ? "/" : rest.substr(slash);

    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            return Fail<Url>(ErrorCode::InvalidArgument, "Unterminated IPv6 host: " + text);
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return Fail<Url>(ErrorCode::InvalidArgument, "Malformed authority: " + text);
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        const auto colon = authority.find(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (url.host.empty()) {
        return Fail<Url>(ErrorCode::InvalidArgument, "Missing host: " + text);
    }

    if (!port_text.empty()) {
        for (char c : port_text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return Fail<Url>(ErrorCode::InvalidArgument, "Invalid port: " + text);
            }
        }
        unsigned long port = 0;
        try {
            port = std::stoul(port_text);
        } catch (const std::out_of_range&) {
            port = 0;
        }
        if (port == 0 || port > 65535) {
            return Fail<Url>(ErrorCode::InvalidArgument, "Invalid port: " + text);
        }
        url.port = static_cast<std::uint16_t>(port);
    }

    return Ok(url);
}

Result<Url> endpoint_url(const std::string& base_url, const std::string& path) {
    const auto base = normalize_base_url(base_url);
    if (base.empty()) {
        return Fail<Url>(ErrorCode::ConfigurationMissing, "No API endpoint configured");
    }
    return parse_url(base + path);
}

} // namespace outbox::net
