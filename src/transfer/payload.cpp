#include "outbox/transfer/payload.hpp"

#include <fstream>
#include <iterator>
#include <system_error>

namespace outbox::transfer {

namespace fs = std::filesystem;

fs::path payload_path(const std::string& payload_ref) {
    static const std::string kFileScheme = "file://";
    if (payload_ref.rfind(kFileScheme, 0) == 0) {
        return fs::path(payload_ref.substr(kFileScheme.size()));
    }
    return fs::path(payload_ref);
}

bool payload_exists(const std::string& payload_ref) {
    if (payload_ref.empty()) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(payload_path(payload_ref), ec);
}

Result<std::string> read_payload(const std::string& payload_ref) {
    if (!payload_exists(payload_ref)) {
        return Fail<std::string>(ErrorCode::PayloadMissing, "Payload not found: " + payload_ref);
    }

    std::ifstream input(payload_path(payload_ref), std::ios::binary);
    if (!input) {
        return Fail<std::string>(ErrorCode::Storage, "Cannot open payload: " + payload_ref);
    }
    std::string data((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return Fail<std::string>(ErrorCode::Storage, "Error reading payload: " + payload_ref);
    }
    return Ok(std::move(data));
}

} // namespace outbox::transfer
