#include "outbox/config/contacts.hpp"

#include <nlohmann/json.hpp>

namespace outbox::config {
using json = nlohmann::json;

KeyValueContactsDirectory::KeyValueContactsDirectory(storage::KeyValueStore& kv)
    : kv_(kv) {}

Result<void> KeyValueContactsDirectory::load() {
    auto blob = kv_.get(kStorageKey);
    if (blob.is_error()) {
        return Err<void>(blob.error());
    }

    std::unordered_map<std::string, std::string> names;
    if (blob.value()) {
        auto parsed = json::parse(*blob.value(), nullptr, false);
        if (parsed.is_discarded() || !parsed.is_array()) {
            return Fail<void>(ErrorCode::Parse, "Invalid contacts blob");
        }
        for (const auto& contact : parsed) {
            if (!contact.is_object()) {
                continue;
            }
            const auto id = contact.value("id", std::string{});
            const auto name = contact.value("display_name", std::string{});
            if (!id.empty()) {
                names[id] = name;
            }
        }
    }

    std::lock_guard lock(mutex_);
    names_ = std::move(names);
    return Ok();
}

std::optional<std::string> KeyValueContactsDirectory::display_name(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = names_.find(id);
    if (it == names_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t KeyValueContactsDirectory::size() const {
    std::lock_guard lock(mutex_);
    return names_.size();
}

} // namespace outbox::config
