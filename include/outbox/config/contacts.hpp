#pragma once

#include "outbox/core/result.hpp"
#include "outbox/storage/kv_store.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace outbox::config {

/**
 * @brief Resolves recipient ids to names for display
 */
class ContactsDirectory {
public:
    virtual ~ContactsDirectory() = default;
    virtual std::optional<std::string> display_name(const std::string& id) const = 0;
};

/**
 * @brief Contacts cached under "@app_contacts" as [{id, display_name}]
 *
 * Read-only here; the list itself is maintained by the contacts screen.
 */
class KeyValueContactsDirectory : public ContactsDirectory {
public:
    static constexpr const char* kStorageKey = "@app_contacts";

    explicit KeyValueContactsDirectory(storage::KeyValueStore& kv);

    Result<void> load();
    std::optional<std::string> display_name(const std::string& id) const override;
    std::size_t size() const;

private:
    storage::KeyValueStore& kv_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> names_;
};

} // namespace outbox::config
