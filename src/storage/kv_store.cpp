#include "outbox/storage/kv_store.hpp"
#include "outbox/storage/dir_lock.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <system_error>

namespace outbox::storage {
namespace fs = std::filesystem;

FileKeyValueStore::FileKeyValueStore(fs::path root)
    : root_(std::move(root)) {
    // Failure here resurfaces as a Storage error from the first set().
    std::error_code ec;
    fs::create_directories(root_, ec);
}

fs::path FileKeyValueStore::path_for(const std::string& key) const {
    std::string name;
    name.reserve(key.size() + 5);
    for (char c : key) {
        const auto uc = static_cast<unsigned char>(c);
        name.push_back(std::isalnum(uc) || c == '-' || c == '_' ? c : '_');
    }
    return root_ / (name + ".json");
}

Result<std::optional<std::string>> FileKeyValueStore::get(const std::string& key) const {
    // Readers need no file lock: writers replace the blob by rename.
    std::lock_guard lock(mutex_);
    return read_locked(key);
}

Result<void> FileKeyValueStore::set(const std::string& key, const std::string& value) {
    std::lock_guard lock(mutex_);
    DirectoryLock dir_lock(root_, kLockName);
    auto locked = dir_lock.lock();
    if (locked.is_error()) {
        return locked;
    }
    return write_locked(key, value);
}

Result<void> FileKeyValueStore::update(const std::string& key, const Transform& transform) {
    std::lock_guard lock(mutex_);
    DirectoryLock dir_lock(root_, kLockName);
    auto locked = dir_lock.lock();
    if (locked.is_error()) {
        return locked;
    }

    auto current = read_locked(key);
    if (current.is_error()) {
        return Err<void>(current.error());
    }
    auto next = transform(current.value());
    if (next.is_error()) {
        return Err<void>(next.error());
    }
    if (!next.value()) {
        return Ok();
    }
    return write_locked(key, *next.value());
}

Result<std::optional<std::string>> FileKeyValueStore::read_locked(const std::string& key) const {
    const auto path = path_for(key);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Ok(std::optional<std::string>{});
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Fail<std::optional<std::string>>(ErrorCode::Storage,
                                                "Failed to open " + path.string());
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();
    return Ok(std::optional<std::string>(buffer.str()));
}

Result<void> FileKeyValueStore::write_locked(const std::string& key, const std::string& value) {
    const auto path = path_for(key);
    auto staging = path;
    staging += ".tmp";

    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec && !fs::exists(root_)) {
        return Fail<void>(ErrorCode::Storage, "Failed to create directory: " + root_.string());
    }

    {
        std::ofstream output(staging, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Fail<void>(ErrorCode::Storage, "Failed to open " + staging.string());
        }
        output.write(value.data(), static_cast<std::streamsize>(value.size()));
        output.flush();
        if (!output) {
            return Fail<void>(ErrorCode::Storage, "Failed to write " + staging.string());
        }
    }

    fs::rename(staging, path, ec);
    if (ec) {
        fs::remove(staging, ec);
        return Fail<void>(ErrorCode::Storage, "Failed to replace " + path.string());
    }
    return Ok();
}

Result<void> FileKeyValueStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    DirectoryLock dir_lock(root_, kLockName);
    auto locked = dir_lock.lock();
    if (locked.is_error()) {
        return locked;
    }
    std::error_code ec;
    fs::remove(path_for(key), ec);
    if (ec) {
        return Fail<void>(ErrorCode::Storage, "Failed to remove key " + key + ": " + ec.message());
    }
    return Ok();
}

Result<std::optional<std::string>> MemoryKeyValueStore::get(const std::string& key) const {
    std::lock_guard lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return Ok(std::optional<std::string>{});
    }
    return Ok(std::optional<std::string>(it->second));
}

Result<void> MemoryKeyValueStore::set(const std::string& key, const std::string& value) {
    std::lock_guard lock(mutex_);
    if (fail_writes_) {
        return Fail<void>(ErrorCode::Storage, "Write rejected for key " + key);
    }
    values_[key] = value;
    ++writes_;
    return Ok();
}

Result<void> MemoryKeyValueStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    values_.erase(key);
    return Ok();
}

Result<void> MemoryKeyValueStore::update(const std::string& key, const Transform& transform) {
    std::lock_guard lock(mutex_);
    std::optional<std::string> current;
    if (auto it = values_.find(key); it != values_.end()) {
        current = it->second;
    }

    auto next = transform(current);
    if (next.is_error()) {
        return Err<void>(next.error());
    }
    if (!next.value()) {
        return Ok();
    }
    if (fail_writes_) {
        return Fail<void>(ErrorCode::Storage, "Write rejected for key " + key);
    }
    values_[key] = std::move(*next.value());
    ++writes_;
    return Ok();
}

void MemoryKeyValueStore::set_fail_writes(bool fail) {
    std::lock_guard lock(mutex_);
    fail_writes_ = fail;
}

std::size_t MemoryKeyValueStore::write_count() const {
    std::lock_guard lock(mutex_);
    return writes_;
}

} // namespace outbox::storage
