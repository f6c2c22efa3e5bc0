#pragma once

/**
 * @file kv_store.hpp
 * @brief String-keyed blob storage backing the queue, history and settings
 *
 * WHY THIS FILE EXISTS:
 * The upload queue and its history are persisted as two independent blobs
 * ("@upload_queue", "@upload_history"), next to the endpoint settings and the
 * contact list. All of them go through this small interface so the stores
 * can be exercised in tests without touching the disk.
 *
 * DURABILITY:
 * FileKeyValueStore writes every value to "<key>.tmp" first and renames it
 * over the live file, so a crash mid-write leaves either the old or the new
 * blob, never a truncated one.
 *
 * CONCURRENT WRITERS:
 * Several outbox processes may share one data directory. update() is a
 * read-modify-write that holds "<root>/outbox.lock" from the read to the
 * rename, so a writer always starts from the latest blob and no other
 * process can slip a write in between.
 */

#include "outbox/core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace outbox::storage {

class KeyValueStore {
public:
    /**
     * Receives the stored value (nullopt when unset) and returns the value to
     * write. Returning nullopt leaves the key untouched; an error aborts the
     * update and is passed back to the caller.
     *
     * The transform runs with the store locked. It may get() other keys from
     * the same store but must not write to it.
     */
    using Transform = std::function<Result<std::optional<std::string>>(const std::optional<std::string>& current)>;

    virtual ~KeyValueStore() = default;

    /// nullopt when the key was never written (not an error).
    virtual Result<std::optional<std::string>> get(const std::string& key) const = 0;
    virtual Result<void> set(const std::string& key, const std::string& value) = 0;
    virtual Result<void> remove(const std::string& key) = 0;

    /// Atomic read-modify-write of one key.
    virtual Result<void> update(const std::string& key, const Transform& transform) = 0;
};

/**
 * @brief One file per key under a root directory
 */
class FileKeyValueStore : public KeyValueStore {
public:
    explicit FileKeyValueStore(std::filesystem::path root);

    Result<std::optional<std::string>> get(const std::string& key) const override;
    Result<void> set(const std::string& key, const std::string& value) override;
    Result<void> remove(const std::string& key) override;
    Result<void> update(const std::string& key, const Transform& transform) override;

    const std::filesystem::path& root() const noexcept { return root_; }

    /// Maps "@upload_queue" to "<root>/_upload_queue.json".
    std::filesystem::path path_for(const std::string& key) const;

    static constexpr const char* kLockName = "outbox";

private:
    Result<std::optional<std::string>> read_locked(const std::string& key) const;
    Result<void> write_locked(const std::string& key, const std::string& value);

    std::filesystem::path root_;
    mutable std::recursive_mutex mutex_;
};

/**
 * @brief Volatile store for tests and dry runs
 *
 * set_fail_writes(true) makes every subsequent set() or update() fail with
 * ErrorCode::Storage, which lets callers verify they do not commit
 * in-memory state that never reached storage.
 */
class MemoryKeyValueStore : public KeyValueStore {
public:
    Result<std::optional<std::string>> get(const std::string& key) const override;
    Result<void> set(const std::string& key, const std::string& value) override;
    Result<void> remove(const std::string& key) override;
    Result<void> update(const std::string& key, const Transform& transform) override;

    void set_fail_writes(bool fail);
    std::size_t write_count() const;

private:
    mutable std::recursive_mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
    bool fail_writes_ = false;
    std::size_t writes_ = 0;
};

} // namespace outbox::storage
