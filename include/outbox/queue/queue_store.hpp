#pragma once

/**
 * @file queue_store.hpp
 * @brief Durable list of uploads that still need a future attempt
 *
 * WHY THIS FILE EXISTS:
 * Items are accepted while the device may be offline. They have to survive
 * process restarts until they either reach the server or fail for good, so
 * the queue is persisted on every mutation.
 *
 * WHAT IT GUARANTEES:
 * - Only non-terminal items live here; completed/failed items are removed
 * - list_pending() returns creation order (oldest first), which is the
 *   delivery order the processor follows
 * - Every mutation re-reads the stored blob, applies the change to it and
 *   rewrites it inside KeyValueStore::update(). Memory is replaced with the
 *   result only when the write succeeded, so a failed write leaves memory
 *   and storage in agreement.
 *
 * THREAD AND PROCESS SAFETY:
 * One mutex covers the in-memory list and the blob write, so two mutations
 * from different threads (caller's enqueue, processor's status update)
 * cannot interleave and lose each other's change. Another process working
 * on the same data dir (an `outbox enqueue` next to `outbox run`) is kept
 * out by the store's lock file; because each mutation starts from the
 * stored blob, its items survive our next write.
 *
 * EXAMPLE USAGE:
 * storage::FileKeyValueStore kv(data_dir);
 * QueueStore queue(kv);
 * queue.load();
 * queue.append(item);
 * for (const auto& pending : queue.list_pending()) { ... }
 */

#include "outbox/core/result.hpp"
#include "outbox/queue/types.hpp"
#include "outbox/storage/kv_store.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace outbox::queue {

class QueueStore {
public:
    static constexpr const char* kStorageKey = "@upload_queue";

    explicit QueueStore(storage::KeyValueStore& kv, std::string key = kStorageKey);

    QueueStore(const QueueStore&) = delete;
    QueueStore& operator=(const QueueStore&) = delete;

    /**
     * Replace in-memory state with the persisted blob
     *
     * A missing blob is an empty queue. A corrupt blob is reported and the
     * queue stays empty; the blob itself is left untouched until the next
     * successful write.
     */
    Result<void> load();

    /**
     * Pick up writes made by other processes since the last load or write
     *
     * Unlike load(), a failure (unreadable blob included) keeps the current
     * in-memory list.
     */
    Result<void> refresh();

    /**
     * Add a new item and persist
     *
     * @return error if an item with the same id is already queued
     */
    Result<void> append(QueueItem item);

    /**
     * All queued items, oldest creation timestamp first
     *
     * Ties on timestamp fall back to id order so the result is stable.
     */
    std::vector<QueueItem> list_pending() const;

    std::vector<QueueItem> list_by_status(ItemStatus status) const;

    std::optional<QueueItem> get(const std::string& id) const;
    bool contains(const std::string& id) const;
    std::unordered_set<std::string> ids() const;

    /**
     * Ids in the stored blob, bypassing memory
     *
     * Does not take the store's mutex, so it is safe to call from inside a
     * KeyValueStore::update() transform on the same key value store.
     */
    Result<std::unordered_set<std::string>> stored_ids() const;

    Result<void> remove(const std::string& id);
    Result<void> update_status(const std::string& id, ItemStatus status);
    Result<void> update_retry_count(const std::string& id, std::uint32_t count);

    /**
     * Record a failed attempt that will be retried
     *
     * Sets retry_count and resets status to pending in a single write, so a
     * crash cannot leave the item "uploading" with the new count.
     */
    Result<void> mark_retry(const std::string& id, std::uint32_t retry_count);

    /**
     * Put items left "uploading" by an interrupted run back to pending
     *
     * @return ids that were reset
     */
    Result<std::vector<std::string>> reset_in_flight();

    /// Largest creation timestamp currently queued, 0 when empty.
    std::int64_t newest_timestamp() const;

    std::size_t size() const;
    bool empty() const;

private:
    Result<void> mutate(const std::string& id, const std::function<void(QueueItem&)>& change);

    // `change` edits the freshly read list and returns whether anything changed.
    Result<void> commit(const std::function<Result<bool>(std::vector<QueueItem>&)>& change);

    storage::KeyValueStore& kv_;
    std::string key_;

    mutable std::mutex mutex_;
    std::vector<QueueItem> items_;
};

} // namespace outbox::queue
