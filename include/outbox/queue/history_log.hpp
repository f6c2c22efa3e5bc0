#pragma once

/**
 * @file history_log.hpp
 * @brief User-facing record of every upload, past and present
 *
 * WHY THIS FILE EXISTS:
 * The queue forgets an item as soon as it is done. The user still wants to
 * see that it was delivered, or why it was not. Entries are keyed by the
 * queue item id, inserted at most once, and only ever removed by clear().
 *
 * RECONCILIATION:
 * After a crash, an entry may still say "pending" or "uploading" although
 * the process that owned it is gone. reconcile() rewrites every such entry
 * whose id is no longer queued to {failed, "interrupted"}. It is safe to run
 * repeatedly.
 *
 * CONCURRENT WRITERS:
 * Like QueueStore, every mutation re-reads the stored blob under the key
 * value store's lock and memory follows whatever was stored last.
 */

#include "outbox/core/result.hpp"
#include "outbox/queue/types.hpp"
#include "outbox/storage/kv_store.hpp"

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace outbox::queue {

class HistoryLog {
public:
    static constexpr const char* kStorageKey = "@upload_history";
    static constexpr const char* kInterruptedReason = "interrupted";

    using QueuedIds = std::function<Result<std::unordered_set<std::string>>()>;

    explicit HistoryLog(storage::KeyValueStore& kv, std::string key = kStorageKey);

    HistoryLog(const HistoryLog&) = delete;
    HistoryLog& operator=(const HistoryLog&) = delete;

    Result<void> load();

    /**
     * Insert unless an entry with the same id exists
     *
     * @return true when inserted, false when already present
     */
    Result<bool> insert_if_absent(HistoryEntry entry);

    /// status=uploading, progress=0, error cleared
    Result<void> mark_uploading(const std::string& id);

    /**
     * Record transfer progress
     *
     * Values are clamped to 0-100 and never move backwards. Ignored (Ok)
     * unless the entry is uploading.
     */
    Result<void> update_progress(const std::string& id, int percent);

    /// status=completed, progress=100, error cleared
    Result<void> mark_completed(const std::string& id);

    Result<void> mark_failed(const std::string& id, std::string reason);

    /// Back to pending after a transient failure; progress cleared.
    Result<void> mark_pending(const std::string& id, std::optional<std::string> reason);

    /**
     * Fail every pending/uploading entry whose id is not in `queued_ids`
     *
     * @return number of entries rewritten
     */
    Result<std::size_t> reconcile(const std::unordered_set<std::string>& queued_ids);

    /**
     * Same as reconcile(), with the queued ids read while the history blob
     * is locked
     *
     * An item enqueued by another process appears in the queue before its
     * history entry is written, so ids read here cover every entry seen.
     * `queued_ids` may only read from the key value store.
     */
    Result<std::size_t> reconcile_with(const QueuedIds& queued_ids);

    /// Drop every entry. Does not touch the upload queue.
    Result<void> clear();

    std::vector<HistoryEntry> entries() const;
    std::optional<HistoryEntry> get(const std::string& id) const;
    std::size_t size() const;

private:
    Result<void> mutate(const std::string& id, const std::function<void(HistoryEntry&)>& change);

    // `change` edits the freshly read entries and returns whether anything changed.
    Result<void> commit(const std::function<Result<bool>(std::vector<HistoryEntry>&)>& change);

    storage::KeyValueStore& kv_;
    std::string key_;

    mutable std::mutex mutex_;
    std::vector<HistoryEntry> entries_;
};

} // namespace outbox::queue
