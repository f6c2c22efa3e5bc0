#include "outbox/queue/queue_store.hpp"
#include "outbox/queue/codec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace outbox::queue {

namespace {

std::vector<QueueItem>::iterator find_item(std::vector<QueueItem>& items, const std::string& id) {
    return std::find_if(items.begin(), items.end(), [&](const QueueItem& q) { return q.id == id; });
}

} // namespace

QueueStore::QueueStore(storage::KeyValueStore& kv, std::string key)
    : kv_(kv), key_(std::move(key)) {}

Result<void> QueueStore::load() {
    std::lock_guard lock(mutex_);
    items_.clear();

    auto blob = kv_.get(key_);
    if (blob.is_error()) {
        return Err<void>(blob.error());
    }
    if (!blob.value()) {
        return Ok();
    }

    auto decoded = decode_queue(*blob.value());
    if (decoded.is_error()) {
        spdlog::error("Upload queue blob is unreadable, starting empty: {}", decoded.error().message);
        return Err<void>(decoded.error());
    }

    items_ = std::move(decoded.value());
    spdlog::debug("Loaded {} queued upload(s)", items_.size());
    return Ok();
}

Result<void> QueueStore::refresh() {
    std::lock_guard lock(mutex_);
    auto blob = kv_.get(key_);
    if (blob.is_error()) {
        return Err<void>(blob.error());
    }

    std::vector<QueueItem> fresh;
    if (blob.value()) {
        auto decoded = decode_queue(*blob.value());
        if (decoded.is_error()) {
            return Err<void>(decoded.error());
        }
        fresh = std::move(decoded.value());
    }

    items_ = std::move(fresh);
    return Ok();
}

Result<void> QueueStore::append(QueueItem item) {
    return commit([&item](std::vector<QueueItem>& items) -> Result<bool> {
        if (find_item(items, item.id) != items.end()) {
            return Fail<bool>(ErrorCode::InvalidArgument, "Item already queued: " + item.id);
        }
        items.push_back(item);
        return Ok(true);
    });
}

std::vector<QueueItem> QueueStore::list_pending() const {
    std::vector<QueueItem> sorted;
    {
        std::lock_guard lock(mutex_);
        sorted = items_;
    }
    std::stable_sort(sorted.begin(), sorted.end(), [](const QueueItem& a, const QueueItem& b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp < b.timestamp;
        }
        return a.id < b.id;
    });
    return sorted;
}

std::vector<QueueItem> QueueStore::list_by_status(ItemStatus status) const {
    auto all = list_pending();
    all.erase(std::remove_if(all.begin(), all.end(),
                             [status](const QueueItem& item) { return item.status != status; }),
              all.end());
    return all;
}

std::optional<QueueItem> QueueStore::get(const std::string& id) const {
    std::lock_guard lock(mutex_);
    for (const auto& item : items_) {
        if (item.id == id) {
            return item;
        }
    }
    return std::nullopt;
}

bool QueueStore::contains(const std::string& id) const {
    return get(id).has_value();
}

std::unordered_set<std::string> QueueStore::ids() const {
    std::lock_guard lock(mutex_);
    std::unordered_set<std::string> result;
    for (const auto& item : items_) {
        result.insert(item.id);
    }
    return result;
}

Result<std::unordered_set<std::string>> QueueStore::stored_ids() const {
    auto blob = kv_.get(key_);
    if (blob.is_error()) {
        return Err<std::unordered_set<std::string>>(blob.error());
    }

    std::unordered_set<std::string> result;
    if (!blob.value()) {
        return Ok(std::move(result));
    }
    auto decoded = decode_queue(*blob.value());
    if (decoded.is_error()) {
        return Err<std::unordered_set<std::string>>(decoded.error());
    }
    for (const auto& item : decoded.value()) {
        result.insert(item.id);
    }
    return Ok(std::move(result));
}

Result<void> QueueStore::remove(const std::string& id) {
    return commit([&id](std::vector<QueueItem>& items) -> Result<bool> {
        auto it = std::remove_if(items.begin(), items.end(), [&](const QueueItem& q) { return q.id == id; });
        if (it == items.end()) {
            return Fail<bool>(ErrorCode::NotFound, "Item not queued: " + id);
        }
        items.erase(it, items.end());
        return Ok(true);
    });
}

Result<void> QueueStore::update_status(const std::string& id, ItemStatus status) {
    return mutate(id, [status](QueueItem& item) { item.status = status; });
}

Result<void> QueueStore::update_retry_count(const std::string& id, std::uint32_t count) {
    return mutate(id, [count](QueueItem& item) { item.retry_count = count; });
}

Result<void> QueueStore::mark_retry(const std::string& id, std::uint32_t retry_count) {
    return mutate(id, [retry_count](QueueItem& item) {
        item.retry_count = retry_count;
        item.status = ItemStatus::Pending;
    });
}

Result<std::vector<std::string>> QueueStore::reset_in_flight() {
    std::vector<std::string> reset;
    auto committed = commit([&reset](std::vector<QueueItem>& items) -> Result<bool> {
        reset.clear();
        for (auto& item : items) {
            if (item.status == ItemStatus::Uploading) {
                item.status = ItemStatus::Pending;
                reset.push_back(item.id);
            }
        }
        return Ok(!reset.empty());
    });
    if (committed.is_error()) {
        return Err<std::vector<std::string>>(committed.error());
    }
    return Ok(std::move(reset));
}

std::int64_t QueueStore::newest_timestamp() const {
    std::lock_guard lock(mutex_);
    std::int64_t newest = 0;
    for (const auto& item : items_) {
        newest = std::max(newest, item.timestamp);
    }
    return newest;
}

std::size_t QueueStore::size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
}

bool QueueStore::empty() const {
    return size() == 0;
}

Result<void> QueueStore::mutate(const std::string& id, const std::function<void(QueueItem&)>& change) {
    return commit([&](std::vector<QueueItem>& items) -> Result<bool> {
        auto it = find_item(items, id);
        if (it == items.end()) {
            return Fail<bool>(ErrorCode::NotFound, "Item not queued: " + id);
        }
        change(*it);
        return Ok(true);
    });
}

Result<void> QueueStore::commit(const std::function<Result<bool>(std::vector<QueueItem>&)>& change) {
    std::lock_guard lock(mutex_);
    std::vector<QueueItem> next;

    auto written = kv_.update(key_, [&](const std::optional<std::string>& stored)
                                        -> Result<std::optional<std::string>> {
        next.clear();
        if (stored) {
            auto decoded = decode_queue(*stored);
            if (decoded.is_ok()) {
                next = std::move(decoded.value());
            } else {
                spdlog::warn("Upload queue blob is unreadable, treating it as empty: {}", decoded.error().message);
            }
        }

        auto changed = change(next);
        if (changed.is_error()) {
            return Err<std::optional<std::string>>(changed.error());
        }
        if (!changed.value()) {
            return Ok(std::optional<std::string>{});
        }
        return Ok(std::optional<std::string>(encode_queue(next)));
    });
    if (written.is_error()) {
        return written;
    }

    // Memory follows storage, including other processes' writes.
    items_ = std::move(next);
    return Ok();
}

} // namespace outbox::queue
