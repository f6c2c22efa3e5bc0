#include "outbox/queue/history_log.hpp"
#include "outbox/queue/codec.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace outbox::queue {

namespace {

std::vector<HistoryEntry>::iterator find_entry(std::vector<HistoryEntry>& entries, const std::string& id) {
    return std::find_if(entries.begin(), entries.end(), [&](const HistoryEntry& h) { return h.id == id; });
}

} // namespace

HistoryLog::HistoryLog(storage::KeyValueStore& kv, std::string key)
    : kv_(kv), key_(std::move(key)) {}

Result<void> HistoryLog::load() {
    std::lock_guard lock(mutex_);
    entries_.clear();

    auto blob = kv_.get(key_);
    if (blob.is_error()) {
        return Err<void>(blob.error());
    }
    if (!blob.value()) {
        return Ok();
    }

    auto decoded = decode_history(*blob.value());
    if (decoded.is_error()) {
        spdlog::error("Upload history blob is unreadable, starting empty: {}", decoded.error().message);
        return Err<void>(decoded.error());
    }
    entries_ = std::move(decoded.value());
    return Ok();
}

Result<bool> HistoryLog::insert_if_absent(HistoryEntry entry) {
    bool inserted = false;
    auto committed = commit([&](std::vector<HistoryEntry>& entries) -> Result<bool> {
        inserted = find_entry(entries, entry.id) == entries.end();
        if (inserted) {
            entries.push_back(entry);
        }
        return Ok(inserted);
    });
    if (committed.is_error()) {
        return Err<bool>(committed.error());
    }
    return Ok(inserted);
}

Result<void> HistoryLog::mark_uploading(const std::string& id) {
    return mutate(id, [](HistoryEntry& entry) {
        entry.status = ItemStatus::Uploading;
        entry.progress = 0;
        entry.error.reset();
    });
}

Result<void> HistoryLog::update_progress(const std::string& id, int percent) {
    const int clamped = std::clamp(percent, 0, 100);
    {
        // Most callbacks repeat the last value; skip the storage round trip.
        std::lock_guard lock(mutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&](const HistoryEntry& h) { return h.id == id; });
        if (it != entries_.end() && (it->status != ItemStatus::Uploading || clamped <= it->progress.value_or(0))) {
            return Ok();
        }
    }
    return commit([&](std::vector<HistoryEntry>& entries) -> Result<bool> {
        auto it = find_entry(entries, id);
        if (it == entries.end()) {
            return Fail<bool>(ErrorCode::NotFound, "No history entry: " + id);
        }
        if (it->status != ItemStatus::Uploading || clamped <= it->progress.value_or(0)) {
            return Ok(false);
        }
        it->progress = clamped;
        return Ok(true);
    });
}

Result<void> HistoryLog::mark_completed(const std::string& id) {
    return mutate(id, [](HistoryEntry& entry) {
        entry.status = ItemStatus::Completed;
        entry.progress = 100;
        entry.error.reset();
    });
}

Result<void> HistoryLog::mark_failed(const std::string& id, std::string reason) {
    return mutate(id, [reason = std::move(reason)](HistoryEntry& entry) {
        entry.status = ItemStatus::Failed;
        entry.error = reason;
    });
}

Result<void> HistoryLog::mark_pending(const std::string& id, std::optional<std::string> reason) {
    return mutate(id, [reason = std::move(reason)](HistoryEntry& entry) {
        entry.status = ItemStatus::Pending;
        entry.progress.reset();
        entry.error = reason;
    });
}

Result<std::size_t> HistoryLog::reconcile(const std::unordered_set<std::string>& queued_ids) {
    return reconcile_with([&queued_ids]() { return Ok(queued_ids); });
}

Result<std::size_t> HistoryLog::reconcile_with(const QueuedIds& queued_ids) {
    std::size_t repaired = 0;
    auto committed = commit([&](std::vector<HistoryEntry>& entries) -> Result<bool> {
        repaired = 0;
        auto queued = queued_ids();
        if (queued.is_error()) {
            return Err<bool>(queued.error());
        }
        for (auto& entry : entries) {
            const bool in_flight = entry.status == ItemStatus::Pending || entry.status == ItemStatus::Uploading;
            if (in_flight && queued.value().count(entry.id) == 0) {
                entry.status = ItemStatus::Failed;
                entry.error = kInterruptedReason;
                ++repaired;
            }
        }
        return Ok(repaired > 0);
    });
    if (committed.is_error()) {
        return Err<std::size_t>(committed.error());
    }
    return Ok(repaired);
}

Result<void> HistoryLog::clear() {
    return commit([](std::vector<HistoryEntry>& entries) -> Result<bool> {
        entries.clear();
        return Ok(true);
    });
}

std::vector<HistoryEntry> HistoryLog::entries() const {
    std::lock_guard lock(mutex_);
    return entries_;
}

std::optional<HistoryEntry> HistoryLog::get(const std::string& id) const {
    std::lock_guard lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.id == id) {
            return entry;
        }
    }
    return std::nullopt;
}

std::size_t HistoryLog::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

Result<void> HistoryLog::mutate(const std::string& id, const std::function<void(HistoryEntry&)>& change) {
    return commit([&](std::vector<HistoryEntry>& entries) -> Result<bool> {
        auto it = find_entry(entries, id);
        if (it == entries.end()) {
            return Fail<bool>(ErrorCode::NotFound, "No history entry: " + id);
        }
        change(*it);
        return Ok(true);
    });
}

Result<void> HistoryLog::commit(const std::function<Result<bool>(std::vector<HistoryEntry>&)>& change) {
    std::lock_guard lock(mutex_);
    std::vector<HistoryEntry> next;

    auto written = kv_.update(key_, [&](const std::optional<std::string>& stored)
                                        -> Result<std::optional<std::string>> {
        next.clear();
        if (stored) {
            auto decoded = decode_history(*stored);
            if (decoded.is_ok()) {
                next = std::move(decoded.value());
            } else {
                spdlog::warn("Upload history blob is unreadable, treating it as empty: {}", decoded.error().message);
            }
        }

        auto changed = change(next);
        if (changed.is_error()) {
            return Err<std::optional<std::string>>(changed.error());
        }
        if (!changed.value()) {
            return Ok(std::optional<std::string>{});
        }
        return Ok(std::optional<std::string>(encode_history(next)));
    });
    if (written.is_error()) {
        return written;
    }

    // Written or not, `next` is the latest stored state.
    entries_ = std::move(next);
    return Ok();
}

} // namespace outbox::queue
