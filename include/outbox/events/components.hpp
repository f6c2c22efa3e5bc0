/**
 * @file components.hpp
 * @brief Observers of the upload engine built on EventBus
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * UploadStatusComponent status(bus);
 * // QueueProcessor emits; all three react.
 *
 * Each component must outlive any emit() that can reach it, or be
 * destroyed first; destructors unsubscribe.
 */

#pragma once

#include "outbox/events/event_bus.hpp"
#include "outbox/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace outbox::events {

/**
 * @brief Holds subscription ids and drops them on destruction
 */
class Subscriber {
public:
    explicit Subscriber(EventBus& bus) : bus_(bus) {}

    virtual ~Subscriber() {
        for (auto& cancel : cancels_) {
            cancel();
        }
    }

    Subscriber(const Subscriber&) = delete;
    Subscriber& operator=(const Subscriber&) = delete;

protected:
    template<typename EventType>
    void listen(std::function<void(const EventType&)> handler) {
        const auto id = bus_.subscribe<EventType>(std::move(handler));
        cancels_.push_back([this, id] { bus_.unsubscribe<EventType>(id); });
    }

private:
    EventBus& bus_;
    std::vector<std::function<void()>> cancels_;
};

/**
 * @brief Logs every engine event through spdlog
 *
 * Progress is logged at debug level; everything else at info, failures
 * at warn.
 */
class LoggerComponent : public Subscriber {
public:
    explicit LoggerComponent(EventBus& bus) : Subscriber(bus) {
        listen<ItemEnqueuedEvent>([](const ItemEnqueuedEvent& e) {
            spdlog::info("[Enqueued] id={} kind={} recipients={}",
                         e.id, queue::to_string(e.media_kind), e.recipient_count);
        });
        listen<DrainPassStartedEvent>([](const DrainPassStartedEvent& e) {
            spdlog::debug("[PassStarted] queued={}", e.queued);
        });
        listen<DrainPassFinishedEvent>([](const DrainPassFinishedEvent& e) {
            if (queue::is_gate_failure(e.report.outcome)) {
                spdlog::info("[PassSkipped] reason={}", queue::to_string(e.report.outcome));
                return;
            }
            spdlog::info("[PassFinished] outcome={} attempted={} completed={} failed={} retried={}",
                         queue::to_string(e.report.outcome), e.report.attempted,
                         e.report.completed, e.report.failed, e.report.retried);
        });
        listen<UploadStartedEvent>([](const UploadStartedEvent& e) {
            spdlog::info("[UploadStarted] id={} attempt={}", e.id, e.attempt);
        });
        listen<UploadProgressEvent>([](const UploadProgressEvent& e) {
            spdlog::debug("[UploadProgress] id={} {}%", e.id, e.percent);
        });
        listen<UploadCompletedEvent>([](const UploadCompletedEvent& e) {
            spdlog::info("[UploadCompleted] id={}", e.id);
        });
        listen<UploadRetryScheduledEvent>([](const UploadRetryScheduledEvent& e) {
            spdlog::warn("[RetryScheduled] id={} retry={} reason={}", e.id, e.retry_count, e.reason);
        });
        listen<UploadFailedEvent>([](const UploadFailedEvent& e) {
            spdlog::warn("[UploadFailed] id={} reason={}", e.id, e.reason);
        });
        listen<HistoryReconciledEvent>([](const HistoryReconciledEvent& e) {
            spdlog::info("[HistoryReconciled] repaired={}", e.repaired);
        });
        listen<ConnectivityChangedEvent>([](const ConnectivityChangedEvent& e) {
            spdlog::info("[Connectivity] {} -> {} ({}{})",
                         e.previous.connected ? "online" : "offline",
                         e.current.connected ? "online" : "offline",
                         net::to_string(e.current.transport),
                         e.current.metered ? ", metered" : "");
        });
    }
};

/**
 * @brief Running counters for a session
 */
class MetricsComponent : public Subscriber {
public:
    struct Stats {
        std::atomic<std::uint64_t> enqueued{0};
        std::atomic<std::uint64_t> passes{0};
        std::atomic<std::uint64_t> gated_passes{0};
        std::atomic<std::uint64_t> attempts{0};
        std::atomic<std::uint64_t> completed{0};
        std::atomic<std::uint64_t> retries{0};
        std::atomic<std::uint64_t> failed{0};
        std::atomic<std::uint64_t> reconciled{0};
    };

    explicit MetricsComponent(EventBus& bus) : Subscriber(bus) {
        listen<ItemEnqueuedEvent>([this](const ItemEnqueuedEvent&) { stats_.enqueued++; });
        listen<DrainPassFinishedEvent>([this](const DrainPassFinishedEvent& e) {
            if (queue::is_gate_failure(e.report.outcome)) {
                stats_.gated_passes++;
            } else if (e.report.outcome == queue::PassOutcome::Drained) {
                stats_.passes++;
            }
        });
        listen<UploadStartedEvent>([this](const UploadStartedEvent&) { stats_.attempts++; });
        listen<UploadCompletedEvent>([this](const UploadCompletedEvent&) { stats_.completed++; });
        listen<UploadRetryScheduledEvent>([this](const UploadRetryScheduledEvent&) { stats_.retries++; });
        listen<UploadFailedEvent>([this](const UploadFailedEvent&) { stats_.failed++; });
        listen<HistoryReconciledEvent>([this](const HistoryReconciledEvent& e) { stats_.reconciled += e.repaired; });
    }

    const Stats& get_stats() const { return stats_; }

    void print_stats() const {
        spdlog::info("Session statistics:");
        spdlog::info("  Enqueued:      {}", stats_.enqueued.load());
        spdlog::info("  Drain passes:  {} (gated: {})", stats_.passes.load(), stats_.gated_passes.load());
        spdlog::info("  Attempts:      {}", stats_.attempts.load());
        spdlog::info("  Completed:     {}", stats_.completed.load());
        spdlog::info("  Retries:       {}", stats_.retries.load());
        spdlog::info("  Failed:        {}", stats_.failed.load());
        spdlog::info("  Reconciled:    {}", stats_.reconciled.load());
    }

private:
    Stats stats_;
};

/**
 * @brief Pull-based view of "what is uploading right now" for status displays
 */
class UploadStatusComponent : public Subscriber {
public:
    explicit UploadStatusComponent(EventBus& bus) : Subscriber(bus) {
        listen<UploadStartedEvent>([this](const UploadStartedEvent& e) {
            std::lock_guard lock(mutex_);
            active_id_ = e.id;
            last_progress_ = 0;
        });
        listen<UploadProgressEvent>([this](const UploadProgressEvent& e) {
            std::lock_guard lock(mutex_);
            if (active_id_ == e.id) {
                last_progress_ = e.percent;
            }
        });
        listen<UploadCompletedEvent>([this](const UploadCompletedEvent& e) {
            {
                std::lock_guard lock(mutex_);
                if (active_id_ == e.id) {
                    last_progress_ = 100;
                }
            }
            finish(e.id);
        });
        listen<UploadRetryScheduledEvent>([this](const UploadRetryScheduledEvent& e) { finish(e.id); });
        listen<UploadFailedEvent>([this](const UploadFailedEvent& e) {
            has_failures_ = true;
            finish(e.id);
        });
    }

    std::optional<std::string> active_upload() const {
        std::lock_guard lock(mutex_);
        return active_id_;
    }

    /// Percent of the active upload, or of the last one that ran.
    int last_progress() const {
        std::lock_guard lock(mutex_);
        return last_progress_;
    }

    bool has_failures() const { return has_failures_.load(); }

private:
    void finish(const std::string& id) {
        std::lock_guard lock(mutex_);
        if (active_id_ == id) {
            active_id_.reset();
        }
    }

    mutable std::mutex mutex_;
    std::optional<std::string> active_id_;
    int last_progress_ = 0;
    std::atomic<bool> has_failures_{false};
};

} // namespace outbox::events
