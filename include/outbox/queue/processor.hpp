#pragma once

/**
 * @file processor.hpp
 * @brief Drains the upload queue whenever the network allows it
 *
 * WHY THIS FILE EXISTS:
 * Enqueueing must never wait for the network. The processor owns the
 * decision of *when* to upload (pre-flight gates, rate limit, retries) and
 * the bookkeeping that keeps QueueStore and HistoryLog consistent.
 *
 * DRAIN PASS:
 * 1. Single-flight: a pass that finds another one running returns
 *    AlreadyRunning without touching anything
 * 2. Gates, once per pass: endpoint configured, server healthy, link up,
 *    transport allowed by policy. A closed gate aborts the pass and leaves
 *    every item as it was
 * 3. Items in creation order, one at a time. An item that fails
 *    transiently goes back to pending and waits for the next pass
 *
 * SCHEDULING (worker thread, after start()):
 * - trigger(true) runs a pass as soon as the worker is free
 * - trigger(false) inside process_interval of the last pass is deferred
 *   to the end of the interval, never dropped
 * - After a drained pass with items still queued the worker re-arms itself
 * - After a gate failure it waits for enqueue() or a connectivity change
 *
 * EXAMPLE USAGE:
 * QueueProcessor processor(queue, history, oracle, probe, executor, settings, bus);
 * processor.load();           // reads both stores and reconciles history
 * processor.start();          // drains the backlog
 * processor.enqueue("/media/clip.mp4", MediaKind::Video, {"42"});
 * processor.stop();
 */

#include "outbox/config/settings.hpp"
#include "outbox/core/result.hpp"
#include "outbox/core/time.hpp"
#include "outbox/events/event_bus.hpp"
#include "outbox/events/event_queue.hpp"
#include "outbox/events/events.hpp"
#include "outbox/net/connectivity.hpp"
#include "outbox/net/health_probe.hpp"
#include "outbox/queue/history_log.hpp"
#include "outbox/queue/pass.hpp"
#include "outbox/queue/queue_store.hpp"
#include "outbox/queue/retry_policy.hpp"
#include "outbox/transfer/executor.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace outbox::queue {

struct ProcessorOptions {
    RetryPolicy retry;
    std::chrono::milliseconds process_interval{2000};
    net::TransportPolicy transport_policy = net::TransportPolicy::UnmeteredOnly;
    // Reconciliation puts "uploading" queue items back to pending. Turn off
    // when another process may be draining the same queue right now.
    bool reset_stale_uploads = true;
};

/// Reason recorded when the payload file is gone before an attempt.
inline constexpr const char* kPayloadMissingReason = "payload missing";

class QueueProcessor {
public:
    QueueProcessor(QueueStore& queue,
                   HistoryLog& history,
                   net::ConnectivityOracle& connectivity,
                   net::HealthProbe& health,
                   transfer::TransferExecutor& executor,
                   const config::SettingsProvider& settings,
                   events::EventBus& bus,
                   ProcessorOptions options = {});
    ~QueueProcessor();

    QueueProcessor(const QueueProcessor&) = delete;
    QueueProcessor& operator=(const QueueProcessor&) = delete;

    /**
     * Read the queue and the history from storage, then reconcile
     *
     * An unreadable queue blob is returned as a Parse error and the history
     * is left unreconciled, since every in-flight entry would look orphaned.
     */
    Result<void> load();

    /**
     * Repair state left behind by a previous run
     *
     * History entries still pending/uploading without a queued item become
     * {failed, "interrupted"}. Queue items stuck in "uploading" go back to
     * pending (see ProcessorOptions::reset_stale_uploads). Runs at most once
     * per processor; load(), start() and drain_once() call it.
     * @return number of entries repaired
     */
    Result<std::size_t> reconcile_history();

    /// Spawn the worker and request a first pass.
    void start();

    /// Let the current item finish, then join the worker.
    void stop();

    /**
     * Durably record a new upload and request an immediate pass
     *
     * Returns once the item and its history entry are written; never waits
     * on the network.
     */
    Result<std::string> enqueue(std::string payload_ref,
                                MediaKind kind,
                                std::vector<std::string> recipients,
                                std::vector<TextOverlay> overlays = {});

    /// Ask the worker for a pass; `force` bypasses the rate limit.
    void trigger(bool force = false);

    /// One pass on the calling thread, ignoring the rate limit.
    PassReport drain_once();

    /// Queued items whose status is pending.
    std::vector<QueueItem> pending_uploads() const;
    std::vector<HistoryEntry> upload_history() const;
    Result<void> clear_history();

    /// Percent of the upload in flight, nullopt when idle.
    std::optional<int> current_progress() const;
    std::optional<std::string> current_upload() const;

    bool is_processing() const { return processing_.load(); }
    bool is_running() const { return running_.load(); }

    /// Outcome of the most recent health check, false before the first one.
    bool server_availability() const;
    std::chrono::milliseconds server_latency() const;

    std::optional<PassReport> last_report() const;
    const ProcessorOptions& options() const { return options_; }

private:
    struct Trigger {
        bool force = false;
    };

    enum class ItemStep {
        Next,
        AbortPass
    };

    PassOutcome run_pass(PassReport& report);
    ItemStep process_item(const std::string& id, const config::EndpointConfig& endpoint, PassReport& report);
    void fail_item(const QueueItem& item, const std::string& reason, PassReport& report);
    void on_progress(const std::string& id, int percent);

    void run_worker();
    bool should_rearm(const PassReport& report) const;

    QueueStore& queue_;
    HistoryLog& history_;
    net::ConnectivityOracle& connectivity_;
    net::HealthProbe& health_;
    transfer::TransferExecutor& executor_;
    const config::SettingsProvider& settings_;
    events::EventBus& bus_;
    ProcessorOptions options_;

    IdGenerator ids_;

    // Serialises multi-step changes spanning the queue and the history.
    mutable std::mutex state_mutex_;

    std::atomic<bool> processing_{false};
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    bool reconciled_ = false;

    mutable std::mutex status_mutex_;
    std::optional<std::string> active_id_;
    int active_progress_ = 0;
    net::HealthStatus last_health_;
    std::optional<PassReport> last_report_;
    std::optional<std::chrono::steady_clock::time_point> last_pass_;

    events::ThreadSafeQueue<Trigger> triggers_;
    std::thread worker_;
    std::unique_ptr<events::ScopedSubscription<events::ConnectivityChangedEvent>> connectivity_subscription_;
};

} // namespace outbox::queue
