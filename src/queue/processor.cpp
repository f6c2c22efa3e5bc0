#include "outbox/queue/processor.hpp"

#include "outbox/transfer/payload.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace outbox::queue {

namespace {

// Storage errors inside a pass are not fatal to the pass; they are logged
// and the affected item is picked up again by a later pass.
bool logged(const Result<void>& result, const char* action, const std::string& id) {
    if (result.is_error()) {
        spdlog::error("Could not {} for item {}: {}", action, id, result.error().message);
        return false;
    }
    return true;
}

class ProcessingGuard {
public:
    explicit ProcessingGuard(std::atomic<bool>& flag) : flag_(flag) {}
    ~ProcessingGuard() { flag_ = false; }

    ProcessingGuard(const ProcessingGuard&) = delete;
    ProcessingGuard& operator=(const ProcessingGuard&) = delete;

private:
    std::atomic<bool>& flag_;
};

} // namespace

QueueProcessor::QueueProcessor(QueueStore& queue,
                               HistoryLog& history,
                               net::ConnectivityOracle& connectivity,
                               net::HealthProbe& health,
                               transfer::TransferExecutor& executor,
                               const config::SettingsProvider& settings,
                               events::EventBus& bus,
                               ProcessorOptions options)
    : queue_(queue)
    , history_(history)
    , connectivity_(connectivity)
    , health_(health)
    , executor_(executor)
    , settings_(settings)
    , bus_(bus)
    , options_(options) {
    ids_.observe(queue_.newest_timestamp());
    for (const auto& entry : history_.entries()) {
        ids_.observe(entry.timestamp);
    }
}

QueueProcessor::~QueueProcessor() {
    stop();
}

Result<void> QueueProcessor::load() {
    auto history_loaded = history_.load();
    auto queue_loaded = queue_.load();

    ids_.observe(queue_.newest_timestamp());
    for (const auto& entry : history_.entries()) {
        ids_.observe(entry.timestamp);
    }

    if (queue_loaded.is_error()) {
        spdlog::warn("Upload queue unreadable; history left unreconciled");
        return queue_loaded;
    }
    auto reconciled = reconcile_history();
    if (history_loaded.is_error()) {
        return history_loaded;
    }
    if (reconciled.is_error()) {
        return Err<void>(reconciled.error());
    }
    return Ok();
}

Result<std::size_t> QueueProcessor::reconcile_history() {
    std::lock_guard lock(state_mutex_);
    if (reconciled_) {
        return Ok(std::size_t{0});
    }

    auto refreshed = queue_.refresh();
    if (refreshed.is_error()) {
        spdlog::error("History not reconciled, upload queue unreadable: {}", refreshed.error().message);
        return Err<std::size_t>(refreshed.error());
    }

    auto repaired = history_.reconcile_with([this] { return queue_.stored_ids(); });
    if (repaired.is_error()) {
        spdlog::error("History reconciliation failed: {}", repaired.error().message);
        return repaired;
    }
    std::size_t total = repaired.value();

    if (options_.reset_stale_uploads) {
        auto reset = queue_.reset_in_flight();
        if (reset.is_error()) {
            spdlog::error("Could not reset interrupted uploads: {}", reset.error().message);
            return Err<std::size_t>(reset.error());
        }
        for (const auto& id : reset.value()) {
            spdlog::info("Upload {} was interrupted, queued again", id);
            logged(history_.mark_pending(id, std::string(HistoryLog::kInterruptedReason)), "reset history", id);
        }
        total += reset.value().size();
    }

    reconciled_ = true;
    if (total > 0) {
        bus_.emit(events::HistoryReconciledEvent{total});
    }
    return Ok(total);
}

void QueueProcessor::start() {
    if (running_.exchange(true)) {
        return;
    }

    auto reconciled = reconcile_history();
    if (reconciled.is_error()) {
        spdlog::warn("Starting without reconciled history; will retry on next start");
    }

    stop_requested_ = false;
    triggers_.reset();
    connectivity_subscription_ = std::make_unique<events::ScopedSubscription<events::ConnectivityChangedEvent>>(
        bus_, [this](const events::ConnectivityChangedEvent& e) {
            if (!e.previous.connected && e.current.connected) {
                spdlog::info("Connectivity regained on {}, requesting a drain pass", e.current.interface_name);
                trigger(false);
            }
        });

    worker_ = std::thread([this] { run_worker(); });
    trigger(false);
    spdlog::info("Upload processor started ({} queued)", queue_.size());
}

void QueueProcessor::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    stop_requested_ = true;
    connectivity_subscription_.reset();
    triggers_.shutdown();
    if (worker_.joinable()) {
        worker_.join();
    }
    triggers_.drain();
    spdlog::info("Upload processor stopped");
}

Result<std::string> QueueProcessor::enqueue(std::string payload_ref,
                                            MediaKind kind,
                                            std::vector<std::string> recipients,
                                            std::vector<TextOverlay> overlays) {
    if (payload_ref.empty()) {
        return Fail<std::string>(ErrorCode::InvalidArgument, "Payload reference is empty");
    }

    const auto stamp = ids_.next();
    QueueItem item;
    item.id = std::to_string(stamp);
    item.payload_ref = std::move(payload_ref);
    item.media_kind = kind;
    item.recipients = std::move(recipients);
    item.timestamp = stamp;
    item.status = ItemStatus::Pending;
    item.overlays = std::move(overlays);

    {
        std::lock_guard lock(state_mutex_);
        auto appended = queue_.append(item);
        if (appended.is_error()) {
            return Err<std::string>(appended.error());
        }

        HistoryEntry entry;
        entry.id = item.id;
        entry.timestamp = item.timestamp;
        entry.media_kind = item.media_kind;
        entry.status = ItemStatus::Pending;
        auto inserted = history_.insert_if_absent(std::move(entry));
        if (inserted.is_error()) {
            // The pass inserts it again before the first attempt.
            spdlog::warn("History entry for {} not written yet: {}", item.id, inserted.error().message);
        }
    }

    bus_.emit(events::ItemEnqueuedEvent{item.id, item.media_kind, item.recipients.size()});
    trigger(true);
    return Ok(item.id);
}

void QueueProcessor::trigger(bool force) {
    triggers_.push(Trigger{force});
}

PassReport QueueProcessor::drain_once() {
    // No-op after the first successful run.
    if (reconcile_history().is_error()) {
        spdlog::warn("Draining with unreconciled history");
    }

    PassReport report;
    bool expected = false;
    if (!processing_.compare_exchange_strong(expected, true)) {
        report.outcome = PassOutcome::AlreadyRunning;
        return report;
    }

    {
        ProcessingGuard guard(processing_);
        {
            std::lock_guard lock(status_mutex_);
            last_pass_ = std::chrono::steady_clock::now();
        }
        report.outcome = run_pass(report);
        {
            std::lock_guard lock(status_mutex_);
            last_report_ = report;
        }
    }

    bus_.emit(events::DrainPassFinishedEvent{report});
    return report;
}

PassOutcome QueueProcessor::run_pass(PassReport& report) {
    // Another process may have enqueued since our last write.
    auto refreshed = queue_.refresh();
    if (refreshed.is_error()) {
        spdlog::warn("Could not re-read upload queue: {}", refreshed.error().message);
    }

    const auto items = queue_.list_pending();
    if (items.empty()) {
        return PassOutcome::QueueEmpty;
    }
    bus_.emit(events::DrainPassStartedEvent{items.size()});

    const auto endpoint = settings_.endpoint_config();
    if (!endpoint) {
        spdlog::warn("Upload endpoint not configured; {} item(s) stay queued", items.size());
        return PassOutcome::ConfigurationMissing;
    }

    auto health = health_.check(*endpoint);
    {
        std::lock_guard lock(status_mutex_);
        last_health_ = health;
    }
    if (!health.available) {
        return PassOutcome::ServerUnavailable;
    }

    const auto link = connectivity_.current();
    if (!link.connected) {
        return PassOutcome::ConnectivityUnavailable;
    }
    if (!net::transport_allowed(link, options_.transport_policy)) {
        spdlog::info("Transport {} on {} not allowed by policy", net::to_string(link.transport), link.interface_name);
        return PassOutcome::TransportNotAllowed;
    }

    for (const auto& item : items) {
        if (stop_requested_) {
            break;
        }
        if (process_item(item.id, *endpoint, report) == ItemStep::AbortPass) {
            return PassOutcome::ConfigurationMissing;
        }
    }
    return PassOutcome::Drained;
}

QueueProcessor::ItemStep QueueProcessor::process_item(const std::string& id,
                                                      const config::EndpointConfig& endpoint,
                                                      PassReport& report) {
    QueueItem item;
    {
        std::lock_guard lock(state_mutex_);
        auto current = queue_.get(id);
        if (!current) {
            return ItemStep::Next;
        }
        item = std::move(*current);

        HistoryEntry entry;
        entry.id = item.id;
        entry.timestamp = item.timestamp;
        entry.media_kind = item.media_kind;
        entry.status = item.status;
        auto inserted = history_.insert_if_absent(std::move(entry));
        if (inserted.is_error()) {
            spdlog::error("Could not create history for item {}: {}", id, inserted.error().message);
            return ItemStep::Next;
        }

        if (!item.retry_count) {
            if (!logged(queue_.update_retry_count(id, 0), "initialise retry count", id)) {
                return ItemStep::Next;
            }
            item.retry_count = 0;
        }
    }

    const auto retries = *item.retry_count;
    if (!transfer::payload_exists(item.payload_ref)) {
        fail_item(item, kPayloadMissingReason, report);
        return ItemStep::Next;
    }
    if (options_.retry.exhausted(retries)) {
        fail_item(item, "Upload failed after " + std::to_string(retries) + " attempts", report);
        return ItemStep::Next;
    }

    {
        std::lock_guard lock(state_mutex_);
        if (!logged(queue_.update_status(id, ItemStatus::Uploading), "mark uploading", id)) {
            return ItemStep::Next;
        }
        logged(history_.mark_uploading(id), "mark history uploading", id);
    }
    {
        std::lock_guard lock(status_mutex_);
        active_id_ = id;
        active_progress_ = 0;
    }

    bus_.emit(events::UploadStartedEvent{id, retries + 1});
    ++report.attempted;

    auto result = executor_.upload(item, endpoint, [this, &id](int percent) { on_progress(id, percent); });

    {
        std::lock_guard lock(status_mutex_);
        active_id_.reset();
    }

    if (result.is_ok()) {
        {
            std::lock_guard lock(state_mutex_);
            logged(history_.mark_completed(id), "mark history completed", id);
            logged(queue_.remove(id), "remove completed item", id);
        }
        ++report.completed;
        bus_.emit(events::UploadCompletedEvent{id});
        return ItemStep::Next;
    }

    const auto& error = result.error();
    switch (error.code) {
        case ErrorCode::ServerRejected:
        case ErrorCode::PayloadMissing:
            fail_item(item, error.message, report);
            return ItemStep::Next;

        case ErrorCode::ConfigurationMissing: {
            std::lock_guard lock(state_mutex_);
            logged(queue_.update_status(id, ItemStatus::Pending), "reset status", id);
            logged(history_.mark_pending(id, error.message), "reset history", id);
            spdlog::warn("Endpoint became unusable during pass: {}", error.message);
            return ItemStep::AbortPass;
        }

        default:
            if (!is_transient(error.code)) {
                spdlog::warn("Retrying item {} after unexpected {} error", id, to_string(error.code));
            }
            break;
    }

    const std::uint32_t next = retries + 1;
    bool exhausted = false;
    {
        std::lock_guard lock(state_mutex_);
        if (!logged(queue_.mark_retry(id, next), "record retry", id)) {
            return ItemStep::Next;
        }
        exhausted = options_.retry.exhausted(next);
        if (!exhausted) {
            logged(history_.mark_pending(id, error.message), "mark history pending", id);
        }
    }

    if (exhausted) {
        fail_item(item, error.message, report);
        return ItemStep::Next;
    }

    ++report.retried;
    bus_.emit(events::UploadRetryScheduledEvent{id, next, error.message});
    return ItemStep::Next;
}

void QueueProcessor::fail_item(const QueueItem& item, const std::string& reason, PassReport& report) {
    {
        std::lock_guard lock(state_mutex_);
        logged(history_.mark_failed(item.id, reason), "mark history failed", item.id);
        logged(queue_.remove(item.id), "remove failed item", item.id);
    }
    ++report.failed;
    bus_.emit(events::UploadFailedEvent{item.id, reason});
}

void QueueProcessor::on_progress(const std::string& id, int percent) {
    const int clamped = std::clamp(percent, 0, 100);
    {
        std::lock_guard lock(status_mutex_);
        if (active_id_ != id || clamped <= active_progress_) {
            return;
        }
        active_progress_ = clamped;
    }
    {
        std::lock_guard lock(state_mutex_);
        logged(history_.update_progress(id, clamped), "record progress", id);
    }
    bus_.emit(events::UploadProgressEvent{id, clamped});
}

std::vector<QueueItem> QueueProcessor::pending_uploads() const {
    return queue_.list_by_status(ItemStatus::Pending);
}

std::vector<HistoryEntry> QueueProcessor::upload_history() const {
    return history_.entries();
}

Result<void> QueueProcessor::clear_history() {
    std::lock_guard lock(state_mutex_);
    return history_.clear();
}

std::optional<int> QueueProcessor::current_progress() const {
    std::lock_guard lock(status_mutex_);
    if (!active_id_) {
        return std::nullopt;
    }
    return active_progress_;
}

std::optional<std::string> QueueProcessor::current_upload() const {
    std::lock_guard lock(status_mutex_);
    return active_id_;
}

bool QueueProcessor::server_availability() const {
    std::lock_guard lock(status_mutex_);
    return last_health_.available;
}

std::chrono::milliseconds QueueProcessor::server_latency() const {
    std::lock_guard lock(status_mutex_);
    return last_health_.latency;
}

std::optional<PassReport> QueueProcessor::last_report() const {
    std::lock_guard lock(status_mutex_);
    return last_report_;
}

bool QueueProcessor::should_rearm(const PassReport& report) const {
    if (report.outcome != PassOutcome::Drained) {
        return false;
    }
    if (queue_.empty()) {
        return false;
    }
    return queue_.list_by_status(ItemStatus::Uploading).empty();
}

void QueueProcessor::run_worker() {
    using SteadyClock = std::chrono::steady_clock;
    std::optional<SteadyClock::time_point> deferred;

    while (!stop_requested_) {
        auto next = deferred ? triggers_.pop_until(*deferred) : triggers_.pop();
        if (stop_requested_ || (!next && triggers_.is_shutdown())) {
            break;
        }

        bool requested = next.has_value();
        bool force = next && next->force;
        for (const auto& extra : triggers_.drain()) {
            requested = true;
            force = force || extra.force;
        }

        const auto now = SteadyClock::now();
        if (!requested && !(deferred && now >= *deferred)) {
            continue;
        }

        std::optional<SteadyClock::time_point> last;
        {
            std::lock_guard lock(status_mutex_);
            if (force) {
                last_pass_.reset();
            }
            last = last_pass_;
        }

        if (last && now < *last + options_.process_interval) {
            const auto due = *last + options_.process_interval;
            deferred = deferred ? std::min(*deferred, due) : due;
            continue;
        }
        deferred.reset();

        const auto report = drain_once();
        if (report.outcome == PassOutcome::AlreadyRunning) {
            // A caller ran drain_once() directly; try again after the interval.
            deferred = SteadyClock::now() + options_.process_interval;
            continue;
        }
        if (should_rearm(report)) {
            std::lock_guard lock(status_mutex_);
            deferred = last_pass_.value_or(SteadyClock::now()) + options_.process_interval;
        }
    }
}

} // namespace outbox::queue
