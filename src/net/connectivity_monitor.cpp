#include "outbox/net/connectivity_monitor.hpp"

#include "outbox/events/events.hpp"

#include <spdlog/spdlog.h>

namespace outbox::net {

ConnectivityMonitor::ConnectivityMonitor(ConnectivityOracle& oracle,
                                         events::EventBus& bus,
                                         std::chrono::milliseconds interval)
    : oracle_(oracle)
    , bus_(bus)
    , interval_(interval) {}

ConnectivityMonitor::~ConnectivityMonitor() {
    stop();
}

void ConnectivityMonitor::start() {
    {
        std::lock_guard lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
    }
    thread_ = std::thread([this] { run(); });
    spdlog::debug("Connectivity monitor polling every {} ms", interval_.count());
}

void ConnectivityMonitor::stop() {
    {
        std::lock_guard lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool ConnectivityMonitor::poll_once() {
    const auto status = oracle_.current();
    ConnectivityStatus previous;
    {
        std::lock_guard lock(mutex_);
        if (status == last_) {
            return false;
        }
        previous = last_;
        last_ = status;
    }
    bus_.emit(events::ConnectivityChangedEvent{previous, status});
    return true;
}

ConnectivityStatus ConnectivityMonitor::last_status() const {
    std::lock_guard lock(mutex_);
    return last_;
}

void ConnectivityMonitor::run() {
    std::unique_lock lock(mutex_);
    while (running_) {
        lock.unlock();
        poll_once();
        lock.lock();
        cv_.wait_for(lock, interval_, [this] { return !running_; });
    }
}

} // namespace outbox::net
