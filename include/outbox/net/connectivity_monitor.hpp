#pragma once

#include "outbox/events/event_bus.hpp"
#include "outbox/net/connectivity.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace outbox::net {

/**
 * @brief Polls a ConnectivityOracle and emits ConnectivityChangedEvent on change
 *
 * The first poll establishes a baseline and emits only if it differs from
 * the default (offline) status.
 */
class ConnectivityMonitor {
public:
    ConnectivityMonitor(ConnectivityOracle& oracle,
                        events::EventBus& bus,
                        std::chrono::milliseconds interval = std::chrono::milliseconds(5000));
    ~ConnectivityMonitor();

    ConnectivityMonitor(const ConnectivityMonitor&) = delete;
    ConnectivityMonitor& operator=(const ConnectivityMonitor&) = delete;

    void start();
    void stop();

    /// One synchronous poll; returns true when the status changed.
    bool poll_once();

    ConnectivityStatus last_status() const;

private:
    void run();

    ConnectivityOracle& oracle_;
    events::EventBus& bus_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    ConnectivityStatus last_;
    std::thread thread_;
};

} // namespace outbox::net
