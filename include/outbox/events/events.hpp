/**
 * @file events.hpp
 * @brief Events emitted by the upload queue engine
 *
 * NAMING CONVENTION:
 * Past tense, one struct per fact. Every event carries the wall-clock time
 * it was created at as its last member.
 *
 * WHO EMITS:
 * - QueueProcessor: everything except ConnectivityChangedEvent
 * - ConnectivityMonitor: ConnectivityChangedEvent
 */

#pragma once

#include "outbox/net/connectivity.hpp"
#include "outbox/queue/pass.hpp"
#include "outbox/queue/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace outbox::events {

using EventTime = std::chrono::system_clock::time_point;

struct ItemEnqueuedEvent {
    std::string id;
    queue::MediaKind media_kind = queue::MediaKind::Image;
    std::size_t recipient_count = 0;
    EventTime at = std::chrono::system_clock::now();
};

struct DrainPassStartedEvent {
    std::size_t queued = 0;
    EventTime at = std::chrono::system_clock::now();
};

struct DrainPassFinishedEvent {
    queue::PassReport report;
    EventTime at = std::chrono::system_clock::now();
};

struct UploadStartedEvent {
    std::string id;
    std::uint32_t attempt = 1;   ///< 1-based
    EventTime at = std::chrono::system_clock::now();
};

struct UploadProgressEvent {
    std::string id;
    int percent = 0;
    EventTime at = std::chrono::system_clock::now();
};

struct UploadCompletedEvent {
    std::string id;
    EventTime at = std::chrono::system_clock::now();
};

struct UploadRetryScheduledEvent {
    std::string id;
    std::uint32_t retry_count = 0;
    std::string reason;
    EventTime at = std::chrono::system_clock::now();
};

struct UploadFailedEvent {
    std::string id;
    std::string reason;
    EventTime at = std::chrono::system_clock::now();
};

/// History entries left "uploading" by a previous run were repaired.
struct HistoryReconciledEvent {
    std::size_t repaired = 0;
    EventTime at = std::chrono::system_clock::now();
};

struct ConnectivityChangedEvent {
    net::ConnectivityStatus previous;
    net::ConnectivityStatus current;
    EventTime at = std::chrono::system_clock::now();
};

} // namespace outbox::events
