/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe channel between the queue engine and observers
 *
 * WHY THIS FILE EXISTS:
 * The processor reports what it does (enqueue, progress, retries, failures)
 * without knowing whether anyone listens. Loggers, metrics and status
 * displays subscribe here instead of being called directly.
 *
 * EXAMPLE:
 * EventBus bus;
 * auto id = bus.subscribe<UploadCompletedEvent>([](const UploadCompletedEvent& e) { ... });
 * bus.emit(UploadCompletedEvent{"1700000000000"});
 * bus.unsubscribe<UploadCompletedEvent>(id);
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace outbox::events {

/**
 * @brief Type-erased event bus
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe/emit may be called from any thread
 * - Handlers run synchronously on the emitting thread, outside the lock,
 *   so a handler may itself subscribe or emit
 * - A throwing handler is logged; the remaining handlers still run
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const std::size_t id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].emplace_back(
            id, std::make_shared<TypedHandler<EventType>>(std::move(handler)));
        return id;
    }

    template<typename EventType>
    void unsubscribe(std::size_t handler_id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [handler_id](const auto& entry) { return entry.first == handler_id; }),
                   list.end());
    }

    template<typename EventType>
    void emit(const EventType& event) const {
        std::vector<std::shared_ptr<Handler>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            snapshot.reserve(it->second.size());
            for (const auto& entry : it->second) {
                snapshot.push_back(entry.second);
            }
        }

        for (const auto& handler : snapshot) {
            try {
                handler->invoke(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct Handler {
        virtual ~Handler() = default;
        virtual void invoke(const void* event) = 0;
    };

    template<typename EventType>
    struct TypedHandler : Handler {
        explicit TypedHandler(std::function<void(const EventType&)> f) : fn(std::move(f)) {}

        // Only ever stored under typeid(EventType), so the cast is exact.
        void invoke(const void* event) override { fn(*static_cast<const EventType*>(event)); }

        std::function<void(const EventType&)> fn;
    };

    std::unordered_map<std::type_index, std::vector<std::pair<std::size_t, std::shared_ptr<Handler>>>> handlers_;
    mutable std::shared_mutex mutex_;
    std::size_t next_handler_id_ = 0;
};

/**
 * @brief Unsubscribes on destruction
 *
 * For subscribers whose handler captures `this` and who may die before
 * the bus does.
 */
template<typename EventType>
class ScopedSubscription {
public:
    ScopedSubscription(EventBus& bus, std::function<void(const EventType&)> handler)
        : bus_(bus)
        , id_(bus.subscribe<EventType>(std::move(handler))) {}

    ~ScopedSubscription() { bus_.unsubscribe<EventType>(id_); }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

private:
    EventBus& bus_;
    std::size_t id_;
};

} // namespace outbox::events
