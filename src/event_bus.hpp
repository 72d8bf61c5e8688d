#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace stepstream {

using EventHandler = std::function<void(const Event&)>;

// Synchronous publish/subscribe keyed by event tag. Planner sessions publish
// from their stream worker thread, so handlers must be thread-safe with
// respect to whatever they touch.
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Publish an event synchronously. Handlers run in registration order
    // without the bus lock held. A handler that throws is logged and skipped;
    // the remaining handlers still run.
    void publish(const Event& event);

    // Remove all subscriptions.
    void clear();

    // Number of subscriptions for a given tag (0 if none).
    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Unsubscribes on destruction.
class ScopedSubscription {
public:
    ScopedSubscription() = default;
    ScopedSubscription(EventBus& bus, uint64_t id) : bus_(&bus), id_(id) {}
    ~ScopedSubscription() { reset(); }

    ScopedSubscription(ScopedSubscription&& other) noexcept
        : bus_(other.bus_), id_(other.id_) {
        other.bus_ = nullptr;
    }
    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept {
        if (this != &other) {
            reset();
            bus_ = other.bus_;
            id_ = other.id_;
            other.bus_ = nullptr;
        }
        return *this;
    }
    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    void reset() {
        if (bus_) bus_->unsubscribe(id_);
        bus_ = nullptr;
    }

private:
    EventBus* bus_ = nullptr;
    uint64_t id_ = 0;
};

} // namespace stepstream
