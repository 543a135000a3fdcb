#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace perouter {

using EventHandler = std::function<void(const Event&)>;

// Capture lifecycle notifications. Publishers are the request thread
// (start, stop) and the per-capture drain threads; the only subscriber in
// the server is the stderr logger installed by main.
//
// Delivery is synchronous on the publishing thread, so handlers must be
// thread-safe and quick: a slow handler stalls the drain thread and with it
// the child's output pipe. The bus must outlive every running capture.
class EventBus {
public:
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // False if the id is unknown or already removed
    bool unsubscribe(uint64_t id);

    // Runs the handlers for event.type_tag in subscription order. Handlers
    // may subscribe or unsubscribe; the change applies from the next event.
    void publish(const Event& event);

    size_t subscriber_count(const std::string& tag) const;

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> by_tag_;
    std::unordered_map<uint64_t, std::string> tag_of_;
    uint64_t next_id_ = 1;
};

// Typed subscription: the handler receives the concrete event struct
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

// Unsubscribes on destruction
class ScopedSubscription {
public:
    ScopedSubscription(EventBus& bus, uint64_t id) : bus_(&bus), id_(id) {}
    ~ScopedSubscription() { bus_->unsubscribe(id_); }

    ScopedSubscription(const ScopedSubscription&) = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

private:
    EventBus* bus_;
    uint64_t id_;
};

} // namespace perouter
