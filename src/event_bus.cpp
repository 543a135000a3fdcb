#include "event_bus.hpp"
#include <algorithm>

namespace perouter {

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    by_tag_[tag].push_back(Subscription{id, std::move(handler)});
    tag_of_.emplace(id, tag);
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto tag = tag_of_.find(id);
    if (tag == tag_of_.end()) return false;

    auto& subs = by_tag_[tag->second];
    subs.erase(std::remove_if(subs.begin(), subs.end(),
                              [id](const Subscription& s) { return s.id == id; }),
               subs.end());
    if (subs.empty()) by_tag_.erase(tag->second);
    tag_of_.erase(tag);
    return true;
}

void EventBus::publish(const Event& event) {
    // Copied so handlers run unlocked and may touch the bus themselves
    std::vector<EventHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = by_tag_.find(event.type_tag);
        if (it == by_tag_.end()) return;
        handlers.reserve(it->second.size());
        for (const auto& sub : it->second) {
            handlers.push_back(sub.handler);
        }
    }
    for (const auto& handler : handlers) {
        handler(event);
    }
}

size_t EventBus::subscriber_count(const std::string& tag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_tag_.find(tag);
    return it == by_tag_.end() ? 0 : it->second.size();
}

} // namespace perouter
