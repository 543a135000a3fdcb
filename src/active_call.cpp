#include "active_call.hpp"
#include <algorithm>

namespace perouter {

bool ActiveCallRegistry::insert(ActiveCall call) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = call.id;
    return calls_.emplace(std::move(id), std::move(call)).second;
}

bool ActiveCallRegistry::remove(const std::string& id, const Process* process) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(id);
        if (it == calls_.end() || it->second.process.get() != process) return false;
        calls_.erase(it);
    }
    released_.notify_all();
    return true;
}

std::vector<ActiveCall> ActiveCallRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ActiveCall> result;
    result.reserve(calls_.size());
    for (const auto& [id, call] : calls_) {
        result.push_back(call);
    }
    return result;
}

bool ActiveCallRegistry::cancel(const std::string& id) {
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(id);
        if (it == calls_.end()) return false;
        token = it->second.token;
    }
    if (token) token->cancel();
    return true;
}

bool ActiveCallRegistry::holds_locked(const ActiveCall& call) const {
    auto it = calls_.find(call.id);
    return it != calls_.end() && it->second.process == call.process;
}

bool ActiveCallRegistry::wait_released(const std::vector<ActiveCall>& calls,
                                       std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return released_.wait_for(lock, timeout, [&] {
        return std::none_of(calls.begin(), calls.end(),
            [this](const ActiveCall& c) { return holds_locked(c); });
    });
}

bool ActiveCallRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.count(id) > 0;
}

size_t ActiveCallRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
}

} // namespace perouter
