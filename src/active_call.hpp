#pragma once
#include "cancellation.hpp"
#include "process.hpp"
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace perouter {

// One running background command, keyed by its invocation identifier
struct ActiveCall {
    std::string id;
    std::shared_ptr<CancellationToken> token;
    std::shared_ptr<Process> process;
};

// Invocation identifier -> ActiveCall. All methods are thread-safe; the
// lock is never held while waiting on a process.
class ActiveCallRegistry {
public:
    // False (and no change) if the id is already active
    bool insert(ActiveCall call);

    // Removes the entry only if it still belongs to `process`.
    // Returns true if something was removed.
    bool remove(const std::string& id, const Process* process);

    // Copy of the current entries
    std::vector<ActiveCall> snapshot() const;

    // Fire the call's cancellation token. False if the id is not active.
    bool cancel(const std::string& id);

    // Block until none of `calls` is registered any more
    bool wait_released(const std::vector<ActiveCall>& calls,
                       std::chrono::milliseconds timeout) const;

    bool contains(const std::string& id) const;
    size_t size() const;

private:
    bool holds_locked(const ActiveCall& call) const;

    mutable std::mutex mutex_;
    mutable std::condition_variable released_;
    std::unordered_map<std::string, ActiveCall> calls_;
};

} // namespace perouter
