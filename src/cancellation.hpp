#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace perouter {

// Cooperative cancellation flag shared between a request handler and the
// background task of one call. Cancelling never touches the process.
class CancellationToken {
public:
    using Callback = std::function<void()>;

    // Idempotent. Callbacks run on the cancelling thread, outside the lock.
    void cancel();

    bool cancelled() const;

    // True if cancelled before the timeout elapsed
    bool wait_for(std::chrono::milliseconds timeout) const;

    // Runs immediately when already cancelled
    void on_cancel(Callback callback);

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
    std::vector<Callback> callbacks_;
};

} // namespace perouter
