#include "cancellation.hpp"

namespace perouter {

void CancellationToken::cancel() {
    std::vector<Callback> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_) return;
        cancelled_ = true;
        to_call.swap(callbacks_);
    }
    cv_.notify_all();
    for (const auto& callback : to_call) {
        callback();
    }
}

bool CancellationToken::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
}

void CancellationToken::on_cancel(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_) {
            callbacks_.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

} // namespace perouter
