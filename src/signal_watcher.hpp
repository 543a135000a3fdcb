#pragma once
#include <atomic>
#include <functional>
#include <initializer_list>
#include <thread>
#include <csignal>

namespace perouter {

// Takes termination signals synchronously on a dedicated thread instead of
// in an async handler. The constructor blocks the signals in the calling
// thread; construct it before any other thread is started so that every
// thread inherits the mask and process-directed signals reach the watcher.
class SignalWatcher {
public:
    using Handler = std::function<void(int)>;

    SignalWatcher(std::initializer_list<int> signals, Handler handler);
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    // Joins the watcher. Once this returns the handler is not running and
    // will never be called again. A handler that is already running is
    // waited for.
    void stop();

private:
    void run();

    sigset_t signals_;
    Handler handler_;
    std::atomic<bool> stopping_{false};
    std::thread thread_;
};

} // namespace perouter
