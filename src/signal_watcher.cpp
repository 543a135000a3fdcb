#include "signal_watcher.hpp"
#include <pthread.h>

namespace perouter {

// Sent by stop() to wake the watcher out of sigwait
static constexpr int kWakeSignal = SIGUSR1;

SignalWatcher::SignalWatcher(std::initializer_list<int> signals, Handler handler)
    : handler_(std::move(handler)) {
    sigemptyset(&signals_);
    for (int sig : signals) {
        sigaddset(&signals_, sig);
    }
    sigaddset(&signals_, kWakeSignal);
    pthread_sigmask(SIG_BLOCK, &signals_, nullptr);

    thread_ = std::thread([this] { run(); });
}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::stop() {
    if (!thread_.joinable()) return;
    stopping_ = true;
    pthread_kill(thread_.native_handle(), kWakeSignal);
    thread_.join();
}

void SignalWatcher::run() {
    while (true) {
        int sig = 0;
        if (sigwait(&signals_, &sig) != 0) return;
        if (sig == kWakeSignal) {
            // A stray SIGUSR1 from outside does not end the watcher
            if (stopping_) return;
            continue;
        }
        if (stopping_) return;
        handler_(sig);
    }
}

} // namespace perouter
