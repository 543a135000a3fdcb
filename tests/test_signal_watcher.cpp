#include <catch2/catch_test_macros.hpp>
#include "signal_watcher.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <functional>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

using namespace perouter;
using namespace std::chrono_literals;

// Run body in a forked child and return its exit code (-1 if it did not
// exit normally). The child has a single thread, so process-directed
// signals can only go to the watcher.
static int exit_code_in_child(const std::function<int()>& body) {
    pid_t pid = fork();
    if (pid == 0) {
        _exit(body());
    }
    REQUIRE(pid > 0);
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

// ── In-process lifecycle ────────────────────────────────────────

TEST_CASE("SignalWatcher: stop joins promptly without calling the handler", "[signal]") {
    std::atomic<int> calls{0};
    SignalWatcher watcher({SIGHUP}, [&](int) { calls++; });

    auto start = std::chrono::steady_clock::now();
    watcher.stop();
    REQUIRE(std::chrono::steady_clock::now() - start < 2s);
    REQUIRE(calls == 0);

    // Second stop is a no-op
    watcher.stop();
}

TEST_CASE("SignalWatcher: destructor stops the watcher", "[signal]") {
    std::atomic<int> calls{0};
    {
        SignalWatcher watcher({SIGHUP}, [&](int) { calls++; });
    }
    REQUIRE(calls == 0);
}

// ── Delivery ────────────────────────────────────────────────────

TEST_CASE("SignalWatcher: handler receives a watched signal", "[signal]") {
    int code = exit_code_in_child([] {
        SignalWatcher watcher({SIGTERM, SIGHUP}, [](int sig) {
            _exit(sig == SIGHUP ? 42 : 1);
        });
        kill(getpid(), SIGHUP);
        sleep(5);
        return 2;
    });
    REQUIRE(code == 42);
}

TEST_CASE("SignalWatcher: signals after stop never reach the handler", "[signal]") {
    int code = exit_code_in_child([] {
        SignalWatcher watcher({SIGTERM}, [](int) { _exit(1); });
        watcher.stop();
        // Still blocked: stays pending instead of running the handler or
        // the default action
        kill(getpid(), SIGTERM);
        usleep(200 * 1000);
        return 0;
    });
    REQUIRE(code == 0);
}

TEST_CASE("SignalWatcher: stray wake signal does not end the watcher", "[signal]") {
    int code = exit_code_in_child([] {
        SignalWatcher watcher({SIGTERM}, [](int sig) {
            _exit(sig == SIGTERM ? 43 : 1);
        });
        kill(getpid(), SIGUSR1);
        usleep(100 * 1000);
        kill(getpid(), SIGTERM);
        sleep(5);
        return 2;
    });
    REQUIRE(code == 43);
}
