#include <catch2/catch_test_macros.hpp>
#include "cancellation.hpp"
#include <atomic>
#include <thread>

using namespace perouter;
using namespace std::chrono_literals;

TEST_CASE("CancellationToken: starts uncancelled", "[cancellation]") {
    CancellationToken token;
    REQUIRE_FALSE(token.cancelled());
    REQUIRE_FALSE(token.wait_for(10ms));
}

TEST_CASE("CancellationToken: cancel is idempotent", "[cancellation]") {
    CancellationToken token;
    int calls = 0;
    token.on_cancel([&] { calls++; });

    token.cancel();
    token.cancel();
    REQUIRE(token.cancelled());
    REQUIRE(calls == 1);
}

TEST_CASE("CancellationToken: late callback runs immediately", "[cancellation]") {
    CancellationToken token;
    token.cancel();

    bool ran = false;
    token.on_cancel([&] { ran = true; });
    REQUIRE(ran);
}

TEST_CASE("CancellationToken: wait_for wakes on cancel from another thread", "[cancellation]") {
    CancellationToken token;
    std::thread canceller([&] {
        std::this_thread::sleep_for(50ms);
        token.cancel();
    });
    REQUIRE(token.wait_for(5s));
    canceller.join();
}

TEST_CASE("CancellationToken: callback may query the token", "[cancellation]") {
    CancellationToken token;
    std::atomic<bool> seen{false};
    token.on_cancel([&] { seen = token.cancelled(); });
    token.cancel();
    REQUIRE(seen);
}
