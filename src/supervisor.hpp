#pragma once
#include "active_call.hpp"
#include "config.hpp"
#include "process.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace perouter {

class EventBus; // forward declaration

struct CaptureOptions {
    std::chrono::milliseconds observation_timeout{5000};
    size_t observation_max_lines = 20;
    std::chrono::milliseconds stop_timeout{15000};
    // How long stop waits for drain threads to deregister reaped calls
    std::chrono::milliseconds release_timeout{5000};

    static CaptureOptions from_config(const CaptureConfig& config);
};

struct StartOutcome {
    enum class Kind {
        Output,    // first line of output arrived in time
        NoOutput,  // output ended before any line was written
        TimedOut,  // observation window elapsed without a line
        Cancelled, // token fired before any output
        Failed     // not started; nothing registered
    };

    Kind kind = Kind::Failed;
    // First output line for Output, error text for Failed
    std::string text;
};

struct StopReport {
    size_t found = 0;
    size_t signaled = 0;
    size_t force_killed = 0;
    bool timed_out = false;
};

// Runs long-lived commands in the background and stops them on request.
//
// start() spawns and registers the command, then hands it to a detached
// drain thread that owns it until exit: the thread surfaces the first line
// of output, keeps the pipe drained, reaps the child and deregisters it.
// stop_all() terminates everything registered with SIGTERM, escalating to
// SIGKILL after stop_timeout.
//
// The event bus, when given, must outlive every running capture; call
// stop_all() before tearing it down.
class CaptureSupervisor {
public:
    explicit CaptureSupervisor(CaptureOptions options = {}, EventBus* bus = nullptr);

    // Blocks for at most the observation window
    StartOutcome start(const std::string& call_id, const CommandSpec& spec);

    StopReport stop_all();

    // Cooperative: releases a waiting start() but leaves the process running
    bool cancel(const std::string& call_id);

    size_t active_count() const { return registry_->size(); }
    bool is_active(const std::string& call_id) const { return registry_->contains(call_id); }
    const CaptureOptions& options() const { return options_; }

private:
    CaptureOptions options_;
    EventBus* bus_;
    std::shared_ptr<ActiveCallRegistry> registry_;
};

} // namespace perouter
