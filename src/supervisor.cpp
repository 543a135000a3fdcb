#include "supervisor.hpp"
#include "event_bus.hpp"
#include <algorithm>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>

namespace perouter {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kDrainPoll = std::chrono::milliseconds(200);

// Rendezvous between the drain thread and the waiting start() call.
// The first report wins; later ones are ignored.
class FirstOutput {
public:
    enum class State { Pending, Line, Ended, WindowElapsed, Cancelled };

    void report(State state, std::string line = {}) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::Pending) return;
            state_ = state;
            line_ = std::move(line);
        }
        cv_.notify_all();
    }

    // Pending means the deadline passed first
    State wait_until(Clock::time_point deadline, std::string& line) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_until(lock, deadline, [this] { return state_ != State::Pending; });
        line = line_;
        return state_;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    State state_ = State::Pending;
    std::string line_;
};

// Handlers run on drain threads; a throwing handler must not kill the process
template<typename E>
void notify(EventBus* bus, const E& event) {
    if (!bus) return;
    try {
        bus->publish(event);
    } catch (const std::exception& e) {
        std::cerr << "[capture] Event handler failed: " << e.what() << "\n";
    }
}

struct DrainJob {
    std::string call_id;
    std::shared_ptr<Process> process;
    std::shared_ptr<CancellationToken> token;
    std::shared_ptr<FirstOutput> first_output;
    std::shared_ptr<ActiveCallRegistry> registry;
    EventBus* bus;
    Clock::time_point deadline;
    size_t max_lines;
};

void observe_window(const DrainJob& job, bool& ended) {
    auto& out = job.process->output();
    size_t seen = 0;
    std::string line;

    while (seen < job.max_lines) {
        auto status = out.read_line(line, job.deadline);
        if (status == LineReader::Status::Timeout) break;
        if (status == LineReader::Status::Eof) {
            ended = true;
            break;
        }
        if (seen == 0) {
            job.first_output->report(FirstOutput::State::Line, line);
        }
        ++seen;

        CaptureOutputEvent ev;
        ev.call_id = job.call_id;
        ev.line = line;
        notify(job.bus, ev);
    }

    if (seen == 0) {
        job.first_output->report(ended ? FirstOutput::State::Ended
                                       : FirstOutput::State::WindowElapsed);
    }
}

void drain(const DrainJob& job) {
    bool ended = false;
    try {
        observe_window(job, ended);

        // Keep reading so the child never blocks on a full pipe. A child
        // that exits while a grandchild still holds the pipe counts as done.
        while (!ended) {
            auto status = job.process->output().skip(kDrainPoll);
            if (status == LineReader::Status::Eof || job.process->try_wait()) {
                ended = true;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "[capture] " << job.call_id << ": output reader failed: "
                  << e.what() << "\n";
    }

    int status = job.process->wait();

    CaptureExitedEvent ev;
    ev.call_id = job.call_id;
    ev.pid = job.process->pid();
    ev.status = status;
    notify(job.bus, ev);

    job.registry->remove(job.call_id, job.process.get());
    job.token->cancel();
}

} // namespace

CaptureOptions CaptureOptions::from_config(const CaptureConfig& config) {
    CaptureOptions options;
    options.observation_timeout = std::chrono::milliseconds(config.observation_timeout_ms);
    // At least one line, or the first output could never be reported
    options.observation_max_lines = std::max<size_t>(config.observation_max_lines, 1);
    options.stop_timeout = std::chrono::milliseconds(config.stop_timeout_ms);
    return options;
}

CaptureSupervisor::CaptureSupervisor(CaptureOptions options, EventBus* bus)
    : options_(options), bus_(bus), registry_(std::make_shared<ActiveCallRegistry>()) {}

StartOutcome CaptureSupervisor::start(const std::string& call_id, const CommandSpec& spec) {
    auto token = std::make_shared<CancellationToken>();
    auto first_output = std::make_shared<FirstOutput>();
    auto deadline = Clock::now() + options_.observation_timeout;

    std::shared_ptr<Process> process;
    try {
        process = Process::spawn(spec);
    } catch (const std::exception& e) {
        return {StartOutcome::Kind::Failed, "Error starting " + spec.name() + ": " + e.what()};
    }

    // Registered before any output is read so a concurrent stop sees it
    if (!registry_->insert(ActiveCall{call_id, token, process})) {
        process->signal(SIGKILL);
        process->wait();
        return {StartOutcome::Kind::Failed,
                "A capture with request ID " + call_id + " is already running"};
    }

    token->on_cancel([first_output] {
        first_output->report(FirstOutput::State::Cancelled);
    });

    CaptureStartedEvent started;
    started.call_id = call_id;
    started.command = spec.name();
    started.pid = process->pid();
    notify(bus_, started);

    DrainJob job{call_id, process, token, first_output, registry_, bus_,
                 deadline, options_.observation_max_lines};
    try {
        std::thread(drain, std::move(job)).detach();
    } catch (const std::system_error& e) {
        process->signal(SIGKILL);
        process->wait();
        registry_->remove(call_id, process.get());
        token->cancel();
        return {StartOutcome::Kind::Failed,
                "Error starting " + spec.name() + ": " + e.what()};
    }

    std::string line;
    switch (first_output->wait_until(deadline, line)) {
        case FirstOutput::State::Line:
            return {StartOutcome::Kind::Output, line};
        case FirstOutput::State::Ended:
            return {StartOutcome::Kind::NoOutput, ""};
        case FirstOutput::State::Cancelled:
            return {StartOutcome::Kind::Cancelled, ""};
        case FirstOutput::State::WindowElapsed:
        case FirstOutput::State::Pending:
            break;
    }
    return {StartOutcome::Kind::TimedOut, ""};
}

StopReport CaptureSupervisor::stop_all() {
    StopReport report;
    std::vector<ActiveCall> calls = registry_->snapshot();
    report.found = calls.size();
    if (calls.empty()) return report;

    for (const auto& call : calls) {
        bool delivered = call.process->signal(SIGTERM);
        if (delivered) ++report.signaled;

        CaptureSignaledEvent ev;
        ev.call_id = call.id;
        ev.pid = call.process->pid();
        ev.signal = SIGTERM;
        ev.delivered = delivered;
        notify(bus_, ev);
    }

    auto deadline = Clock::now() + options_.stop_timeout;
    for (const auto& call : calls) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now());
        if (!call.process->wait_for(std::max(remaining, std::chrono::milliseconds(0)))) {
            report.timed_out = true;
        }
    }

    if (report.timed_out) {
        StopEscalatedEvent escalated;
        escalated.remaining = static_cast<size_t>(std::count_if(calls.begin(), calls.end(),
            [](const ActiveCall& c) { return !c.process->exited(); }));
        escalated.timeout_ms = static_cast<uint32_t>(options_.stop_timeout.count());
        notify(bus_, escalated);

        for (const auto& call : calls) {
            if (call.process->exited()) continue;
            bool delivered = call.process->signal(SIGKILL);
            if (delivered) ++report.force_killed;

            CaptureSignaledEvent ev;
            ev.call_id = call.id;
            ev.pid = call.process->pid();
            ev.signal = SIGKILL;
            ev.delivered = delivered;
            notify(bus_, ev);
        }
    }

    for (const auto& call : calls) {
        call.process->wait();
    }

    if (!registry_->wait_released(calls, options_.release_timeout)) {
        std::cerr << "[capture] Drain threads did not release all stopped captures within "
                  << options_.release_timeout.count() << "ms\n";
    }
    return report;
}

bool CaptureSupervisor::cancel(const std::string& call_id) {
    return registry_->cancel(call_id);
}

} // namespace perouter
