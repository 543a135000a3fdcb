#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <sys/types.h>

namespace perouter {

struct CommandSpec {
    std::string program;
    std::vector<std::string> args;
    // Applied on top of the server's own environment
    std::vector<std::pair<std::string, std::string>> env;
    // Name used in messages (defaults to program)
    std::string display_name;

    std::string name() const { return display_name.empty() ? program : display_name; }
};

// Reads the combined output of a child process line by line.
// Single consumer: only the thread that owns the process reads from it.
class LineReader {
public:
    enum class Status { Line, Timeout, Eof };

    using Clock = std::chrono::steady_clock;

    explicit LineReader(int fd) : fd_(fd) {}

    // Next line without its terminator. A final unterminated line is
    // returned as Line before Eof.
    Status read_line(std::string& line, Clock::time_point deadline);
    Status read_line(std::string& line, std::chrono::milliseconds timeout) {
        return read_line(line, Clock::now() + timeout);
    }

    // Discard whatever is buffered or arrives within timeout.
    // Line means some output was dropped.
    Status skip(std::chrono::milliseconds timeout);

    // Block until EOF and return everything not yet consumed.
    std::string read_all();

private:
    // Returns false on timeout; sets eof_ on EOF or read error.
    bool fill(int timeout_ms);

    int fd_;
    std::string buffer_;
    bool eof_ = false;
};

// A spawned child process. stdout and stderr share one pipe, stdin is
// /dev/null. The child is reaped exactly once however many threads wait,
// and only while holding the mutex that signal() takes.
class Process {
public:
    // Throws std::runtime_error when the pipe, fork or exec fails.
    static std::unique_ptr<Process> spawn(const CommandSpec& spec);

    ~Process();
    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    pid_t pid() const { return pid_; }
    const std::string& name() const { return name_; }
    LineReader& output() { return reader_; }

    // False if delivery failed or the child was already reaped
    bool signal(int sig);

    // Block until exit; returns the raw wait status
    int wait();

    // Non-blocking reap attempt; true once the child has exited
    bool try_wait();

    // Bounded wait for exit; true once the child has exited
    bool wait_for(std::chrono::milliseconds timeout);

    bool exited() const;
    int status() const;

private:
    Process(pid_t pid, int out_fd, std::string name);

    bool reap_nonblocking_locked();
    void mark_reaped_locked(int status);

    pid_t pid_;
    int out_fd_;
    std::string name_;
    LineReader reader_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool reaping_ = false;
    bool reaped_ = false;
    int status_ = 0;
};

struct CommandResult {
    int status = 0;
    std::string output;
};

// Spawn, collect the entire combined output, wait. Throws like spawn().
CommandResult run_command(const CommandSpec& spec);

// True for a normal exit with code 0
bool exited_successfully(int status);

// "exit status N", "signal: NAME" or "unknown status"
std::string describe_status(int status);

} // namespace perouter
