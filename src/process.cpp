#include "process.hpp"
#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace perouter {

// ── LineReader ──────────────────────────────────────────────────

// poll() takes an int; longer waits are capped instead of wrapping negative
static int poll_timeout(long long ms) {
    return static_cast<int>(std::min<long long>(ms, std::numeric_limits<int>::max()));
}

bool LineReader::fill(int timeout_ms) {
    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;

    int ret = poll(&pfd, 1, timeout_ms);
    if (ret < 0) {
        if (errno == EINTR) return true;
        eof_ = true;
        return true;
    }
    if (ret == 0) return false;

    std::array<char, 4096> chunk;
    ssize_t n = read(fd_, chunk.data(), chunk.size());
    if (n > 0) {
        buffer_.append(chunk.data(), static_cast<size_t>(n));
    } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        eof_ = true;
    }
    return true;
}

LineReader::Status LineReader::read_line(std::string& line, Clock::time_point deadline) {
    while (true) {
        auto nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            line = buffer_.substr(0, nl);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            buffer_.erase(0, nl + 1);
            return Status::Line;
        }
        if (eof_) {
            if (buffer_.empty()) return Status::Eof;
            line = std::move(buffer_);
            buffer_.clear();
            return Status::Line;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        if (remaining <= 0) return Status::Timeout;
        if (!fill(poll_timeout(remaining))) return Status::Timeout;
    }
}

LineReader::Status LineReader::skip(std::chrono::milliseconds timeout) {
    if (!buffer_.empty()) {
        buffer_.clear();
        return Status::Line;
    }
    if (eof_) return Status::Eof;
    if (!fill(poll_timeout(std::max<long long>(timeout.count(), 0)))) return Status::Timeout;
    if (!buffer_.empty()) {
        buffer_.clear();
        return Status::Line;
    }
    return eof_ ? Status::Eof : Status::Timeout;
}

std::string LineReader::read_all() {
    while (!eof_) {
        fill(-1);
    }
    std::string out = std::move(buffer_);
    buffer_.clear();
    return out;
}

// ── Process ─────────────────────────────────────────────────────

static std::vector<std::string> build_environment(
    const std::vector<std::pair<std::string, std::string>>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = entry.substr(0, eq);
        bool overridden = std::any_of(overrides.begin(), overrides.end(),
            [&key](const auto& kv) { return kv.first == key; });
        if (!overridden) env.push_back(std::move(entry));
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

std::unique_ptr<Process> Process::spawn(const CommandSpec& spec) {
    if (spec.program.empty()) {
        throw std::runtime_error("Empty command");
    }

    // Everything the child needs is built before fork: after fork the
    // child only makes async-signal-safe calls.
    std::vector<std::string> args;
    args.reserve(spec.args.size() + 1);
    args.push_back(spec.program);
    args.insert(args.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env = build_environment(spec.env);
    std::vector<char*> envp;
    for (auto& e : env) envp.push_back(e.data());
    envp.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw std::runtime_error(std::string("Failed to create output pipe: ") +
                                 std::strerror(errno));
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        throw std::runtime_error(std::string("Failed to create pipe: ") + std::strerror(err));
    }
    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        close_fd(devnull);
        throw std::runtime_error(std::string("Failed to fork process: ") + std::strerror(err));
    }

    if (pid == 0) {
        // Child: own session, default signal handling, clean mask
        setsid();
        struct sigaction sa_dfl;
        std::memset(&sa_dfl, 0, sizeof(sa_dfl));
        sa_dfl.sa_handler = SIG_DFL;
        for (int sig = 1; sig < 32; ++sig) {
            sigaction(sig, &sa_dfl, nullptr);
        }
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(out_pipe[1], STDERR_FILENO);

        execvpe(argv[0], argv.data(), envp.data());

        int err = errno;
        ssize_t ignored = write(err_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(devnull);

    // The error pipe closes on successful exec; otherwise it carries errno
    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(err_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_fd(out_pipe[0]);
        throw std::runtime_error("Failed to execute " + spec.program + ": " +
                                 std::strerror(exec_errno));
    }

    return std::unique_ptr<Process>(new Process(pid, out_pipe[0], spec.name()));
}

Process::Process(pid_t pid, int out_fd, std::string name)
    : pid_(pid), out_fd_(out_fd), name_(std::move(name)), reader_(out_fd) {}

Process::~Process() {
    close_fd(out_fd_);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reaped_ && !reaping_) {
        kill(pid_, SIGKILL);
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {}
    }
}

void Process::mark_reaped_locked(int status) {
    reaped_ = true;
    status_ = status;
    cv_.notify_all();
}

bool Process::reap_nonblocking_locked() {
    if (reaped_) return true;
    if (reaping_) return false;
    int status = 0;
    pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        mark_reaped_locked(status);
    } else if (r < 0 && errno == ECHILD) {
        mark_reaped_locked(-1);
    }
    return reaped_;
}

bool Process::signal(int sig) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_) return false;
    return kill(pid_, sig) == 0;
}

int Process::wait() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!reaped_) {
        if (reaping_) {
            cv_.wait(lock);
            continue;
        }
        reaping_ = true;
        lock.unlock();

        // Wait for the exit without reaping: until the reap below, the pid
        // still belongs to the zombie and signal() cannot hit a reused pid
        siginfo_t info;
        int r;
        do {
            r = waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT);
        } while (r < 0 && errno == EINTR);

        lock.lock();
        reaping_ = false;
        int status = 0;
        pid_t reaped;
        do {
            reaped = waitpid(pid_, &status, 0);
        } while (reaped < 0 && errno == EINTR);
        mark_reaped_locked(reaped == pid_ ? status : -1);
    }
    return status_;
}

bool Process::try_wait() {
    std::lock_guard<std::mutex> lock(mutex_);
    return reap_nonblocking_locked();
}

bool Process::wait_for(std::chrono::milliseconds timeout) {
    constexpr auto kPollInterval = std::chrono::milliseconds(20);
    auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!reap_nonblocking_locked()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        // A blocking waiter notifies on reap; otherwise poll
        auto until = reaping_ ? deadline : std::min(deadline, now + kPollInterval);
        cv_.wait_until(lock, until);
    }
    return true;
}

bool Process::exited() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reaped_;
}

int Process::status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

// ── Helpers ─────────────────────────────────────────────────────

CommandResult run_command(const CommandSpec& spec) {
    auto proc = Process::spawn(spec);
    CommandResult result;
    result.output = proc->output().read_all();
    result.status = proc->wait();
    return result;
}

bool exited_successfully(int status) {
    return status >= 0 && WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

std::string describe_status(int status) {
    if (status < 0) return "unknown status";
    if (WIFEXITED(status)) {
        return "exit status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        int sig = WTERMSIG(status);
        const char* name = strsignal(sig);
        return "signal: " + (name ? std::string(name) : std::to_string(sig));
    }
    return "unknown status";
}

} // namespace perouter
