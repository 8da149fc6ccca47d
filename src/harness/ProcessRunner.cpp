#include "harness/ProcessRunner.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <limits>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "util/Logger.hpp"

namespace improver {

namespace {

constexpr int EXEC_FAILED = 127;
constexpr int SIGNAL_BASE = 128;

class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    ~Fd() { reset(); }

    int get() const { return fd_; }
    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_{-1};
};

Error sysError(const std::string& what) {
    return Error{ErrorCode::IoError, what + " failed: " + std::strerror(errno)};
}

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return SIGNAL_BASE + WTERMSIG(status);
    return SIGNAL_BASE;
}

}

const char* runStateName(RunState state) {
    switch (state) {
        case RunState::NotRun: return "NOT_RUN";
        case RunState::Running: return "RUNNING";
        case RunState::Completed: return "COMPLETED";
        case RunState::TimedOut: return "TIMED_OUT";
    }
    return "UNKNOWN";
}

Expected<InvocationResult> ProcessRunner::run(const std::string& executable, const std::vector<std::string>& args) {
    auto& log = Logger::instance();
    if (state_ != RunState::NotRun) {
        return Error{ErrorCode::InternalError, std::string("process runner already used (state ") + runStateName(state_) + ")"};
    }

    int outFds[2];
    int errFds[2];
    if (pipe2(outFds, O_CLOEXEC) != 0) return sysError("pipe2");
    Fd outRead(outFds[0]), outWrite(outFds[1]);
    if (pipe2(errFds, O_CLOEXEC) != 0) return sysError("pipe2");
    Fd errRead(errFds[0]), errWrite(errFds[1]);

    // argv must be built before fork: the child only execs or exits
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    const pid_t pid = fork();
    if (pid < 0) return sysError("fork");

    if (pid == 0) {
        // Own process group, so a timeout can take down grandchildren too
        setpgid(0, 0);
        if (dup2(outWrite.get(), STDOUT_FILENO) == -1) _exit(EXEC_FAILED);
        if (dup2(errWrite.get(), STDERR_FILENO) == -1) _exit(EXEC_FAILED);
        execv(executable.c_str(), argv.data());
        _exit(EXEC_FAILED);
    }

    // Also set from the parent so a kill right after fork reaches the group
    setpgid(pid, pid);
    state_ = RunState::Running;
    log.debug("Launched " + executable + " (pid " + std::to_string(pid) + ")");
    outWrite.reset();
    errWrite.reset();

    const bool bounded = timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto remainingMs = [&]() -> int {
        if (!bounded) return -1;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) return 0;
        // poll() takes an int; longer waits are split across loop iterations
        return static_cast<int>(std::min<long long>(left.count(), std::numeric_limits<int>::max()));
    };
    auto reap = [&]() {
        if (::kill(-pid, SIGKILL) != 0) ::kill(pid, SIGKILL);
        int ignored = 0;
        while (waitpid(pid, &ignored, 0) < 0 && errno == EINTR) {}
    };
    auto killChild = [&]() -> Error {
        reap();
        state_ = RunState::TimedOut;
        log.debug(executable + " timed out after " + std::to_string(timeout.count()) + " ms");
        return Error{ErrorCode::HarnessTimeout,
                     executable + " did not exit within " + std::to_string(timeout.count()) + " ms"};
    };

    InvocationResult result;
    pollfd fds[2] = {{outRead.get(), POLLIN, 0}, {errRead.get(), POLLIN, 0}};
    std::string* sinks[2] = {&result.out, &result.err};
    char buf[4096];

    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        int wait = remainingMs();
        if (bounded && wait == 0) return killChild();
        int n = ::poll(fds, 2, wait);
        if (n < 0) {
            if (errno == EINTR) continue;
            Error err = sysError("poll");
            reap();
            state_ = RunState::Completed;
            return err;
        }
        if (n == 0) continue;
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
            if (r > 0) {
                sinks[i]->append(buf, static_cast<size_t>(r));
            } else if (r == 0 || errno != EINTR) {
                fds[i].fd = -1;
            }
        }
    }

    int status = 0;
    for (;;) {
        pid_t w = waitpid(pid, &status, bounded ? WNOHANG : 0);
        if (w == pid) break;
        if (w < 0) {
            if (errno == EINTR) continue;
            state_ = RunState::Completed;
            return sysError("waitpid");
        }
        if (remainingMs() == 0) return killChild();
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    result.exitCode = decodeStatus(status);
    state_ = RunState::Completed;
    log.debug(executable + " exited with " + std::to_string(result.exitCode));
    return result;
}

}
