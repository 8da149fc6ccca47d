#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "core/InvocationResult.hpp"
#include "util/Expected.hpp"

namespace improver {

enum class RunState { NotRun, Running, Completed, TimedOut };

const char* runStateName(RunState state);

/**
 * @brief Runs one CLI invocation in a child process and captures its output
 *
 * stdout and stderr are captured on separate pipes. The exit code is the
 * child's status, 128 + signal number when it was killed by a signal, and
 * 127 when the executable could not be started.
 *
 * A runner owns exactly one subprocess: run() may be called once.
 */
class ProcessRunner {
public:
    // A zero timeout waits for the child indefinitely
    explicit ProcessRunner(std::chrono::milliseconds timeout = std::chrono::milliseconds{0})
        : timeout(timeout) {}

    /**
     * @brief Launch executable with args, wait for it and collect the result
     *
     * @return HarnessTimeout if the child outlived the timeout (it is killed
     *         and reaped), IoError on pipe/fork/wait failure, InternalError
     *         if the runner was already used
     */
    Expected<InvocationResult> run(const std::string& executable, const std::vector<std::string>& args);

    RunState state() const { return state_; }

private:
    std::chrono::milliseconds timeout;
    RunState state_{RunState::NotRun};
};

}
