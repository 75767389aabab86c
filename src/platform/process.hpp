#pragma once

#include <string>
#include <vector>
#include <utility>
#include <core/types.hpp>

namespace platform {

using EnvVars = std::vector<std::pair<std::string, std::string>>;

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // Wait for the process to exit and store its exit code (128+N when
    // killed by signal N). timeout_ms = -1 means indefinite wait.
    // Returns false if the timeout passed first.
    bool wait(int timeout_ms, int& exit_code);

    // SIGTERM, then SIGKILL after a grace period.
    void terminate();

private:
    int pid_ = -1;
    bool reaped_ = false;

    void reap(int status, int& exit_code);

    friend ProcessHandle spawn(const std::vector<std::string>& argv,
                               const EnvVars& env, int* stdout_fd, int* stderr_fd);
};

// Spawn argv[0] (searched on PATH) in its own session with stdin on
// /dev/null. env entries are added to the inherited environment.
// stdout_fd/stderr_fd receive the read ends of the child's pipes.
ProcessHandle spawn(const std::vector<std::string>& argv,
                    const EnvVars& env,
                    int* stdout_fd, int* stderr_fd);

struct RunOptions {
    int timeout_ms = -1;
    EnvVars env;
};

// Run to completion, capturing both streams. A child still running at the
// deadline is terminated and the result is marked timed_out.
CommandResult run_capture(const std::vector<std::string>& argv, const RunOptions& opts = {});

// Seam over run_capture so callers can be driven by canned output.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual CommandResult run(const std::vector<std::string>& argv, const RunOptions& opts) = 0;
};

class ProcessRunner : public CommandRunner {
public:
    CommandResult run(const std::vector<std::string>& argv, const RunOptions& opts) override {
        return run_capture(argv, opts);
    }
};

} // namespace platform
