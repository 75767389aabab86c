#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <chrono>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    if (valid() && !reaped_) terminate();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept {
    pid_ = other.pid_;
    reaped_ = other.reaped_;
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        if (valid() && !reaped_) terminate();
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::reap(int status, int& exit_code) {
    reaped_ = true;
    if (WIFEXITED(status)) exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) exit_code = 128 + WTERMSIG(status);
    else exit_code = -1;
}

bool ProcessHandle::wait(int timeout_ms, int& exit_code) {
    exit_code = -1;
    if (!valid() || reaped_) return true;
    int status;
    if (timeout_ms < 0) {
        if (waitpid(pid_, &status, 0) == pid_) reap(status, exit_code);
        return true;
    }
    // Poll with timeout
    int elapsed = 0;
    while (true) {
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            reap(status, exit_code);
            return true;
        }
        if (ret < 0) return true;
        if (elapsed >= timeout_ms) return false;
        sleep_ms(20);
        elapsed += 20;
    }
}

void ProcessHandle::terminate() {
    if (!valid() || reaped_) return;
    // The child leads its own session; signal the whole group.
    kill(-pid_, SIGTERM);
    for (int waited = 0; waited < PROCESS_KILL_GRACE_MS; waited += 50) {
        int status;
        if (waitpid(pid_, &status, WNOHANG) == pid_) {
            reaped_ = true;
            return;
        }
        sleep_ms(50);
    }
    kill(-pid_, SIGKILL);
    waitpid(pid_, nullptr, 0);
    reaped_ = true;
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::vector<std::string>& argv,
                    const EnvVars& env,
                    int* stdout_fd, int* stderr_fd) {
    ProcessHandle handle;
    if (argv.empty()) return handle;

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) return handle;
    if (pipe(err_pipe) != 0) {
        close(out_pipe[0]);
        close(out_pipe[1]);
        return handle;
    }

    pid_t pid = fork();
    if (pid < 0) {  // fork failed
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);
        return handle;
    }

    if (pid == 0) {
        // Child process. No controlling terminal, so ssh can never fall
        // back to prompting on /dev/tty.
        setsid();

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(err_pipe[0]); close(err_pipe[1]);

        for (const auto& kv : env) setenv(kv.first.c_str(), kv.second.c_str(), 1);

        std::vector<char*> args;
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);

        execvp(args[0], args.data());
        std::string msg = argv[0] + ": " + std::strerror(errno) + "\n";
        ssize_t ignored = write(STDERR_FILENO, msg.data(), msg.size());
        (void)ignored;
        _exit(127);  // exec failed
    }

    // Parent
    close(out_pipe[1]);
    close(err_pipe[1]);
    *stdout_fd = out_pipe[0];
    *stderr_fd = err_pipe[0];
    handle.pid_ = pid;
    return handle;
}

// ── run_capture ──────────────────────────────────────────────

CommandResult run_capture(const std::vector<std::string>& argv, const RunOptions& opts) {
    CommandResult result;

    int fds[2] = {-1, -1};
    ProcessHandle proc = spawn(argv, opts.env, &fds[0], &fds[1]);
    if (!proc.valid()) {
        result.exit_code = 127;
        result.stderr_data = "failed to start " + (argv.empty() ? std::string("<empty>") : argv[0]);
        return result;
    }
    for (int fd : fds) fcntl(fd, F_SETFL, fcntl(fd, F_GETFL, 0) | O_NONBLOCK);

    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + std::chrono::milliseconds(opts.timeout_ms);
    auto remaining_ms = [&]() -> int {
        if (opts.timeout_ms < 0) return -1;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        return left.count() > 0 ? static_cast<int>(left.count()) : 0;
    };

    std::string* sinks[2] = {&result.stdout_data, &result.stderr_data};
    char buf[PROCESS_READ_BUF_SIZE];

    while (fds[0] >= 0 || fds[1] >= 0) {
        int wait_ms = remaining_ms();
        if (wait_ms == 0) {
            result.timed_out = true;
            break;
        }
        struct pollfd pfds[2] = {{fds[0], POLLIN, 0}, {fds[1], POLLIN, 0}};
        int ret = poll(pfds, 2, wait_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (int i = 0; i < 2; i++) {
            if (fds[i] < 0 || !(pfds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
            ssize_t n = read(fds[i], buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EAGAIN && errno != EINTR)) {
                close(fds[i]);
                fds[i] = -1;
            }
        }
    }

    for (int& fd : fds) {
        if (fd >= 0) close(fd);
        fd = -1;
    }

    if (!result.timed_out) {
        int wait_ms = remaining_ms();
        if (!proc.wait(wait_ms, result.exit_code)) result.timed_out = true;
    }
    if (result.timed_out) {
        proc.terminate();
        result.exit_code = -1;
    }
    return result;
}

} // namespace platform
