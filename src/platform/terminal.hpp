#pragma once

namespace platform {

// RAII guard for password entry: canonical mode and echo off, signals
// left on so Ctrl-C still aborts. Destructor restores the saved mode.
// Does nothing when stdin is not a terminal.
struct NoEchoGuard {
    NoEchoGuard();
    ~NoEchoGuard();

    NoEchoGuard(const NoEchoGuard&) = delete;
    NoEchoGuard& operator=(const NoEchoGuard&) = delete;

private:
    struct Impl;
    Impl* impl_ = nullptr;
};

// Flush any pending input from stdin.
void flush_stdin();

} // namespace platform
