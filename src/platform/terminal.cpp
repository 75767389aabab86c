#include "terminal.hpp"

#include <termios.h>
#include <unistd.h>

namespace platform {

// ── NoEchoGuard ──────────────────────────────────────────────

struct NoEchoGuard::Impl {
    struct termios old_term;
};

NoEchoGuard::NoEchoGuard() {
    struct termios current;
    if (tcgetattr(STDIN_FILENO, &current) != 0) return;  // not a terminal
    impl_ = new Impl{current};
    struct termios raw = current;
    raw.c_lflag &= ~(ICANON | ECHO);
    raw.c_cc[VMIN] = 1;
    raw.c_cc[VTIME] = 0;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

// ── flush_stdin ──────────────────────────────────────────────

void flush_stdin() {
    tcflush(STDIN_FILENO, TCIFLUSH);
}

} // namespace platform
