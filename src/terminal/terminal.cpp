#include "nestbar/terminal/terminal.hpp"
#include "nestbar/common/constants.hpp"
#include "nestbar/common/error_codes.hpp"
#include <sys/ioctl.h>
#include <signal.h>
#include <pthread.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iostream>

namespace nestbar {
namespace terminal {

namespace {

// Keeps a write to a closed pipe from raising SIGPIPE, so it surfaces as EPIPE.
class SigpipeGuard {
public:
    SigpipeGuard() {
        sigemptyset(&pipe_set_);
        sigaddset(&pipe_set_, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;

        blocked_ = pthread_sigmask(SIG_BLOCK, &pipe_set_, &old_mask_) == 0;
    }

    ~SigpipeGuard() {
        if (!blocked_) return;

        if (raised_ && !was_pending_) {
            struct timespec zero = {0, 0};
            while (sigtimedwait(&pipe_set_, nullptr, &zero) == -1 && errno == EINTR) {
            }
        }
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }

    void markRaised() { raised_ = true; }

private:
    sigset_t pipe_set_;
    sigset_t old_mask_;
    bool blocked_ = false;
    bool was_pending_ = false;
    bool raised_ = false;
};

volatile sig_atomic_t g_cursor_fd = -1;
volatile sig_atomic_t g_cursor_hidden = 0;
bool g_handlers_installed = false;
struct sigaction g_previous_int;
struct sigaction g_previous_term;

// Async-signal-safe: only write, sigaction and raise.
void restoreCursorAndReraise(int signo) {
    if (g_cursor_hidden && g_cursor_fd >= 0) {
        const char* show = constants::ansi::SHOW_CURSOR;
        if (::write(g_cursor_fd, show, std::strlen(show)) < 0) {
        }
        g_cursor_hidden = 0;
    }
    sigaction(signo, signo == SIGINT ? &g_previous_int : &g_previous_term, nullptr);
    raise(signo);
}

void installIfDefault(int signo, struct sigaction* previous) {
    struct sigaction current;
    if (sigaction(signo, nullptr, &current) != 0 || current.sa_handler != SIG_DFL) {
        return;
    }
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = &restoreCursorAndReraise;
    sigemptyset(&action.sa_mask);
    if (sigaction(signo, &action, previous) != 0) {
        *previous = current;
    }
}

common::ErrorContext writeContext(int fd, int err) {
    common::ErrorContext ctx;
    ctx.component = "Terminal";
    ctx.details["fd"] = std::to_string(fd);
    ctx.details["errno"] = std::to_string(err);
    ctx.details["error"] = std::strerror(err);
    return ctx;
}

}

FdTerminal::FdTerminal(int fd) : fd_(fd) {}

void FdTerminal::write(const std::string& data) {
    if (data.empty()) return;

    if (fd_ < 0) {
        throw common::RenderFailure(common::ErrorCode::RENDER_STREAM_CLOSED, "",
                                    writeContext(fd_, EBADF));
    }

    // Text the caller left in the stdio buffers belongs above the rows.
    if (fd_ == STDOUT_FILENO) {
        std::cout.flush();
        std::fflush(stdout);
    }

    SigpipeGuard guard;

    size_t written = 0;
    while (written < data.size()) {
        ssize_t result = ::write(fd_, data.data() + written, data.size() - written);
        if (result < 0) {
            int err = errno;
            if (err == EINTR) continue;
            if (err == EPIPE) {
                guard.markRaised();
                throw common::RenderFailure(common::ErrorCode::RENDER_STREAM_CLOSED, "",
                                            writeContext(fd_, err));
            }
            throw common::RenderFailure(common::ErrorCode::RENDER_WRITE_FAILED, "",
                                        writeContext(fd_, err));
        }
        written += static_cast<size_t>(result);
    }
}

void FdTerminal::setCursorHidden(bool hidden) noexcept {
    if (fd_ < 0) return;

    if (hidden && !g_handlers_installed) {
        g_handlers_installed = true;
        installIfDefault(SIGINT, &g_previous_int);
        installIfDefault(SIGTERM, &g_previous_term);
    }
    g_cursor_fd = fd_;
    g_cursor_hidden = hidden ? 1 : 0;
}

bool FdTerminal::isInteractive() const {
    return fd_ >= 0 && isatty(fd_);
}

int FdTerminal::columns() const {
    struct winsize w;
    if (fd_ >= 0 && ioctl(fd_, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return constants::limits::DEFAULT_TERMINAL_COLUMNS;
}

StreamTerminal::StreamTerminal(std::ostream& out, int columns, bool interactive)
    : out_(out), columns_(columns), interactive_(interactive) {}

void StreamTerminal::write(const std::string& data) {
    out_ << data;
    if (!out_) {
        common::ErrorContext ctx;
        ctx.component = "Terminal";
        ctx.details["stream"] = "ostream";
        throw common::RenderFailure(common::ErrorCode::RENDER_WRITE_FAILED, "", ctx);
    }
}

void StreamTerminal::flush() {
    out_.flush();
    if (!out_) {
        common::ErrorContext ctx;
        ctx.component = "Terminal";
        ctx.details["stream"] = "ostream";
        ctx.details["operation"] = "flush";
        throw common::RenderFailure(common::ErrorCode::RENDER_WRITE_FAILED, "", ctx);
    }
}

}
}
