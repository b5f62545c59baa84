#include <gtest/gtest.h>
#include "nestbar/terminal/terminal.hpp"
#include "nestbar/terminal/clock.hpp"
#include "nestbar/common/error_codes.hpp"
#include <csignal>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <sys/wait.h>
#include <unistd.h>

using namespace nestbar;
using namespace nestbar::terminal;

namespace {

std::string drain(int fd) {
    std::string out;
    char buffer[64];
    ssize_t n;
    while ((n = read(fd, buffer, sizeof(buffer))) > 0) {
        out.append(buffer, static_cast<size_t>(n));
    }
    return out;
}

// Forks a child that marks the cursor hidden (or not) on a pipe and then
// raises signo. Returns what the child wrote and its wait status.
std::pair<std::string, int> signalWithCursor(bool hidden, int signo) {
    int fds[2];
    if (pipe(fds) != 0) {
        return {"", -1};
    }

    pid_t pid = fork();
    if (pid == 0) {
        close(fds[0]);
        // A shell may start background jobs with SIGINT ignored.
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        FdTerminal terminal(fds[1]);
        terminal.setCursorHidden(true);
        if (!hidden) {
            terminal.setCursorHidden(false);
        }
        raise(signo);
        _exit(0);
    }

    close(fds[1]);
    std::string out = drain(fds[0]);
    close(fds[0]);

    int status = -1;
    if (pid < 0 || waitpid(pid, &status, 0) != pid) {
        return {out, -1};
    }
    return {out, status};
}

}

TEST(TerminalTest, StreamTerminalWritesThrough) {
    std::ostringstream out;
    StreamTerminal terminal(out, 42);

    terminal.write("abc");
    terminal.flush();
    EXPECT_EQ(out.str(), "abc");
    EXPECT_EQ(terminal.columns(), 42);
    EXPECT_TRUE(terminal.isInteractive());

    terminal.setInteractive(false);
    EXPECT_FALSE(terminal.isInteractive());
}

TEST(TerminalTest, StreamTerminalReportsFailedStream) {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    StreamTerminal terminal(out);

    EXPECT_THROW(terminal.write("x"), common::RenderFailure);
}

TEST(TerminalTest, PipeIsNotInteractive) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);

    FdTerminal terminal(fds[1]);
    EXPECT_FALSE(terminal.isInteractive());
    EXPECT_EQ(terminal.columns(), 80);

    terminal.write("hello");
    char buffer[8] = {};
    ASSERT_EQ(read(fds[0], buffer, sizeof(buffer)), 5);
    EXPECT_EQ(std::string(buffer, 5), "hello");

    close(fds[0]);
    close(fds[1]);
}

TEST(TerminalTest, ClosedPipeRaisesRenderFailure) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    close(fds[0]);

    FdTerminal terminal(fds[1]);
    try {
        terminal.write("lost");
        FAIL() << "expected RenderFailure";
    } catch (const common::RenderFailure& e) {
        EXPECT_EQ(e.code(), common::ErrorCode::RENDER_STREAM_CLOSED);
    }

    // Still alive: SIGPIPE was kept from terminating the process.
    EXPECT_THROW(terminal.write("again"), common::RenderFailure);
    close(fds[1]);
}

TEST(TerminalTest, InvalidDescriptor) {
    FdTerminal terminal(-1);
    EXPECT_FALSE(terminal.isInteractive());
    EXPECT_THROW(terminal.write("x"), common::RenderFailure);
}

TEST(TerminalTest, BufferedStdoutTextPrecedesRows) {
    int fds[2];
    ASSERT_EQ(pipe(fds), 0);
    std::cout.flush();
    std::fflush(stdout);
    int saved = dup(STDOUT_FILENO);
    ASSERT_GE(saved, 0);
    ASSERT_GE(dup2(fds[1], STDOUT_FILENO), 0);

    std::cout << "header:";
    std::printf("stdio:");
    FdTerminal terminal(STDOUT_FILENO);
    terminal.write("row");

    std::fflush(stdout);
    dup2(saved, STDOUT_FILENO);
    close(saved);
    close(fds[1]);

    EXPECT_EQ(drain(fds[0]), "header:stdio:row");
    close(fds[0]);
}

TEST(TerminalTest, SignalWhileCursorHiddenShowsIt) {
    auto [out, status] = signalWithCursor(true, SIGTERM);
    ASSERT_NE(status, -1);
    EXPECT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGTERM);
    EXPECT_EQ(out, "\033[?25h");

    auto [interrupted, int_status] = signalWithCursor(true, SIGINT);
    ASSERT_NE(int_status, -1);
    EXPECT_TRUE(WIFSIGNALED(int_status));
    EXPECT_EQ(WTERMSIG(int_status), SIGINT);
    EXPECT_EQ(interrupted, "\033[?25h");
}

TEST(TerminalTest, SignalWithCursorShownWritesNothing) {
    auto [out, status] = signalWithCursor(false, SIGINT);
    ASSERT_NE(status, -1);
    EXPECT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGINT);
    EXPECT_TRUE(out.empty());
}

TEST(ClockTest, SteadyClockIsMonotonic) {
    SteadyClock clock;
    double first = clock.now();
    double second = clock.now();
    EXPECT_GE(first, 0.0);
    EXPECT_GE(second, first);
}
