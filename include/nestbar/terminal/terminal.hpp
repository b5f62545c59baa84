#pragma once

#include <string>
#include <ostream>
#include <unistd.h>

namespace nestbar {
namespace terminal {

class Terminal {
public:
    virtual ~Terminal() = default;

    // Throws common::RenderFailure when the output rejects the bytes.
    virtual void write(const std::string& data) = 0;
    virtual void flush() = 0;

    virtual bool isInteractive() const = 0;
    virtual int columns() const = 0;

    // Told by the stack whenever it hides or shows the cursor.
    virtual void setCursorHidden(bool) noexcept {}
};

class FdTerminal : public Terminal {
public:
    explicit FdTerminal(int fd = STDOUT_FILENO);

    void write(const std::string& data) override;
    void flush() override {}

    bool isInteractive() const override;
    int columns() const override;

    // While hidden, SIGINT and SIGTERM show the cursor on this fd before the
    // signal's previous action runs. Handlers are installed once, and only
    // over default dispositions.
    void setCursorHidden(bool hidden) noexcept override;

    int fd() const { return fd_; }

private:
    int fd_;
};

// Writes to any ostream with a fixed width. Interactive by default so the
// indicators draw into string streams in tests and captures.
class StreamTerminal : public Terminal {
public:
    explicit StreamTerminal(std::ostream& out, int columns = 80, bool interactive = true);

    void write(const std::string& data) override;
    void flush() override;

    bool isInteractive() const override { return interactive_; }
    int columns() const override { return columns_; }

    void setColumns(int columns) { columns_ = columns; }
    void setInteractive(bool interactive) { interactive_ = interactive; }

private:
    std::ostream& out_;
    int columns_;
    bool interactive_;
};

}
}
