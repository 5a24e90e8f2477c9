#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>

namespace multibar {
namespace terminal {

struct TerminalSize {
    size_t columns;
    size_t rows;
};

// Cursor and line control over one output device. Rows are addressed
// relative to the cursor: the renderer keeps its anchor row by always
// returning the cursor there after a frame.
class Terminal {
public:
    virtual ~Terminal() = default;

    virtual void hideCursor() = 0;
    virtual void showCursor() = 0;
    virtual void moveToColumn(size_t column) = 0;
    virtual void moveUp(size_t rows) = 0;
    virtual void moveDown(size_t rows) = 0;
    virtual void clearFromCursorDown() = 0;
    virtual void clearCurrentLine() = 0;
    virtual void write(const std::string& text) = 0;

    // False when the device rejected the output; the frame is dropped.
    virtual bool flush() = 0;

    // Falls back to 80x24 when the size cannot be queried.
    virtual TerminalSize size() const = 0;

    virtual bool isInteractive() const = 0;
};

// VT100/ANSI escape sequences, buffered per frame and written to `out` in
// one piece on flush. `fd` is only used for isatty/ioctl queries.
class AnsiTerminal : public Terminal {
public:
    AnsiTerminal(std::ostream& out, int fd);

    void hideCursor() override;
    void showCursor() override;
    void moveToColumn(size_t column) override;
    void moveUp(size_t rows) override;
    void moveDown(size_t rows) override;
    void clearFromCursorDown() override;
    void clearCurrentLine() override;
    void write(const std::string& text) override;
    bool flush() override;

    TerminalSize size() const override;
    bool isInteractive() const override;

    // Terminal for "stderr" or "stdout"; anything else maps to stderr.
    static std::shared_ptr<AnsiTerminal> forStream(const std::string& stream);

private:
    std::ostream& out_;
    int fd_;
    bool interactive_;
    std::mutex mutex_;
    std::string buffer_;
};

}}
