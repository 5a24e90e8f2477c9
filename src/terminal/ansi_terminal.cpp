#include "multibar/terminal/terminal.hpp"
#include "multibar/common/constants.hpp"
#include <spdlog/fmt/fmt.h>
#include <iostream>
#include <sys/ioctl.h>
#include <unistd.h>

namespace multibar {
namespace terminal {

AnsiTerminal::AnsiTerminal(std::ostream& out, int fd)
    : out_(out),
      fd_(fd),
      interactive_(isatty(fd) == 1) {}

std::shared_ptr<AnsiTerminal> AnsiTerminal::forStream(const std::string& stream) {
    if (stream == "stdout") {
        return std::make_shared<AnsiTerminal>(std::cout, STDOUT_FILENO);
    }
    return std::make_shared<AnsiTerminal>(std::cerr, STDERR_FILENO);
}

void AnsiTerminal::hideCursor() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_ += "\033[?25l";
}

void AnsiTerminal::showCursor() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_ += "\033[?25h";
}

void AnsiTerminal::moveToColumn(size_t column) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (column == 0) {
        buffer_ += "\r";
    } else {
        buffer_ += fmt::format("\033[{}G", column + 1);
    }
}

void AnsiTerminal::moveUp(size_t rows) {
    if (rows == 0) return;
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_ += fmt::format("\033[{}A", rows);
}

void AnsiTerminal::moveDown(size_t rows) {
    if (rows == 0) return;
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_ += fmt::format("\033[{}B", rows);
}

void AnsiTerminal::clearFromCursorDown() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_ += "\033[J";
}

void AnsiTerminal::clearCurrentLine() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_ += "\033[2K";
}

void AnsiTerminal::write(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_ += text;
}

bool AnsiTerminal::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (buffer_.empty()) {
        return true;
    }

    out_ << buffer_;
    out_.flush();
    buffer_.clear();

    if (!out_) {
        out_.clear();
        return false;
    }
    return true;
}

TerminalSize AnsiTerminal::size() const {
    struct winsize w;
    if (ioctl(fd_, TIOCGWINSZ, &w) == 0 && w.ws_col > 0 && w.ws_row > 0) {
        return {w.ws_col, w.ws_row};
    }
    return {constants::terminal::FALLBACK_COLUMNS, constants::terminal::FALLBACK_ROWS};
}

bool AnsiTerminal::isInteractive() const {
    return interactive_;
}

}}
