#include "test_utils.hpp"
#include "multibar/format/format_utils.hpp"
#include <algorithm>

namespace multibar {
namespace testing {

FakeTerminal::FakeTerminal(size_t columns, size_t rows, bool interactive)
    : columns_(columns),
      rows_(rows),
      interactive_(interactive),
      grid_(rows, std::vector<std::string>(columns, " ")) {}

void FakeTerminal::hideCursor() {
    std::lock_guard<std::mutex> lock(mutex_);
    cursor_hidden_ = true;
    transcript_ += "<hide>";
}

void FakeTerminal::showCursor() {
    std::lock_guard<std::mutex> lock(mutex_);
    cursor_hidden_ = false;
    transcript_ += "<show>";
}

void FakeTerminal::moveToColumn(size_t column) {
    std::lock_guard<std::mutex> lock(mutex_);
    col_ = std::min(column, columns_ - 1);
    transcript_ += "<col " + std::to_string(column) + ">";
}

void FakeTerminal::moveUp(size_t rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    row_ = rows > row_ ? 0 : row_ - rows;
    transcript_ += "<up " + std::to_string(rows) + ">";
}

void FakeTerminal::moveDown(size_t rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    row_ = std::min(row_ + rows, rows_ - 1);
    transcript_ += "<down " + std::to_string(rows) + ">";
}

void FakeTerminal::clearFromCursorDown() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t c = col_; c < columns_; ++c) {
        grid_[row_][c] = " ";
    }
    for (size_t r = row_ + 1; r < rows_; ++r) {
        std::fill(grid_[r].begin(), grid_[r].end(), " ");
    }
    transcript_ += "<ed>";
}

void FakeTerminal::clearCurrentLine() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fill(grid_[row_].begin(), grid_[row_].end(), " ");
    transcript_ += "<el>";
}

void FakeTerminal::write(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    text_ += text;
    transcript_ += text;
    for (const auto& glyph : format::splitCodePoints(text)) {
        if (glyph == "\n") {
            newline();
        } else if (glyph == "\r") {
            col_ = 0;
        } else {
            putGlyph(glyph);
        }
    }
}

bool FakeTerminal::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++flush_count_;
    return !fail_flushes_;
}

terminal::TerminalSize FakeTerminal::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {columns_, rows_};
}

void FakeTerminal::resize(size_t columns, size_t rows) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& line : grid_) {
        line.resize(columns, " ");
    }
    grid_.resize(rows, std::vector<std::string>(columns, " "));
    columns_ = columns;
    rows_ = rows;
    row_ = std::min(row_, rows_ - 1);
    col_ = std::min(col_, columns_);
}

void FakeTerminal::newline() {
    col_ = 0;
    if (row_ + 1 < rows_) {
        ++row_;
        return;
    }
    scrollback_.push_back(joinRow(grid_.front()));
    grid_.erase(grid_.begin());
    grid_.emplace_back(columns_, " ");
}

void FakeTerminal::putGlyph(const std::string& glyph) {
    // Output past the right margin is dropped. A wide glyph owns the cell
    // after it, which joins back as an empty string.
    size_t width = format::codePointWidth(glyph);
    if (col_ + width <= columns_) {
        grid_[row_][col_] = glyph;
        if (width == 2) {
            grid_[row_][col_ + 1] = "";
        }
        col_ += width;
    }
}

std::string FakeTerminal::joinRow(const std::vector<std::string>& row) {
    std::string line;
    for (const auto& cell : row) {
        line += cell;
    }
    size_t end = line.find_last_not_of(' ');
    return end == std::string::npos ? "" : line.substr(0, end + 1);
}

std::vector<std::string> FakeTerminal::screen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> lines;
    for (const auto& row : grid_) {
        lines.push_back(joinRow(row));
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

std::vector<std::string> FakeTerminal::history() const {
    std::vector<std::string> lines;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lines = scrollback_;
    }
    auto visible = screen();
    lines.insert(lines.end(), visible.begin(), visible.end());
    return lines;
}

std::string FakeTerminal::text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return text_;
}

std::string FakeTerminal::transcript() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcript_;
}

size_t FakeTerminal::cursorRow() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return row_;
}

size_t FakeTerminal::flushCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return flush_count_;
}

bool FakeTerminal::cursorHidden() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cursor_hidden_;
}

ManualClock::ManualClock()
    : current_(std::make_shared<core::TimePoint>(core::Clock::now())) {}

void ManualClock::advanceSeconds(double seconds) {
    *current_ += std::chrono::duration_cast<core::Clock::duration>(std::chrono::duration<double>(seconds));
}

core::Display::ClockFunction ManualClock::function() const {
    auto current = current_;
    return [current]() { return *current; };
}

common::DisplayConfig unthrottledDisplayConfig() {
    auto config = common::Config::createDefaultConfig().display;
    config.min_interval_ms = 0.0;
    return config;
}

DisplayFixture makeDisplay(const common::DisplayConfig& config, size_t columns, size_t rows, bool interactive) {
    DisplayFixture fixture;
    fixture.terminal = std::make_shared<FakeTerminal>(columns, rows, interactive);
    fixture.display = std::make_shared<core::Display>(fixture.terminal, config, fixture.clock.function());
    return fixture;
}

core::BarRecord makeRecord(std::optional<uint64_t> total, uint64_t completed) {
    core::BarRecord record;
    record.id = 1;
    record.created_at = core::TimePoint{} + std::chrono::hours(1);
    record.total = total;
    record.completed = completed;
    return record;
}

}}
