#include "multibar/core/display.hpp"
#include "multibar/core/bar_renderer.hpp"
#include "multibar/core/error_codes.hpp"
#include "multibar/core/rate_estimator.hpp"
#include "multibar/common/constants.hpp"
#include "multibar/common/logger.hpp"
#include "multibar/format/format_utils.hpp"
#include <algorithm>
#include <cmath>

namespace multibar {
namespace core {

namespace {

Clock::duration toDuration(double milliseconds) {
    return std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double, std::milli>(milliseconds));
}

// Lines kept in the scrollback are only cut, never padded.
std::string truncateToWidth(const std::string& line, size_t columns) {
    if (format::displayWidth(line) <= columns) {
        return line;
    }
    return format::fitToWidth(line, columns);
}

std::shared_ptr<Display> createGlobalDisplay() {
    auto config = common::Config::instance().global().display;
    try {
        return std::make_shared<Display>(terminal::AnsiTerminal::forStream(config.stream), config);
    } catch (const ConfigurationError& e) {
        common::Logger::instance().warn("[Display] Invalid display settings, using defaults | error={}",
                                        e.what());
    }

    auto defaults = common::Config::createDefaultConfig().display;
    return std::make_shared<Display>(terminal::AnsiTerminal::forStream(config.stream), defaults);
}

}

Display::Display(std::shared_ptr<terminal::Terminal> terminal,
                 const common::DisplayConfig& config,
                 ClockFunction clock,
                 std::shared_ptr<Registry> registry)
    : terminal_(std::move(terminal)),
      registry_(registry ? std::move(registry) : std::make_shared<Registry>()),
      clock_(clock ? std::move(clock) : ClockFunction([] { return Clock::now(); })),
      min_iterations_(config.min_iterations) {

    if (!RateEstimator::isValidSmoothing(config.smoothing)) {
        throw ConfigurationError(ProgressErrorCode::SMOOTHING_OUT_OF_RANGE,
                                 {"Display", {{"smoothing", fmt::format("{}", config.smoothing)}}});
    }
    if (!std::isfinite(config.min_interval_ms) || config.min_interval_ms < 0.0) {
        throw ConfigurationError(ProgressErrorCode::INTERVAL_NEGATIVE,
                                 {"Display", {{"min_interval_ms", fmt::format("{}", config.min_interval_ms)}}});
    }

    defaults_.style = Style::fromName(config.style);
    defaults_.smoothing_factor = config.smoothing;
    defaults_.clear_on_close = config.clear_on_close;
    if (config.width > 0) {
        defaults_.fixed_width = config.width;
    }
    min_interval_ = toDuration(config.min_interval_ms);
}

std::shared_ptr<Display> Display::global() {
    static std::shared_ptr<Display> instance = createGlobalDisplay();
    return instance;
}

ProgressHandle Display::create(std::optional<uint64_t> total) {
    auto self = weak_from_this().lock();
    if (!self) {
        common::Logger::instance().warn("[Display] Bar not created | reason=display not owned by shared_ptr");
        return ProgressHandle();
    }

    BarRecord record;
    record.created_at = clock_();
    record.total = total;
    record.config = defaults_;

    uint64_t id = registry_->nextId();
    TimePoint created_at = record.created_at;
    if (!registry_->insert(id, std::move(record))) {
        common::Logger::instance().warn("[Display] Bar registration failed | id={}", id);
        return ProgressHandle();
    }

    common::Logger::instance().debug("[Display] Bar created | id={} | total={}",
                                     id, total ? std::to_string(*total) : "none");
    refresh();
    return ProgressHandle(std::move(self), id, created_at, min_interval_, min_iterations_);
}

void Display::refresh() {
    std::lock_guard<std::mutex> lock(render_mutex_);
    renderLocked();
    flushLocked();
}

void Display::print(const std::string& message) {
    std::lock_guard<std::mutex> lock(render_mutex_);

    if (terminal_->isInteractive() && rows_drawn_ > 0) {
        terminal_->moveToColumn(0);
        terminal_->clearFromCursorDown();
        rows_drawn_ = 0;
    }
    terminal_->write(message + "\n");

    renderLocked();
    flushLocked();
}

bool Display::update(uint64_t id, uint64_t delta, TimePoint now) {
    if (!registry_->update(id, delta, now)) {
        common::Logger::instance().debug("[Display] Update for unknown bar | id={}", id);
        return false;
    }
    refresh();
    return true;
}

bool Display::configure(uint64_t id, const std::function<void(BarRecord&)>& mutation) {
    if (!registry_->modify(id, mutation)) {
        common::Logger::instance().debug("[Display] Configure for unknown bar | id={}", id);
        return false;
    }
    refresh();
    return true;
}

bool Display::finalize(uint64_t id) {
    std::lock_guard<std::mutex> lock(render_mutex_);

    auto record = registry_->remove(id);
    if (!record) {
        return false;
    }

    const bool clear = record->config.clear_on_close;
    common::Logger::instance().debug("[Display] Bar closed | id={} | completed={} | cleared={}",
                                     id, record->completed, clear);

    if (!terminal_->isInteractive()) {
        if (!clear) {
            auto size = terminal_->size();
            size_t width = BarRenderer::resolveWidth(*record, size.columns);
            terminal_->write(BarRenderer::renderLine(*record, clock_(), width) + "\n");
            flushLocked();
        }
        return true;
    }

    auto size = terminal_->size();
    size_t columns = size.columns > 0 ? size.columns : constants::terminal::FALLBACK_COLUMNS;

    if (clear) {
        // Drop the bottom row; the redraw below shifts the survivors up.
        if (rows_drawn_ > 0) {
            terminal_->moveDown(rows_drawn_ - 1);
            terminal_->moveToColumn(0);
            terminal_->clearCurrentLine();
            terminal_->moveUp(rows_drawn_ - 1);
            rows_drawn_ -= 1;
        }
    } else {
        // The closed bar takes over the anchor row and the block moves down by one.
        size_t width = std::min(BarRenderer::resolveWidth(*record, columns), columns);
        terminal_->moveToColumn(0);
        terminal_->clearCurrentLine();
        terminal_->write(truncateToWidth(BarRenderer::renderLine(*record, clock_(), width), columns));
        terminal_->write("\n");
        if (rows_drawn_ > 0) {
            rows_drawn_ -= 1;
        }
    }

    renderLocked();
    flushLocked();
    return true;
}

void Display::renderLocked() {
    if (!terminal_->isInteractive()) {
        return;
    }

    auto records = registry_->snapshotOrdered();
    auto size = terminal_->size();
    size_t columns = size.columns > 0 ? size.columns : constants::terminal::FALLBACK_COLUMNS;
    size_t rows = size.rows > 0 ? size.rows : constants::terminal::FALLBACK_ROWS;

    // One row stays free for the cursor; overflow collapses into a notice.
    size_t capacity = rows > 1 ? rows - 1 : 1;
    size_t shown = records.size();
    size_t hidden = 0;
    if (records.size() > capacity) {
        shown = capacity - 1;
        hidden = records.size() - shown;
    }
    size_t lines = shown + (hidden > 0 ? 1 : 0);

    if (lines == 0 && rows_drawn_ == 0) {
        return;
    }

    TimePoint now = clock_();

    terminal_->hideCursor();
    terminal_->moveToColumn(0);
    if (lines < rows_drawn_) {
        terminal_->clearFromCursorDown();
    }

    for (size_t i = 0; i < lines; ++i) {
        if (i > 0) {
            terminal_->write("\n");
            terminal_->moveToColumn(0);
        }
        terminal_->clearCurrentLine();

        std::string line;
        if (i < shown) {
            size_t width = std::min(BarRenderer::resolveWidth(records[i], columns), columns);
            line = BarRenderer::renderLine(records[i], now, width);
        } else {
            line = fmt::format("... {} more hidden", hidden);
        }
        terminal_->write(format::fitToWidth(line, columns));
    }

    if (lines > 1) {
        terminal_->moveUp(lines - 1);
    }
    terminal_->moveToColumn(0);
    terminal_->showCursor();

    rows_drawn_ = lines;
}

void Display::flushLocked() {
    if (terminal_->flush()) {
        return;
    }
    if (!write_failure_reported_) {
        write_failure_reported_ = true;
        common::Logger::instance().warn("[Display] Frame dropped | code={} | error={}",
                                        ProgressErrorCodeHelper::toString(ProgressErrorCode::TERMINAL_WRITE_FAILED),
                                        ProgressErrorCodeHelper::getMessage(ProgressErrorCode::TERMINAL_WRITE_FAILED));
    }
}

}}
