#pragma once

#include "bar_record.hpp"
#include "progress_handle.hpp"
#include "registry.hpp"
#include "../common/config.hpp"
#include "../terminal/terminal.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace multibar {
namespace core {

// Owns the shared viewport: one Registry of bars, the terminal they are
// drawn on and the render lock. Every terminal write happens under that lock.
//
// Frames are drawn top-down from an anchor row and the cursor is parked back
// on the anchor afterwards, so the next frame overwrites in place whatever
// bars were added or removed in between.
//
// Must be owned by a std::shared_ptr; handles keep their display alive.
// create() on a display without an owner returns an inert handle.
class Display : public std::enable_shared_from_this<Display> {
public:
    using ClockFunction = std::function<TimePoint()>;

    // Throws ConfigurationError when `config` names an unknown style or an
    // out-of-range smoothing factor or interval.
    Display(std::shared_ptr<terminal::Terminal> terminal,
            const common::DisplayConfig& config,
            ClockFunction clock = nullptr,
            std::shared_ptr<Registry> registry = nullptr);

    Display(const Display&) = delete;
    Display& operator=(const Display&) = delete;

    // Process-wide display built from common::Config on first use.
    static std::shared_ptr<Display> global();

    ProgressHandle create(std::optional<uint64_t> total = std::nullopt);

    // Full redraw of every active bar.
    void refresh();

    // Prints a line above the bar block without tearing it.
    void print(const std::string& message);

    // Pushes a flushed delta into the registry and redraws.
    bool update(uint64_t id, uint64_t delta, TimePoint now);

    bool configure(uint64_t id, const std::function<void(BarRecord&)>& mutation);

    // Removes the bar, leaves its final line in the scrollback (or clears it
    // when clear_on_close is set) and redraws the rest. False if already gone.
    bool finalize(uint64_t id);

    TimePoint now() const { return clock_(); }

    Registry& registry() { return *registry_; }
    const Registry& registry() const { return *registry_; }

    const BarConfig& defaults() const { return defaults_; }
    Clock::duration minInterval() const { return min_interval_; }
    uint64_t minIterations() const { return min_iterations_; }

private:
    void renderLocked();
    void flushLocked();

    std::shared_ptr<terminal::Terminal> terminal_;
    std::shared_ptr<Registry> registry_;
    ClockFunction clock_;

    BarConfig defaults_;
    Clock::duration min_interval_;
    uint64_t min_iterations_;

    std::mutex render_mutex_;
    size_t rows_drawn_ = 0;
    bool write_failure_reported_ = false;
};

}}
