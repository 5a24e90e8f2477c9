#pragma once

#include "bar_record.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace multibar {
namespace core {

class Display;

// Caller-side handle for one bar. Move-only; closing is idempotent and
// happens at the latest when the handle is destroyed, so the bar's row is
// released on every exit path.
//
// Usage:
//   auto bar = display->create(total);
//   bar.label("download").style("ascii");
//   for (...) bar.advance(1);
//   bar.close();
class ProgressHandle {
public:
    ProgressHandle() = default;
    ~ProgressHandle();

    ProgressHandle(ProgressHandle&& other) noexcept;
    ProgressHandle& operator=(ProgressHandle&& other) noexcept;

    ProgressHandle(const ProgressHandle&) = delete;
    ProgressHandle& operator=(const ProgressHandle&) = delete;

    // Accumulates locally; pushes to the display once both the iteration
    // and the time threshold are met.
    void advance(uint64_t n = 1);

    // Setters validate before touching the record and throw
    // ConfigurationError on bad input. They are ignored after close.
    ProgressHandle& label(const std::string& label);
    ProgressHandle& width(std::optional<size_t> width);
    ProgressHandle& style(const std::string& name);
    ProgressHandle& style(const Style& style);
    ProgressHandle& smoothing(double factor);
    ProgressHandle& clearOnClose(bool clear);
    ProgressHandle& total(std::optional<uint64_t> total);
    ProgressHandle& configure(const BarOptions& options);

    ProgressHandle& minInterval(Clock::duration interval);
    ProgressHandle& minIterations(uint64_t iterations);

    void close();

    bool valid() const { return display_ != nullptr; }
    bool isClosed() const { return closed_; }
    uint64_t id() const { return id_; }

    // Items reported so far, flushed or not.
    uint64_t position() const { return flushed_ + pending_; }

private:
    friend class Display;
    ProgressHandle(std::shared_ptr<Display> display, uint64_t id, TimePoint created_at,
                   Clock::duration min_interval, uint64_t min_iterations);

    void applyConfig(const BarConfig& config);
    void closeQuietly() noexcept;

    std::shared_ptr<Display> display_;
    uint64_t id_ = 0;
    bool closed_ = true;

    uint64_t pending_ = 0;
    uint64_t flushed_ = 0;

    Clock::duration min_interval_{0};
    uint64_t min_iterations_ = 1;
    TimePoint next_flush_at_;
};

}}
