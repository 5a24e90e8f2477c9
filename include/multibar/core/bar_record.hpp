#pragma once

#include "style.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace multibar {
namespace core {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

struct BarConfig {
    std::optional<std::string> label;
    std::optional<size_t> fixed_width;
    Style style;
    double smoothing_factor = 0.3;
    bool clear_on_close = false;
};

// Shared state of one bar. Lives in the Registry; only its owning
// ProgressHandle writes to it.
struct BarRecord {
    uint64_t id = 0;
    TimePoint created_at;
    std::optional<TimePoint> last_update_at;
    uint64_t completed = 0;
    std::optional<uint64_t> total;
    std::optional<double> rate_estimate;
    BarConfig config;
};

// Partial configuration change; unset fields are left alone.
// An empty label clears the label, a width of 0 returns to terminal width.
struct BarOptions {
    std::optional<std::string> label;
    std::optional<size_t> width;
    std::optional<std::string> style;
    std::optional<double> smoothing;
    std::optional<bool> clear_on_close;
};

}}
