#pragma once

#include "core/async.hpp"
#include "core/bar_record.hpp"
#include "core/display.hpp"
#include "core/error_codes.hpp"
#include "core/progress_handle.hpp"
#include "core/style.hpp"
#include "core/tracked.hpp"
#include <future>
#include <optional>
#include <string>
#include <vector>

namespace multibar {

using core::BarOptions;
using core::ConfigurationError;
using core::Display;
using core::ProgressHandle;
using core::Style;

// Shortcuts onto Display::global(), which draws on the configured stream
// (stderr unless the config says otherwise).

inline ProgressHandle create(std::optional<uint64_t> total = std::nullopt) {
    return Display::global()->create(total);
}

inline void refresh() {
    Display::global()->refresh();
}

inline void print(const std::string& message) {
    Display::global()->print(message);
}

template<typename Range>
auto tqdm(Range& range) {
    return core::track(range, Display::global());
}

template<typename T>
std::vector<std::future<T>> trackAsync(std::vector<std::future<T>> futures) {
    return core::trackAsync(std::move(futures), Display::global());
}

}
