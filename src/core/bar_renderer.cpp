#include "multibar/core/bar_renderer.hpp"
#include "multibar/core/rate_estimator.hpp"
#include "multibar/common/constants.hpp"
#include "multibar/format/format_utils.hpp"
#include <algorithm>
#include <iomanip>
#include <limits>
#include <sstream>

namespace multibar {
namespace core {

namespace {

uint64_t elapsedSeconds(const BarRecord& record, TimePoint now) {
    if (now <= record.created_at) {
        return 0;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - record.created_at);
    return static_cast<uint64_t>(elapsed.count());
}

std::string repeat(const std::string& glyph, size_t count) {
    std::string result;
    result.reserve(glyph.size() * count);
    for (size_t i = 0; i < count; ++i) {
        result += glyph;
    }
    return result;
}

// floor(scale * completed / total) for completed < total. Exact while the
// product fits in 64 bits.
uint64_t scaledFloor(uint64_t completed, uint64_t total, uint64_t scale) {
    if (scale == 0 || completed <= std::numeric_limits<uint64_t>::max() / scale) {
        return completed * scale / total;
    }
    long double scaled = static_cast<long double>(completed) / static_cast<long double>(total)
                         * static_cast<long double>(scale);
    return std::min(static_cast<uint64_t>(scaled), scale - 1);
}

}

std::string BarRenderer::labelPrefix(const BarRecord& record) {
    if (!record.config.label || record.config.label->empty()) {
        return "";
    }
    return *record.config.label + ": ";
}

size_t BarRenderer::resolveWidth(const BarRecord& record, size_t terminal_columns) {
    if (record.config.fixed_width && *record.config.fixed_width > 0) {
        return *record.config.fixed_width;
    }
    if (terminal_columns > 0) {
        return terminal_columns;
    }
    return constants::terminal::FALLBACK_COLUMNS;
}

std::string BarRenderer::renderGlyphBar(const Style& style, uint64_t completed, uint64_t total, size_t length) {
    auto glyphs = style.glyphs();
    const std::string& full = glyphs.back();
    length = std::min(length, constants::limits::MAX_RENDER_WIDTH);

    if (total == 0 || completed >= total) {
        return repeat(full, length);
    }

    // floor(n * frac(x)) == floor(n * x) - n * floor(x) keeps the partial
    // glyph in integer arithmetic as well.
    uint64_t levels = glyphs.size() - 1;
    uint64_t whole = scaledFloor(completed, total, length);
    uint64_t steps = scaledFloor(completed, total, length * levels);
    uint64_t partial = steps >= whole * levels ? steps - whole * levels : 0;
    size_t index = static_cast<size_t>(std::min(partial, levels - 1));

    std::string bar = repeat(full, whole);
    if (whole < length) {
        bar += glyphs[index];
        bar += repeat(style.padding(), length - whole - 1);
    }
    return bar;
}

std::string BarRenderer::renderLine(const BarRecord& record, TimePoint now, size_t width) {
    std::string label = labelPrefix(record);
    std::string elapsed = format::formatTime(elapsedSeconds(record, now));
    std::string rate = format::formatRate(record.rate_estimate);

    std::ostringstream oss;

    if (!record.total) {
        oss << label << record.completed << "it [" << elapsed << ", " << rate << "it/s]";
        return oss.str();
    }

    uint64_t total = *record.total;
    bool complete = total == 0 || record.completed >= total;
    uint64_t percent = complete ? 100 : scaledFloor(record.completed, total, 100);

    uint64_t remaining = complete ? 0 : total - record.completed;
    std::string eta = format::formatEta(RateEstimator::eta(record.rate_estimate, remaining));

    std::ostringstream head;
    head << label << std::setw(3) << percent << "%|";

    std::ostringstream tail;
    tail << "| " << record.completed << "/" << total
         << " [" << elapsed << "<" << eta << ", " << rate << "it/s]";

    width = std::min(width, constants::limits::MAX_RENDER_WIDTH);
    size_t used = format::displayWidth(head.str()) + format::displayWidth(tail.str());
    size_t length = width > used ? width - used : 0;

    oss << head.str() << renderGlyphBar(record.config.style, record.completed, total, length) << tail.str();
    return oss.str();
}

}}
