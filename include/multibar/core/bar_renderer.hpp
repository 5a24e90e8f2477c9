#pragma once

#include "bar_record.hpp"
#include <cstdint>
#include <string>

namespace multibar {
namespace core {

class BarRenderer {
public:
    // Formats one bar as a single line. Pure: the same record, time and
    // width always give the same text, and no input makes it throw or
    // divide by zero.
    static std::string renderLine(const BarRecord& record, TimePoint now, size_t width);

    // Per-bar fixed width, else the terminal's columns, else the fallback.
    static size_t resolveWidth(const BarRecord& record, size_t terminal_columns);

    // Fill for completed/total over length cells. Widths past
    // MAX_RENDER_WIDTH are cut to it.
    static std::string renderGlyphBar(const Style& style, uint64_t completed, uint64_t total, size_t length);

private:
    static std::string labelPrefix(const BarRecord& record);
};

}}
