#include "multibar/format/format_utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace multibar {
namespace format {

namespace {

constexpr const char* REPLACEMENT_CHARACTER = "�";

// Largest ETA still shown as a clock; anything beyond reads as unknown.
constexpr double MAX_DISPLAY_SECONDS = 100.0 * 365 * 24 * 3600;

size_t sequenceLength(unsigned char lead) {
    if ((lead & 0x80) == 0) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

bool isValidSequence(const std::string& text, size_t start, size_t length) {
    if (length == 0 || start + length > text.length()) {
        return false;
    }
    for (size_t j = 1; j < length; ++j) {
        if ((static_cast<unsigned char>(text[start + j]) & 0xC0) != 0x80) {
            return false;
        }
    }
    return true;
}

uint32_t decodeCodePoint(const std::string& code_point) {
    auto lead = static_cast<unsigned char>(code_point[0]);
    size_t length = code_point.size();
    uint32_t value = length == 1 ? lead
                   : length == 2 ? (lead & 0x1Fu)
                   : length == 3 ? (lead & 0x0Fu)
                   : (lead & 0x07u);
    for (size_t i = 1; i < length; ++i) {
        value = (value << 6) | (static_cast<unsigned char>(code_point[i]) & 0x3Fu);
    }
    return value;
}

// East Asian Wide and Fullwidth blocks plus the emoji planes.
struct CodePointRange {
    uint32_t first;
    uint32_t last;
};

constexpr CodePointRange WIDE_RANGES[] = {
    {0x1100, 0x115F},
    {0x231A, 0x231B},
    {0x2329, 0x232A},
    {0x23E9, 0x23EC},
    {0x25FD, 0x25FE},
    {0x2614, 0x2615},
    {0x2E80, 0x303E},
    {0x3041, 0x33FF},
    {0x3400, 0x4DBF},
    {0x4E00, 0x9FFF},
    {0xA000, 0xA4CF},
    {0xA960, 0xA97F},
    {0xAC00, 0xD7A3},
    {0xF900, 0xFAFF},
    {0xFE10, 0xFE19},
    {0xFE30, 0xFE6F},
    {0xFF00, 0xFF60},
    {0xFFE0, 0xFFE6},
    {0x1F300, 0x1F64F},
    {0x1F680, 0x1F6FF},
    {0x1F900, 0x1F9FF},
    {0x20000, 0x2FFFD},
    {0x30000, 0x3FFFD},
};

}

std::string sanitizeControlCharacters(const std::string& text) {
    std::ostringstream result;

    for (const auto& code_point : splitCodePoints(text)) {
        unsigned char c = static_cast<unsigned char>(code_point[0]);
        if (code_point.size() == 1 && isControlCharacter(c)) {
            result << getControlCharReplacement(c);
        } else {
            result << code_point;
        }
    }

    return result.str();
}

bool isControlCharacter(unsigned char c) {
    return c < 0x20 || c == 0x7F;
}

std::string getControlCharReplacement(unsigned char c) {
    std::ostringstream oss;
    oss << "<" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
        << static_cast<int>(c) << ">";
    return oss.str();
}

std::vector<std::string> splitCodePoints(const std::string& text) {
    std::vector<std::string> code_points;
    code_points.reserve(text.length());

    size_t i = 0;
    while (i < text.length()) {
        size_t length = sequenceLength(static_cast<unsigned char>(text[i]));
        if (isValidSequence(text, i, length)) {
            code_points.push_back(text.substr(i, length));
            i += length;
        } else {
            code_points.push_back(REPLACEMENT_CHARACTER);
            ++i;
        }
    }

    return code_points;
}

size_t codePointWidth(const std::string& code_point) {
    if (code_point.empty()) {
        return 0;
    }
    uint32_t value = decodeCodePoint(code_point);
    for (const auto& range : WIDE_RANGES) {
        if (value >= range.first && value <= range.last) {
            return 2;
        }
    }
    return 1;
}

size_t displayWidth(const std::string& text) {
    size_t width = 0;
    for (const auto& code_point : splitCodePoints(text)) {
        width += codePointWidth(code_point);
    }
    return width;
}

std::string fitToWidth(const std::string& text, size_t width) {
    size_t current = displayWidth(text);
    if (current == width) {
        return text;
    }
    if (current < width) {
        return text + std::string(width - current, ' ');
    }

    // A wide glyph that would straddle the edge is replaced by a blank.
    std::string result;
    size_t taken = 0;
    for (const auto& code_point : splitCodePoints(text)) {
        size_t columns = codePointWidth(code_point);
        if (taken + columns > width) {
            break;
        }
        result += code_point;
        taken += columns;
    }
    return result + std::string(width - taken, ' ');
}

std::string formatTime(uint64_t seconds) {
    uint64_t hours = seconds / 3600;
    uint64_t minutes = seconds / 60 % 60;
    uint64_t secs = seconds % 60;

    if (hours == 0) {
        return fmt::format("{:02}:{:02}", minutes, secs);
    }
    return fmt::format("{:02}:{:02}:{:02}", hours, minutes, secs);
}

std::string formatEta(std::optional<double> seconds) {
    if (!seconds || !std::isfinite(*seconds) || *seconds < 0.0 || *seconds > MAX_DISPLAY_SECONDS) {
        return "?";
    }
    return formatTime(static_cast<uint64_t>(*seconds));
}

std::string formatRate(std::optional<double> rate) {
    if (!rate || !std::isfinite(*rate)) {
        return "?";
    }
    return fmt::format("{:.2f}", *rate);
}

}
}
