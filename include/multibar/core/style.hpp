#pragma once

#include <string>
#include <variant>
#include <vector>

namespace multibar {
namespace core {

enum class StylePreset {
    ASCII,
    BLOCK,
    BALLOON
};

// Bar fill pattern: one of the predefined glyph sets or a caller-supplied
// glyph sequence. Glyphs run from emptiest (front) to full (back); everything
// except the full glyph is available as a partial-cell glyph. Cells past the
// partial one are filled with padding(): a blank for the predefined sets,
// the front glyph for custom ones.
class Style {
public:
    Style() : value_(StylePreset::BLOCK) {}
    Style(StylePreset preset) : value_(preset) {}

    static Style ascii() { return Style(StylePreset::ASCII); }
    static Style block() { return Style(StylePreset::BLOCK); }
    static Style balloon() { return Style(StylePreset::BALLOON); }

    // Throws ConfigurationError(STYLE_TOO_FEW_GLYPHS) for fewer than two glyphs.
    static Style custom(std::vector<std::string> glyphs);

    // Accepts "ascii", "block", "balloon" and "custom:<glyphs>".
    // Throws ConfigurationError(STYLE_UNKNOWN) for anything else.
    static Style fromName(const std::string& name);

    bool isCustom() const { return std::holds_alternative<std::vector<std::string>>(value_); }
    std::string name() const;

    // Flat glyph list, emptiest glyph first and full glyph last.
    std::vector<std::string> glyphs() const;
    std::string padding() const;

    bool operator==(const Style& other) const { return value_ == other.value_; }
    bool operator!=(const Style& other) const { return !(*this == other); }

private:
    std::variant<StylePreset, std::vector<std::string>> value_;
};

}}
