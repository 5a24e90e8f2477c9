#include "multibar/core/style.hpp"
#include "multibar/core/error_codes.hpp"
#include "multibar/common/constants.hpp"
#include "multibar/format/format_utils.hpp"

namespace multibar {
namespace core {

namespace {

const std::vector<std::string>& presetGlyphs(StylePreset preset) {
    static const std::vector<std::string> ascii = {
        "0", "1", "2", "3", "4", "5", "6", "7", "8", "9", "#"
    };
    static const std::vector<std::string> block = {
        " ", "▏", "▎", "▍", "▌", "▋", "▊", "▉", "█"
    };
    static const std::vector<std::string> balloon = {
        ".", "o", "O", "@", "*"
    };

    switch (preset) {
        case StylePreset::ASCII: return ascii;
        case StylePreset::BALLOON: return balloon;
        case StylePreset::BLOCK: return block;
    }
    return block;
}

}

Style Style::custom(std::vector<std::string> glyphs) {
    if (glyphs.size() < 2) {
        throw ConfigurationError(ProgressErrorCode::STYLE_TOO_FEW_GLYPHS,
                                 {"Style", {{"glyphs", std::to_string(glyphs.size())}}});
    }

    // Control characters expand to "<XX>" here and fail the one-column check.
    for (const auto& glyph : glyphs) {
        std::string printable = format::sanitizeControlCharacters(glyph);
        if (format::displayWidth(printable) != 1) {
            throw ConfigurationError(ProgressErrorCode::STYLE_UNKNOWN,
                                     {"Style", {{"glyph", printable},
                                                {"reason", "glyph must be one printable code point"}}});
        }
    }

    Style style;
    style.value_ = std::move(glyphs);
    return style;
}

Style Style::fromName(const std::string& name) {
    if (name == "ascii") return ascii();
    if (name == "block") return block();
    if (name == "balloon") return balloon();

    const std::string prefix = constants::styles::CUSTOM_PREFIX;
    if (name.compare(0, prefix.size(), prefix) == 0) {
        return custom(format::splitCodePoints(name.substr(prefix.size())));
    }

    throw ConfigurationError(ProgressErrorCode::STYLE_UNKNOWN,
                             {"Style", {{"name", format::sanitizeControlCharacters(name)}}});
}

std::string Style::name() const {
    if (const auto* preset = std::get_if<StylePreset>(&value_)) {
        switch (*preset) {
            case StylePreset::ASCII: return "ascii";
            case StylePreset::BLOCK: return "block";
            case StylePreset::BALLOON: return "balloon";
        }
    }

    std::string name = constants::styles::CUSTOM_PREFIX;
    for (const auto& glyph : std::get<std::vector<std::string>>(value_)) {
        name += glyph;
    }
    return name;
}

std::vector<std::string> Style::glyphs() const {
    if (const auto* preset = std::get_if<StylePreset>(&value_)) {
        return presetGlyphs(*preset);
    }
    return std::get<std::vector<std::string>>(value_);
}

std::string Style::padding() const {
    if (isCustom()) {
        return std::get<std::vector<std::string>>(value_).front();
    }
    return " ";
}

}}
