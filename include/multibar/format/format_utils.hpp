#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace multibar {
namespace format {

// Control characters would move the cursor out from under the renderer,
// so they are replaced with a visible "<XX>" marker.
std::string sanitizeControlCharacters(const std::string& text);

bool isControlCharacter(unsigned char c);

std::string getControlCharReplacement(unsigned char c);

// Splits UTF-8 text into code points. Malformed sequences become U+FFFD.
std::vector<std::string> splitCodePoints(const std::string& text);

// Columns a single code point occupies: 2 for East Asian wide and emoji
// code points, otherwise 1. Locale independent, unlike wcwidth.
size_t codePointWidth(const std::string& code_point);

// Terminal columns taken by text.
size_t displayWidth(const std::string& text);

// Cuts or space-pads text to exactly `width` columns.
std::string fitToWidth(const std::string& text, size_t width);

// MM:SS below one hour, HH:MM:SS from then on.
std::string formatTime(uint64_t seconds);

// Seconds rendered through formatTime, or "?" when unknown or not finite.
std::string formatEta(std::optional<double> seconds);

// Two decimals, or "?" when unknown.
std::string formatRate(std::optional<double> rate);

}
}
