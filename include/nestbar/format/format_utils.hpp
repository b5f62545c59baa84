#pragma once

#include <string>
#include <vector>
#include <cstddef>

namespace nestbar {
namespace format {

// Replaces control bytes with a visible "<0A>" form and invalid UTF-8 with U+FFFD.
std::string sanitizeControlCharacters(const std::string& text);

bool isControlCharacter(unsigned char c);

std::string getControlCharReplacement(unsigned char c);

// Splits valid UTF-8 into one string per codepoint.
std::vector<std::string> splitGlyphs(const std::string& text);

// Number of terminal columns, counting one per codepoint.
size_t displayWidth(const std::string& text);

std::string truncateToWidth(const std::string& text, size_t width);

std::string padToWidth(const std::string& text, size_t width);

std::string repeatGlyph(const std::string& glyph, size_t count);

// MM:SS below one hour, H:MM:SS above.
std::string formatTime(double seconds);

// "12.34it/s" when at least one iteration per second, "1.50s/it" otherwise.
std::string formatRate(double iterations_per_second);

std::string rightJustify(const std::string& text, size_t width);

}
}
