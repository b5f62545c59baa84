#pragma once

#include <string>
#include <optional>
#include <array>
#include <cstddef>

namespace nestbar {
namespace style {

enum class Color {
    BLACK = 0,
    RED = 1,
    GREEN = 2,
    YELLOW = 3,
    BLUE = 4,
    MAGENTA = 5,
    CYAN = 6,
    WHITE = 7
};

constexpr std::array<Color, 6> RAINBOW_SEQUENCE = {
    Color::RED, Color::YELLOW, Color::GREEN, Color::CYAN, Color::BLUE, Color::MAGENTA
};

struct Style {
    std::optional<Color> text_color;
    std::optional<Color> bg_color;
    bool rainbow = false;
};

struct StyleFragments {
    std::string prefix;
    std::string suffix;
};

std::optional<Color> parseColor(const std::string& name);
bool isValidColor(const std::string& name);
std::string to_string(Color color);

std::string foregroundCode(Color color);
std::string backgroundCode(Color color);

// Throws common::InvalidConfig for names outside the supported set.
Style makeStyle(const std::optional<std::string>& text_color,
                const std::optional<std::string>& bg_color,
                bool rainbow);

// Prefix/suffix pair for a whole-line style. Rainbow is per glyph and is not
// representable here; only its background part is returned.
StyleFragments fragments(const Style& style);

// Wraps plain text. With rainbow on, glyph i gets
// RAINBOW_SEQUENCE[(i + phase) % 6], which animates as the phase advances.
std::string applyStyle(const std::string& text, const Style& style, size_t phase = 0);

bool isPlain(const Style& style);

}
}
