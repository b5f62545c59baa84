#include "nestbar/style/styling.hpp"
#include "nestbar/common/constants.hpp"
#include "nestbar/common/error_codes.hpp"
#include "nestbar/format/format_utils.hpp"

namespace nestbar {
namespace style {

namespace {

Color resolveColor(const std::optional<std::string>& name, const char* option) {
    auto color = parseColor(*name);
    if (!color) {
        common::ErrorContext ctx;
        ctx.component = "Style";
        ctx.details["option"] = option;
        ctx.details["value"] = *name;
        ctx.details["supported"] = constants::colors::supportedList();
        throw common::InvalidConfig(common::ErrorCode::CONFIG_INVALID_COLOR, "", ctx);
    }
    return *color;
}

}

std::optional<Color> parseColor(const std::string& name) {
    for (size_t i = 0; i < constants::colors::SUPPORTED.size(); ++i) {
        if (name == constants::colors::SUPPORTED[i]) {
            return static_cast<Color>(i);
        }
    }
    return std::nullopt;
}

bool isValidColor(const std::string& name) {
    return parseColor(name).has_value();
}

std::string to_string(Color color) {
    auto index = static_cast<size_t>(color);
    if (index < constants::colors::SUPPORTED.size()) {
        return constants::colors::SUPPORTED[index];
    }
    return "unknown";
}

std::string foregroundCode(Color color) {
    return constants::ansi::ESC +
           std::to_string(constants::ansi::FOREGROUND_BASE + static_cast<int>(color)) + "m";
}

std::string backgroundCode(Color color) {
    return constants::ansi::ESC +
           std::to_string(constants::ansi::BACKGROUND_BASE + static_cast<int>(color)) + "m";
}

Style makeStyle(const std::optional<std::string>& text_color,
                const std::optional<std::string>& bg_color,
                bool rainbow) {
    Style style;
    if (text_color) {
        style.text_color = resolveColor(text_color, "text_color");
    }
    if (bg_color) {
        style.bg_color = resolveColor(bg_color, "bg_color");
    }
    style.rainbow = rainbow;
    return style;
}

StyleFragments fragments(const Style& style) {
    StyleFragments result;

    if (style.bg_color) {
        result.prefix += backgroundCode(*style.bg_color);
    }
    if (style.text_color && !style.rainbow) {
        result.prefix += foregroundCode(*style.text_color);
    }
    if (!result.prefix.empty()) {
        result.suffix = constants::ansi::RESET;
    }

    return result;
}

bool isPlain(const Style& style) {
    return !style.rainbow && !style.text_color && !style.bg_color;
}

std::string applyStyle(const std::string& text, const Style& style, size_t phase) {
    if (isPlain(style)) {
        return text;
    }

    auto wrap = fragments(style);

    if (!style.rainbow) {
        return wrap.prefix + text + wrap.suffix;
    }

    std::string body;
    size_t index = 0;
    for (const auto& glyph : format::splitGlyphs(text)) {
        Color color = RAINBOW_SEQUENCE[(index + phase) % RAINBOW_SEQUENCE.size()];
        body += foregroundCode(color);
        body += glyph;
        ++index;
    }

    return wrap.prefix + body + constants::ansi::RESET;
}

}
}
