#include "nestbar/format/format_utils.hpp"
#include <sstream>
#include <iomanip>
#include <cmath>

namespace nestbar {
namespace format {

namespace {

size_t utf8SequenceLength(unsigned char lead) {
    if ((lead & 0x80) == 0) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

bool isValidSequence(const std::string& text, size_t pos, size_t length) {
    if (length == 0 || pos + length > text.length()) {
        return false;
    }
    for (size_t j = 1; j < length; ++j) {
        if ((static_cast<unsigned char>(text[pos + j]) & 0xC0) != 0x80) {
            return false;
        }
    }
    return true;
}

}

std::string sanitizeControlCharacters(const std::string& text) {
    std::ostringstream result;

    for (size_t i = 0; i < text.length(); ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        if (isControlCharacter(c)) {
            result << getControlCharReplacement(c);
        } else if ((c & 0x80) != 0) {
            size_t utf8_len = utf8SequenceLength(c);

            if (utf8_len > 1 && isValidSequence(text, i, utf8_len)) {
                result << text.substr(i, utf8_len);
                i += utf8_len - 1;
            } else {
                result << "\uFFFD";
            }
        } else {
            result << c;
        }
    }

    return result.str();
}

// Unlike a report formatter, a single-line display cannot keep tab, LF or CR.
bool isControlCharacter(unsigned char c) {
    return c < 0x20 || c == 0x7F;
}

std::string getControlCharReplacement(unsigned char c) {
    std::ostringstream oss;
    oss << "<" << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
        << static_cast<int>(c) << ">";
    return oss.str();
}

std::vector<std::string> splitGlyphs(const std::string& text) {
    std::vector<std::string> glyphs;
    glyphs.reserve(text.length());

    size_t i = 0;
    while (i < text.length()) {
        size_t length = utf8SequenceLength(static_cast<unsigned char>(text[i]));
        if (!isValidSequence(text, i, length)) {
            length = 1;
        }
        glyphs.push_back(text.substr(i, length));
        i += length;
    }

    return glyphs;
}

size_t displayWidth(const std::string& text) {
    size_t width = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

std::string truncateToWidth(const std::string& text, size_t width) {
    if (displayWidth(text) <= width) {
        return text;
    }

    std::string result;
    size_t used = 0;
    for (const auto& glyph : splitGlyphs(text)) {
        if (used == width) break;
        result += glyph;
        ++used;
    }
    return result;
}

std::string padToWidth(const std::string& text, size_t width) {
    size_t current = displayWidth(text);
    if (current >= width) {
        return truncateToWidth(text, width);
    }
    return text + std::string(width - current, ' ');
}

std::string repeatGlyph(const std::string& glyph, size_t count) {
    std::string result;
    result.reserve(glyph.size() * count);
    for (size_t i = 0; i < count; ++i) {
        result += glyph;
    }
    return result;
}

std::string formatTime(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0) {
        seconds = 0;
    }

    long long total = std::llround(seconds);
    long long minutes = total / 60;
    long long secs = total % 60;
    long long hours = minutes / 60;
    long long mins = minutes % 60;

    std::ostringstream oss;
    oss << std::setfill('0');
    if (hours > 0) {
        oss << hours << ":" << std::setw(2) << mins << ":" << std::setw(2) << secs;
    } else {
        oss << std::setw(2) << minutes << ":" << std::setw(2) << secs;
    }
    return oss.str();
}

std::string formatRate(double iterations_per_second) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (iterations_per_second >= 1.0) {
        oss << iterations_per_second << "it/s";
    } else {
        oss << (1.0 / iterations_per_second) << "s/it";
    }
    return oss.str();
}

std::string rightJustify(const std::string& text, size_t width) {
    size_t current = displayWidth(text);
    if (current >= width) {
        return text;
    }
    return std::string(width - current, ' ') + text;
}

}
}
