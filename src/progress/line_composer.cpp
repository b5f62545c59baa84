#include "nestbar/progress/line_composer.hpp"
#include "nestbar/common/constants.hpp"
#include "nestbar/format/format_utils.hpp"
#include <vector>
#include <algorithm>

namespace nestbar {
namespace progress {

namespace {

enum class FieldKind {
    COUNTER,
    TIMER,
    RATE,
    AVG_RATE
};

struct Field {
    FieldKind kind;
    std::string text;
};

constexpr FieldKind DROP_ORDER[] = {
    FieldKind::AVG_RATE, FieldKind::RATE, FieldKind::TIMER, FieldKind::COUNTER
};

// Widest percentage, "100%". The bar never shrinks below it so the suffix
// fields do not jump as the percentage grows.
constexpr size_t PERCENT_WIDTH = 4;
constexpr size_t BAR_DECORATION_WIDTH = 2;

double completedFraction(size_t count, size_t total) {
    if (total == 0 || count >= total) {
        return 1.0;
    }
    return static_cast<double>(count) / static_cast<double>(total);
}

size_t requiredWidth(const std::string& prefix, bool has_bar, const std::vector<Field>& fields) {
    size_t width = 0;
    size_t parts = 0;

    if (!prefix.empty()) {
        width += format::displayWidth(prefix);
        ++parts;
    }
    if (has_bar) {
        width += PERCENT_WIDTH;
        ++parts;
    }
    for (const auto& field : fields) {
        width += format::displayWidth(field.text);
        ++parts;
    }

    return parts > 1 ? width + parts - 1 : width;
}

bool dropLowestPriority(std::vector<Field>& fields) {
    for (FieldKind kind : DROP_ORDER) {
        auto it = std::find_if(fields.begin(), fields.end(),
            [kind](const Field& field) { return field.kind == kind; });
        if (it != fields.end()) {
            fields.erase(it);
            return true;
        }
    }
    return false;
}

}

std::string formatDescription(const std::string& desc) {
    if (desc.empty()) {
        return "";
    }
    return format::sanitizeControlCharacters(desc) + ":";
}

std::string formatCounter(size_t count, std::optional<size_t> total) {
    if (!total) {
        return std::to_string(count) + "it";
    }
    return std::to_string(count) + "/" + std::to_string(*total);
}

std::string formatTimer(const RateSnapshot& snapshot) {
    std::string remaining = snapshot.eta
        ? format::formatTime(*snapshot.eta)
        : constants::display_defaults::UNKNOWN_PLACEHOLDER;
    return format::formatTime(snapshot.elapsed) + "<" + remaining;
}

std::string formatRateField(const std::optional<double>& rate) {
    // A zero rate prints as unknown too.
    if (!rate || !(*rate > 0.0)) {
        return constants::display_defaults::UNKNOWN_PLACEHOLDER;
    }
    return format::rightJustify(format::formatRate(*rate), constants::limits::RATE_FIELD_WIDTH);
}

std::string formatPercent(size_t count, size_t total) {
    auto percent = static_cast<int>(completedFraction(count, total) * 100.0);
    return format::rightJustify(std::to_string(std::min(percent, 100)) + "%", PERCENT_WIDTH);
}

std::string renderBar(size_t count, size_t total, const std::string& fill_char, size_t space) {
    std::string percent = formatPercent(count, total);
    size_t percent_width = format::displayWidth(percent);

    if (space < percent_width) {
        return "";
    }
    if (space < percent_width + BAR_DECORATION_WIDTH + 1) {
        return format::padToWidth(percent, space);
    }

    size_t cells = space - percent_width - BAR_DECORATION_WIDTH;
    auto filled = static_cast<size_t>(completedFraction(count, total) * static_cast<double>(cells));
    filled = std::min(filled, cells);

    return percent + "|" + format::repeatGlyph(fill_char, filled) +
           std::string(cells - filled, ' ') + "|";
}

ComposedLine compose(const ComposeRequest& request) {
    const size_t width = request.width;

    std::string prefix = formatDescription(request.desc);
    bool has_bar = request.total.has_value();

    std::vector<Field> fields;
    if (request.fields.counter) {
        fields.push_back({FieldKind::COUNTER, formatCounter(request.count, request.total)});
    }
    if (request.fields.timer) {
        fields.push_back({FieldKind::TIMER, formatTimer(request.snapshot)});
    }
    if (request.fields.rate) {
        fields.push_back({FieldKind::RATE, formatRateField(request.snapshot.rate_instant)});
    }
    if (request.fields.avg_rate) {
        fields.push_back({FieldKind::AVG_RATE, formatRateField(request.snapshot.rate_avg)});
    }

    while (requiredWidth(prefix, has_bar, fields) > width && dropLowestPriority(fields)) {
    }
    if (has_bar && requiredWidth(prefix, has_bar, fields) > width) {
        has_bar = false;
    }
    if (requiredWidth(prefix, has_bar, fields) > width) {
        prefix = format::truncateToWidth(prefix, width);
    }

    std::vector<std::string> parts;
    if (!prefix.empty()) {
        parts.push_back(prefix);
    }
    if (has_bar) {
        size_t others = requiredWidth(prefix, false, fields);
        size_t separator = (others > 0) ? 1 : 0;
        size_t space = width - others - separator;
        parts.push_back(renderBar(request.count, *request.total, request.fill_char, space));
    }
    for (const auto& field : fields) {
        parts.push_back(field.text);
    }

    std::string line;
    for (const auto& part : parts) {
        if (part.empty()) continue;
        if (!line.empty()) line += " ";
        line += part;
    }

    ComposedLine result;
    result.plain = format::padToWidth(line, width);
    result.styled = style::applyStyle(result.plain, request.style, request.phase);
    return result;
}

}
}
