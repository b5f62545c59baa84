#pragma once

#include "nestbar/common/types.hpp"
#include "nestbar/progress/rate_tracker.hpp"
#include "nestbar/style/styling.hpp"
#include <string>
#include <optional>
#include <cstddef>

namespace nestbar {
namespace progress {

struct ComposeRequest {
    size_t count = 0;
    std::optional<size_t> total;
    std::string desc;
    style::Style style;
    std::string fill_char = constants::display_defaults::FILL_CHAR;
    size_t width = constants::limits::DEFAULT_TERMINAL_COLUMNS;
    common::FieldFlags fields;
    RateSnapshot snapshot;
    size_t phase = 0;
};

struct ComposedLine {
    // Exactly `width` columns, no escape sequences.
    std::string plain;
    // `plain` wrapped in the style's escape sequences.
    std::string styled;
};

// Fields are dropped whole, lowest priority first, until the line fits:
// avg_rate, rate, timer, counter, bar. The description is cut only when it
// alone is wider than the line.
ComposedLine compose(const ComposeRequest& request);

std::string formatDescription(const std::string& desc);
std::string formatCounter(size_t count, std::optional<size_t> total);
std::string formatTimer(const RateSnapshot& snapshot);
std::string formatRateField(const std::optional<double>& rate);
std::string formatPercent(size_t count, size_t total);

// "NN%|███   |" in exactly `space` columns, the bare percentage when the bar
// cells do not fit, or empty when not even that fits.
std::string renderBar(size_t count, size_t total, const std::string& fill_char, size_t space);

}
}
