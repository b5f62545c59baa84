#pragma once

#include "constants.hpp"
#include <string>
#include <optional>
#include <cstddef>

namespace nestbar {
namespace common {

enum class IndicatorState {
    CREATED,
    ACTIVE,
    FINISHED,
    ABORTED
};

struct FieldFlags {
    bool counter = constants::display_defaults::COUNTER;
    bool timer = constants::display_defaults::TIMER;
    bool rate = constants::display_defaults::RATE;
    bool avg_rate = constants::display_defaults::AVG_RATE;
};

struct Options {
    // Used only when the wrapped range cannot report its own size.
    std::optional<size_t> length;
    std::string desc;
    std::string fill_char = constants::display_defaults::FILL_CHAR;
    double update_interval = constants::display_defaults::UPDATE_INTERVAL;
    bool disable = false;
    // Empty means "fill the terminal".
    std::optional<int> ncols;
    std::optional<std::string> text_color;
    std::optional<std::string> bg_color;
    bool rainbow = constants::display_defaults::RAINBOW;
    FieldFlags fields;
    // Keep the outermost indicator's final line on screen when it finishes.
    bool leave = constants::display_defaults::LEAVE;
};

std::string to_string(IndicatorState state);

}}
