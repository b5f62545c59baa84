#pragma once

#include <string>
#include <array>
#include <algorithm>
#include <cstddef>

namespace nestbar {
namespace constants {

namespace version {
    constexpr const char* LIBRARY_VERSION = "1.0.0";

    inline std::string getFullVersion() {
        return std::string("nestbar v") + LIBRARY_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "nestbar";
    constexpr const char* LOGGER_NAME = "nestbar";
    constexpr const char* CONFIG_ENV = "NESTBAR_CONFIG";
    constexpr const char* CONFIG_FILE_NAME = "config.toml";
}

namespace colors {
    constexpr std::array<const char*, 8> SUPPORTED = {
        "black", "red", "green", "yellow", "blue", "magenta", "cyan", "white"
    };

    inline bool isSupported(const std::string& name) {
        return std::find(SUPPORTED.begin(), SUPPORTED.end(), name) != SUPPORTED.end();
    }

    inline std::string supportedList() {
        std::string result;
        for (const char* name : SUPPORTED) {
            if (!result.empty()) result += ", ";
            result += name;
        }
        return result;
    }
}

namespace ansi {
    constexpr const char* ESC = "\033[";
    constexpr const char* RESET = "\033[0m";
    constexpr const char* ERASE_LINE = "\033[K";
    constexpr const char* CARRIAGE_RETURN = "\r";
    constexpr const char* HIDE_CURSOR = "\033[?25l";
    constexpr const char* SHOW_CURSOR = "\033[?25h";

    constexpr int FOREGROUND_BASE = 30;
    constexpr int BACKGROUND_BASE = 40;

    inline std::string cursorUp(size_t lines) {
        return lines == 0 ? std::string() : ESC + std::to_string(lines) + "A";
    }

    inline std::string cursorDown(size_t lines) {
        return lines == 0 ? std::string() : ESC + std::to_string(lines) + "B";
    }
}

namespace limits {
    constexpr int DEFAULT_TERMINAL_COLUMNS = 80;
    constexpr double DEFAULT_UPDATE_INTERVAL_SECONDS = 0.05;
    constexpr int RATE_FIELD_WIDTH = 9;

    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace display_defaults {
    constexpr const char* FILL_CHAR = "\xE2\x96\x88";
    constexpr double UPDATE_INTERVAL = limits::DEFAULT_UPDATE_INTERVAL_SECONDS;
    constexpr bool RAINBOW = false;
    constexpr bool COUNTER = true;
    constexpr bool TIMER = true;
    constexpr bool RATE = true;
    constexpr bool AVG_RATE = false;
    constexpr bool LEAVE = true;

    constexpr const char* UNKNOWN_PLACEHOLDER = "?";
}

}
}
