#include "nestbar/common/config.hpp"
#include "nestbar/common/constants.hpp"
#include "nestbar/common/paths.hpp"
#include "nestbar/common/logger.hpp"
#include <toml.hpp>
#include <filesystem>
#include <sstream>
#include <iomanip>
#include <unistd.h>

namespace nestbar {
namespace common {

namespace {

double findNumber(const toml::value& section, const std::string& key) {
    const auto& value = section.at(key);
    if (value.is_integer()) {
        return static_cast<double>(value.as_integer());
    }
    return value.as_floating();
}

std::string formatOptional(const std::optional<std::string>& value) {
    return value ? *value : "(not set)";
}

}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::display_defaults;

    GlobalConfig config;

    config.log_file = "";
    config.log_level = LogLevel::WARN;

    config.logging.rotation_size_mb = constants::limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    config.logging.max_files = constants::limits::DEFAULT_LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    config.display.update_interval = UPDATE_INTERVAL;
    config.display.fill_char = FILL_CHAR;
    config.display.ncols = std::nullopt;
    config.display.text_color = std::nullopt;
    config.display.bg_color = std::nullopt;
    config.display.rainbow = RAINBOW;
    config.display.counter = COUNTER;
    config.display.timer = TIMER;
    config.display.rate = RATE;
    config.display.avg_rate = AVG_RATE;
    config.display.leave = LEAVE;

    return config;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();

    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }

    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();
    current_config_path_.clear();

    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            Logger::instance().debug("[Config] No configuration file found, using defaults");
            return true;
        }
        effective_config_file = *best;
    }

    if (!tryLoadTomlFile(effective_config_file)) {
        global_ = createDefaultConfig();
        return false;
    }

    current_config_path_ = effective_config_file;
    return true;
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().warn("[Config] File not found | path={}", path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] File not readable | path={}", path);
        return false;
    }

    try {
        auto data = toml::parse(path);

        if (data.contains("global")) {
            const auto& global_section = data.at("global");

            if (global_section.contains("log_file")) {
                global_.log_file = toml::find<std::string>(global_section, "log_file");
            }
            if (global_section.contains("log_level")) {
                std::string level = toml::find<std::string>(global_section, "log_level");
                auto parsed = parseLogLevel(level);
                if (parsed) {
                    global_.log_level = *parsed;
                } else {
                    Logger::instance().warn("[Config] Unknown log level ignored | value={}", level);
                }
            }
        }

        if (data.contains("logging")) {
            const auto& logging_section = data.at("logging");

            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                if (format_str == "json") {
                    global_.logging.format = LogFormat::JSON;
                } else {
                    global_.logging.format = LogFormat::TEXT;
                }
            }
        }

        if (data.contains("display")) {
            const auto& display_section = data.at("display");
            auto& display = global_.display;

            if (display_section.contains("update_interval")) {
                display.update_interval = findNumber(display_section, "update_interval");
            }
            if (display_section.contains("fill_char")) {
                display.fill_char = toml::find<std::string>(display_section, "fill_char");
            }
            if (display_section.contains("ncols")) {
                display.ncols = toml::find<int>(display_section, "ncols");
            }
            if (display_section.contains("text_color")) {
                display.text_color = toml::find<std::string>(display_section, "text_color");
            }
            if (display_section.contains("bg_color")) {
                display.bg_color = toml::find<std::string>(display_section, "bg_color");
            }
            if (display_section.contains("rainbow")) {
                display.rainbow = toml::find<bool>(display_section, "rainbow");
            }
            if (display_section.contains("counter")) {
                display.counter = toml::find<bool>(display_section, "counter");
            }
            if (display_section.contains("timer")) {
                display.timer = toml::find<bool>(display_section, "timer");
            }
            if (display_section.contains("rate")) {
                display.rate = toml::find<bool>(display_section, "rate");
            }
            if (display_section.contains("avg_rate")) {
                display.avg_rate = toml::find<bool>(display_section, "avg_rate");
            }
            if (display_section.contains("leave")) {
                display.leave = toml::find<bool>(display_section, "leave");
            }
        }

        Logger::instance().info("[Config] Loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }
}

Options Config::displayDefaults() const {
    const auto& display = global_.display;

    Options options;
    options.update_interval = display.update_interval;
    options.fill_char = display.fill_char;
    options.ncols = display.ncols;
    options.text_color = display.text_color;
    options.bg_color = display.bg_color;
    options.rainbow = display.rainbow;
    options.fields.counter = display.counter;
    options.fields.timer = display.timer;
    options.fields.rate = display.rate;
    options.fields.avg_rate = display.avg_rate;
    options.leave = display.leave;
    return options;
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    const auto& display = global_.display;
    auto flag = [](bool value) { return std::string(value ? "true" : "false"); };

    if (key == "log_file") return global_.log_file.empty() ? "(not set)" : global_.log_file;
    if (key == "log_level") return to_string(global_.log_level);
    if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    if (key == "logging.format") return global_.logging.format == LogFormat::JSON ? "json" : "text";
    if (key == "display.update_interval") {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << display.update_interval;
        return oss.str();
    }
    if (key == "display.fill_char") return display.fill_char;
    if (key == "display.ncols") return display.ncols ? std::to_string(*display.ncols) : "(terminal)";
    if (key == "display.text_color") return formatOptional(display.text_color);
    if (key == "display.bg_color") return formatOptional(display.bg_color);
    if (key == "display.rainbow") return flag(display.rainbow);
    if (key == "display.counter") return flag(display.counter);
    if (key == "display.timer") return flag(display.timer);
    if (key == "display.rate") return flag(display.rate);
    if (key == "display.avg_rate") return flag(display.avg_rate);
    if (key == "display.leave") return flag(display.leave);

    return std::nullopt;
}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
        default: return "UNKNOWN";
    }
}

std::optional<LogLevel> parseLogLevel(const std::string& value) {
    if (value == "DEBUG" || value == "debug") return LogLevel::DEBUG;
    if (value == "INFO" || value == "info") return LogLevel::INFO;
    if (value == "WARN" || value == "warn") return LogLevel::WARN;
    if (value == "ERROR" || value == "error") return LogLevel::ERROR;
    return std::nullopt;
}

}}
