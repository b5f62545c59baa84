#pragma once

#include "types.hpp"
#include <string>
#include <optional>
#include <cstdint>

namespace nestbar {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct DisplayConfig {
    double update_interval;
    std::string fill_char;
    std::optional<int> ncols;
    std::optional<std::string> text_color;
    std::optional<std::string> bg_color;
    bool rainbow;
    bool counter;
    bool timer;
    bool rate;
    bool avg_rate;
    bool leave;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    LoggingConfig logging;
    DisplayConfig display;
};

class Config {
public:
    static Config& instance();

    bool load(const std::string& config_file = "");
    void reset();

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    // Options pre-filled from the [display] section.
    Options displayDefaults() const;

    std::optional<std::string> getValue(const std::string& key) const;
    std::optional<std::string> findBestConfig() const;
    const std::string& currentConfigPath() const { return current_config_path_; }

    static GlobalConfig createDefaultConfig();

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    bool tryLoadTomlFile(const std::string& path);
};

std::string to_string(LogLevel level);
std::optional<LogLevel> parseLogLevel(const std::string& value);

}}
