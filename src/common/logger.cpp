#include "nestbar/common/logger.hpp"
#include "nestbar/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>

namespace nestbar {
namespace common {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

namespace {

spdlog::sink_ptr makeStderrSink(spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    sink->set_level(level);
    return sink;
}

// Null when the directory or file cannot be opened; the caller falls back to stderr.
spdlog::sink_ptr makeRotatingSink(const std::string& path, spdlog::level::level_enum level,
                                  const LoggingConfig& logging_config) {
    std::filesystem::path log_dir = std::filesystem::path(path).parent_path();

    std::error_code ec;
    if (!log_dir.empty()) {
        std::filesystem::create_directories(log_dir, ec);
    }
    if (ec) {
        std::cerr << "[Logger] Cannot create log directory | path=" << log_dir
                  << " | error=" << ec.message() << std::endl;
        return nullptr;
    }

    try {
        auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path, logging_config.rotation_size_mb * 1024 * 1024, logging_config.max_files);
        sink->set_level(level);
        return sink;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Cannot open log file | path=" << path
                  << " | error=" << ex.what() << std::endl;
        return nullptr;
    }
}

const char* patternFor(LogFormat format) {
    if (format == LogFormat::JSON) {
        return R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","logger":"%n","message":"%v"})";
    }
    return "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
}

}

void Logger::initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config) {
    if (initialized_) {
        if (logger_) {
            logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        }
        return;
    }

    auto spdlog_level = toSpdlogLevel(level);
    spdlog::sink_ptr sink;
    current_format_ = LogFormat::TEXT;

    if (mode == LogMode::FILE_ONLY && !log_file.empty()) {
        sink = makeRotatingSink(getLogFileWithSuffix(logging_config.format, log_file),
                                spdlog_level, logging_config);
        if (sink) {
            current_format_ = logging_config.format;
        } else {
            std::cerr << "[Logger] Falling back to console output" << std::endl;
        }
    }
    if (!sink) {
        sink = makeStderrSink(spdlog_level);
    }

    spdlog::drop(constants::system::LOGGER_NAME);
    logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, sink);
    logger_->set_pattern(patternFor(current_format_));
    logger_->set_level(spdlog_level);

    if (mode == LogMode::FILE_ONLY) {
        logger_->flush_on(spdlog::level::warn);
    }

    spdlog::register_logger(logger_);
    initialized_ = true;
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }
    initialized_ = false;
    current_format_ = LogFormat::TEXT;
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
        default: return spdlog::level::info;
    }
}

std::string Logger::getLogFileWithSuffix(LogFormat format, const std::string& base_path) const {
    if (format == LogFormat::JSON) {
        std::filesystem::path p(base_path);
        std::string stem = p.stem().string();
        std::string ext = p.extension().string();
        std::string parent = p.parent_path().string();

        if (parent.empty()) {
            return stem + ".json" + ext;
        } else {
            return parent + "/" + stem + ".json" + ext;
        }
    }
    return base_path;
}

}}
