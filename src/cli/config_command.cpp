#include "config_command.hpp"
#include "nestbar/common/config.hpp"
#include "nestbar/common/logger.hpp"
#include "nestbar/config/validator.hpp"
#include <iostream>
#include <iomanip>

namespace nestbar {
namespace cli {

namespace {

const char* const DISPLAYED_KEYS[] = {
    "log_file",
    "log_level",
    "logging.rotation_size_mb",
    "logging.max_files",
    "logging.format",
    "display.update_interval",
    "display.fill_char",
    "display.ncols",
    "display.text_color",
    "display.bg_color",
    "display.rainbow",
    "display.counter",
    "display.timer",
    "display.rate",
    "display.avg_rate",
    "display.leave",
};

}

ConfigCommand::ConfigCommand() = default;

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    show_cmd_ = subcommand->add_subcommand("show", "Show effective configuration");
    show_cmd_->callback([this]() { was_called_ = true; });

    validate_cmd_ = subcommand->add_subcommand("validate", "Validate configuration");
    validate_cmd_->add_option("file", validate_path_, "Configuration file (default: loaded file)");
    validate_cmd_->callback([this]() { was_called_ = true; });
}

int ConfigCommand::execute() {
    if (show_cmd_->parsed()) {
        return executeShow();
    } else if (validate_cmd_->parsed()) {
        return executeValidate();
    }

    std::cout << subcommand_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeShow() {
    auto& config = common::Config::instance();
    const std::string& config_path = config.currentConfigPath();

    std::cout << "Configuration file: "
              << (config_path.empty() ? "(none, using defaults)" : config_path) << "\n\n";

    for (const char* key : DISPLAYED_KEYS) {
        auto value = config.getValue(key);
        std::cout << "  " << std::left << std::setw(26) << key << " = "
                  << (value ? *value : "(unknown)") << "\n";
    }

    return 0;
}

int ConfigCommand::executeValidate() {
    auto& config = common::Config::instance();
    config::ConfigValidator validator;

    std::string path = validate_path_.empty() ? config.currentConfigPath() : validate_path_;

    config::ValidationResult result;
    if (path.empty()) {
        std::cout << "Validating: built-in defaults\n\n";
        result = validator.validate(config.global());
    } else {
        std::cout << "Validating: " << path << "\n\n";
        result = validator.validateFile(path);
    }

    for (const auto& error : result.errors) {
        std::cout << "  ERROR: " << error << "\n";
    }

    for (const auto& warning : result.warnings) {
        std::cout << "  WARNING: " << warning << "\n";
    }

    std::cout << "\nErrors: " << result.errors.size()
              << "  Warnings: " << result.warnings.size() << "\n";

    if (result.is_valid) {
        std::cout << "\nConfiguration is valid.\n";
        return 0;
    }

    std::cout << "\nConfiguration has errors.\n";
    return 1;
}

}}
