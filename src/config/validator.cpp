#include "nestbar/config/validator.hpp"
#include "nestbar/common/constants.hpp"
#include "nestbar/common/logger.hpp"
#include "nestbar/format/format_utils.hpp"
#include <filesystem>
#include <cmath>

namespace nestbar {
namespace config {

namespace {

void appendDisplayChecks(ValidationResult& result, const common::Options& options, const std::string& prefix) {
    if (!OptionsValidator::validateColor(options.text_color)) {
        result.addError(common::ErrorCode::CONFIG_INVALID_COLOR,
            prefix + "text_color: Must be one of " + constants::colors::supportedList() +
            " (got '" + *options.text_color + "')");
    }

    if (!OptionsValidator::validateColor(options.bg_color)) {
        result.addError(common::ErrorCode::CONFIG_INVALID_COLOR,
            prefix + "bg_color: Must be one of " + constants::colors::supportedList() +
            " (got '" + *options.bg_color + "')");
    }

    if (!OptionsValidator::validateUpdateInterval(options.update_interval)) {
        result.addError(common::ErrorCode::CONFIG_INVALID_UPDATE_INTERVAL,
            prefix + "update_interval: Must be a finite number >= 0");
    }

    if (!OptionsValidator::validateFillChar(options.fill_char)) {
        result.addError(common::ErrorCode::CONFIG_INVALID_FILL_CHAR,
            prefix + "fill_char: Must be exactly one printable character");
    }

    if (!OptionsValidator::validateWidth(options.ncols)) {
        result.addError(common::ErrorCode::CONFIG_INVALID_WIDTH,
            prefix + "ncols: Must be >= 1");
    }

    if (options.update_interval == 0.0) {
        result.warnings.push_back(prefix + "update_interval: 0 redraws on every iteration");
    }

    if (options.rainbow && options.text_color) {
        result.warnings.push_back(prefix + "text_color: Ignored while rainbow is enabled");
    }
}

}

ValidationResult OptionsValidator::validate(const common::Options& options) const {
    ValidationResult result;
    appendDisplayChecks(result, options, "");
    return result;
}

void OptionsValidator::enforce(const common::Options& options) const {
    auto result = validate(options);
    if (result.is_valid) {
        return;
    }

    common::ErrorContext ctx;
    ctx.component = "Options";
    if (result.errors.size() > 1) {
        ctx.details["additional_errors"] = std::to_string(result.errors.size() - 1);
    }

    common::Logger::instance().debug("[Validator] Options rejected | errors={}", result.errors.size());
    throw common::InvalidConfig(result.codes.front(), result.errors.front(), ctx);
}

bool OptionsValidator::validateColor(const std::optional<std::string>& color) {
    return !color || constants::colors::isSupported(*color);
}

bool OptionsValidator::validateFillChar(const std::string& fill_char) {
    if (fill_char.empty() || format::displayWidth(fill_char) != 1) {
        return false;
    }
    return format::sanitizeControlCharacters(fill_char) == fill_char;
}

bool OptionsValidator::validateUpdateInterval(double seconds) {
    return std::isfinite(seconds) && seconds >= 0.0;
}

bool OptionsValidator::validateWidth(const std::optional<int>& ncols) {
    return !ncols || *ncols >= 1;
}

ValidationResult ConfigValidator::validate(const common::GlobalConfig& config) {
    ValidationResult result;

    common::Logger::instance().debug("[Validator] Starting validation");

    common::Options display;
    display.update_interval = config.display.update_interval;
    display.fill_char = config.display.fill_char;
    display.ncols = config.display.ncols;
    display.text_color = config.display.text_color;
    display.bg_color = config.display.bg_color;
    display.rainbow = config.display.rainbow;
    appendDisplayChecks(result, display, "display.");

    if (config.logging.rotation_size_mb < 1) {
        result.addError(common::ErrorCode::CONFIG_PARSE_FAILED, "logging.rotation_size_mb: Must be >= 1");
    }

    if (config.logging.max_files < 1) {
        result.addError(common::ErrorCode::CONFIG_PARSE_FAILED, "logging.max_files: Must be >= 1");
    }

    if (!config.log_file.empty()) {
        std::filesystem::path parent = std::filesystem::path(config.log_file).parent_path();
        std::error_code ec;
        if (!parent.empty() && std::filesystem::exists(parent, ec) &&
            !std::filesystem::is_directory(parent, ec)) {
            result.addError(common::ErrorCode::CONFIG_PARSE_FAILED,
                "log_file: Parent path is not a directory");
        }
    }

    if (result.is_valid) {
        common::Logger::instance().info("[Validator] Passed | warnings={}", result.warnings.size());
    } else {
        common::Logger::instance().error("[Validator] Failed | errors={}", result.errors.size());
    }

    return result;
}

ValidationResult ConfigValidator::validateFile(const std::string& path) {
    ValidationResult result;

    if (!std::filesystem::exists(path)) {
        result.addError(common::ErrorCode::CONFIG_PARSE_FAILED, "Configuration file does not exist");
        common::Logger::instance().error("[Validator] File not found | path={}", path);
        return result;
    }

    auto& config = common::Config::instance();
    if (!config.load(path)) {
        result.addError(common::ErrorCode::CONFIG_PARSE_FAILED, "Failed to parse configuration file");
        common::Logger::instance().error("[Validator] Parse failed | path={}", path);
        return result;
    }

    return validate(config.global());
}

}}
