#pragma once

#include "../common/config.hpp"
#include "../common/error_codes.hpp"
#include "../common/types.hpp"
#include <string>
#include <vector>
#include <optional>

namespace nestbar {
namespace config {

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    // Parallel to `errors`.
    std::vector<common::ErrorCode> codes;

    void addError(common::ErrorCode code, const std::string& message) {
        is_valid = false;
        codes.push_back(code);
        errors.push_back(message);
    }
};

class OptionsValidator {
public:
    ValidationResult validate(const common::Options& options) const;

    // Throws common::InvalidConfig carrying the first error's code.
    void enforce(const common::Options& options) const;

    static bool validateColor(const std::optional<std::string>& color);
    static bool validateFillChar(const std::string& fill_char);
    static bool validateUpdateInterval(double seconds);
    static bool validateWidth(const std::optional<int>& ncols);
};

class ConfigValidator {
public:
    ValidationResult validate(const common::GlobalConfig& config);
    ValidationResult validateFile(const std::string& path);
};

}}
