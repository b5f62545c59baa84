#pragma once

#include "error_framework.hpp"
#include <string>
#include <unordered_map>
#include <utility>

namespace nestbar {
namespace common {

enum class ErrorCode {
    CONFIG_INVALID_COLOR = 100,
    CONFIG_INVALID_UPDATE_INTERVAL = 101,
    CONFIG_INVALID_FILL_CHAR = 102,
    CONFIG_INVALID_WIDTH = 103,
    CONFIG_PARSE_FAILED = 104,

    RENDER_WRITE_FAILED = 200,
    RENDER_STREAM_CLOSED = 201,

    STATE_INVALID_TRANSITION = 300,
    STATE_SLOT_NOT_FOUND = 301
};

using ErrorCodeHelper = ErrorRegistry<ErrorCode>;

template<>
inline const std::unordered_map<ErrorCode, ErrorInfo<ErrorCode>>&
ErrorRegistry<ErrorCode>::getInfoMap() {
    static const std::unordered_map<ErrorCode, ErrorInfo<ErrorCode>> map = {
        {ErrorCode::CONFIG_INVALID_COLOR, {
            ErrorCode::CONFIG_INVALID_COLOR,
            "CONFIG_INVALID_COLOR",
            "Color name is not supported"
        }},
        {ErrorCode::CONFIG_INVALID_UPDATE_INTERVAL, {
            ErrorCode::CONFIG_INVALID_UPDATE_INTERVAL,
            "CONFIG_INVALID_UPDATE_INTERVAL",
            "Update interval must be non-negative"
        }},
        {ErrorCode::CONFIG_INVALID_FILL_CHAR, {
            ErrorCode::CONFIG_INVALID_FILL_CHAR,
            "CONFIG_INVALID_FILL_CHAR",
            "Fill character must be exactly one glyph"
        }},
        {ErrorCode::CONFIG_INVALID_WIDTH, {
            ErrorCode::CONFIG_INVALID_WIDTH,
            "CONFIG_INVALID_WIDTH",
            "Width must be at least one column"
        }},
        {ErrorCode::CONFIG_PARSE_FAILED, {
            ErrorCode::CONFIG_PARSE_FAILED,
            "CONFIG_PARSE_FAILED",
            "Configuration file could not be parsed"
        }},
        {ErrorCode::RENDER_WRITE_FAILED, {
            ErrorCode::RENDER_WRITE_FAILED,
            "RENDER_WRITE_FAILED",
            "Terminal write failed"
        }},
        {ErrorCode::RENDER_STREAM_CLOSED, {
            ErrorCode::RENDER_STREAM_CLOSED,
            "RENDER_STREAM_CLOSED",
            "Terminal stream is closed"
        }},
        {ErrorCode::STATE_INVALID_TRANSITION, {
            ErrorCode::STATE_INVALID_TRANSITION,
            "STATE_INVALID_TRANSITION",
            "Invalid indicator state transition"
        }},
        {ErrorCode::STATE_SLOT_NOT_FOUND, {
            ErrorCode::STATE_SLOT_NOT_FOUND,
            "STATE_SLOT_NOT_FOUND",
            "Indicator slot not found on stack"
        }}
    };
    return map;
}

class NestbarError : public std::runtime_error {
public:
    NestbarError(ErrorCode code, const std::string& message, ErrorContext context = {})
        : std::runtime_error(formatError(code, message, context)),
          code_(code),
          context_(std::move(context)) {}

    ErrorCode code() const { return code_; }
    const ErrorContext& context() const { return context_; }

private:
    ErrorCode code_;
    ErrorContext context_;
};

// Bad construction parameters. Thrown before any indicator state exists.
class InvalidConfig : public NestbarError {
public:
    using NestbarError::NestbarError;
};

// The output stream rejected a write.
class RenderFailure : public NestbarError {
public:
    using NestbarError::NestbarError;
};

// A lifecycle call arrived in a state that does not accept it.
class StateError : public NestbarError {
public:
    using NestbarError::NestbarError;
};

}
}
