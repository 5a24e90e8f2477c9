#pragma once

#include "../common/error_framework.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace multibar {
namespace core {

enum class ProgressErrorCode {
    STYLE_UNKNOWN = 100,
    STYLE_TOO_FEW_GLYPHS = 101,

    SMOOTHING_OUT_OF_RANGE = 200,
    INTERVAL_NEGATIVE = 201,

    CONFIG_KEY_UNKNOWN = 300,
    CONFIG_VALUE_INVALID = 301,

    TERMINAL_WRITE_FAILED = 400
};

using ProgressErrorCodeHelper = common::ErrorRegistry<ProgressErrorCode>;

// Raised synchronously when a bar or display setting cannot be applied.
// The record being configured is left untouched.
class ConfigurationError : public std::runtime_error {
public:
    ConfigurationError(ProgressErrorCode code, const common::ErrorContext& context);

    ProgressErrorCode code() const { return code_; }
    const common::ErrorContext& context() const { return context_; }

private:
    ProgressErrorCode code_;
    common::ErrorContext context_;

    static std::string buildMessage(ProgressErrorCode code, const common::ErrorContext& context);
};

}
}

namespace multibar {
namespace common {

template<>
inline const std::unordered_map<core::ProgressErrorCode, ErrorInfo<core::ProgressErrorCode>>&
ErrorRegistry<core::ProgressErrorCode>::getInfoMap() {
    static const std::unordered_map<core::ProgressErrorCode, ErrorInfo<core::ProgressErrorCode>> map = {
        {core::ProgressErrorCode::STYLE_UNKNOWN, {
            core::ProgressErrorCode::STYLE_UNKNOWN,
            "STYLE_UNKNOWN",
            "Unknown bar style"
        }},
        {core::ProgressErrorCode::STYLE_TOO_FEW_GLYPHS, {
            core::ProgressErrorCode::STYLE_TOO_FEW_GLYPHS,
            "STYLE_TOO_FEW_GLYPHS",
            "Custom style needs at least an empty and a full glyph"
        }},
        {core::ProgressErrorCode::SMOOTHING_OUT_OF_RANGE, {
            core::ProgressErrorCode::SMOOTHING_OUT_OF_RANGE,
            "SMOOTHING_OUT_OF_RANGE",
            "Smoothing factor must be in (0, 1]"
        }},
        {core::ProgressErrorCode::INTERVAL_NEGATIVE, {
            core::ProgressErrorCode::INTERVAL_NEGATIVE,
            "INTERVAL_NEGATIVE",
            "Refresh interval must not be negative"
        }},
        {core::ProgressErrorCode::CONFIG_KEY_UNKNOWN, {
            core::ProgressErrorCode::CONFIG_KEY_UNKNOWN,
            "CONFIG_KEY_UNKNOWN",
            "Unknown configuration key"
        }},
        {core::ProgressErrorCode::CONFIG_VALUE_INVALID, {
            core::ProgressErrorCode::CONFIG_VALUE_INVALID,
            "CONFIG_VALUE_INVALID",
            "Invalid configuration value"
        }},
        {core::ProgressErrorCode::TERMINAL_WRITE_FAILED, {
            core::ProgressErrorCode::TERMINAL_WRITE_FAILED,
            "TERMINAL_WRITE_FAILED",
            "Terminal write failed"
        }}
    };
    return map;
}

}
}
