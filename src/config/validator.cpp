#include "multibar/config/validator.hpp"
#include "multibar/common/constants.hpp"
#include "multibar/common/logger.hpp"
#include "multibar/core/error_codes.hpp"
#include "multibar/core/rate_estimator.hpp"
#include "multibar/core/style.hpp"
#include <cmath>
#include <filesystem>

namespace multibar {
namespace config {

ValidationResult ConfigValidator::validate(const common::GlobalConfig& config) {
    ValidationResult result;

    common::Logger::instance().debug("[Validator] Starting validation");

    if (!config.log_file.empty() &&
        !canCreateDirectory(std::filesystem::path(config.log_file).parent_path().string())) {
        result.errors.push_back("log_file: Cannot create parent directory");
        result.is_valid = false;
    }

    if (config.logging.rotation_size_mb < 1) {
        result.errors.push_back("logging.rotation_size_mb: Must be >= 1");
        result.is_valid = false;
    }

    if (config.logging.max_files < 1) {
        result.errors.push_back("logging.max_files: Must be >= 1");
        result.is_valid = false;
    }

    if (!validateStyle(config.display.style)) {
        result.errors.push_back(
            "display.style: Unknown style (expected ascii, block, balloon or custom:<glyphs>)");
        result.is_valid = false;
    }

    if (!validateSmoothing(config.display.smoothing)) {
        result.errors.push_back("display.smoothing: Must be in (0, 1]");
        result.is_valid = false;
    }

    if (!std::isfinite(config.display.min_interval_ms) || config.display.min_interval_ms < 0.0) {
        result.errors.push_back("display.min_interval_ms: Must be >= 0");
        result.is_valid = false;
    } else if (config.display.min_interval_ms > 10000.0) {
        result.warnings.push_back(
            "display.min_interval_ms: Above 10 seconds, bars will look frozen");
    }

    if (!constants::streams::isSupported(config.display.stream)) {
        result.errors.push_back("display.stream: Must be stderr or stdout");
        result.is_valid = false;
    }

    if (config.display.width > constants::limits::MAX_RENDER_WIDTH) {
        result.errors.push_back(fmt::format("display.width: Must be at most {}",
                                            constants::limits::MAX_RENDER_WIDTH));
        result.is_valid = false;
    } else if (config.display.width > 0 && config.display.width < 20) {
        result.warnings.push_back(
            "display.width: Narrow bars leave no room for the fill after counters and timings");
    }

    if (config.display.min_iterations == 0) {
        result.warnings.push_back(
            "display.min_iterations: 0 redraws on every advance, even advance(0)");
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
        result.errors.push_back("Configuration file does not exist");
        result.is_valid = false;
        common::Logger::instance().error("[Validator] File not found | path={}", path);
        return result;
    }

    auto& config = common::Config::instance();
    if (!config.load(path)) {
        result.errors.push_back("Failed to parse configuration file");
        result.is_valid = false;
        common::Logger::instance().error("[Validator] Parse failed | path={}", path);
        return result;
    }

    return validate(config.global());
}

bool ConfigValidator::validateStyle(const std::string& style) {
    try {
        core::Style::fromName(style);
        return true;
    } catch (const core::ConfigurationError& e) {
        common::Logger::instance().debug("[Validator] Style rejected | error={}", e.what());
        return false;
    }
}

bool ConfigValidator::validateSmoothing(double smoothing) {
    return core::RateEstimator::isValidSmoothing(smoothing);
}

bool ConfigValidator::canCreateDirectory(const std::string& path) {
    std::error_code ec;
    std::filesystem::path p(path);

    if (p.empty()) {
        return true;
    }

    if (std::filesystem::exists(p, ec)) {
        return std::filesystem::is_directory(p, ec);
    }

    auto parent = p.parent_path();
    if (parent.empty() || parent == p) {
        return true;
    }

    if (std::filesystem::exists(parent, ec)) {
        auto perms = std::filesystem::status(parent, ec).permissions();
        return !ec && (perms & std::filesystem::perms::owner_write) != std::filesystem::perms::none;
    }

    return canCreateDirectory(parent.string());
}

}}
