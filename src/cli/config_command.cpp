#include "config_command.hpp"
#include "multibar/common/config.hpp"
#include "multibar/common/logger.hpp"
#include "multibar/common/paths.hpp"
#include "multibar/config/validator.hpp"
#include "multibar/core/error_codes.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <unistd.h>

namespace multibar {
namespace cli {

namespace {

constexpr const char* ALL_KEYS[] = {
    "log_file",
    "log_level",
    "logging.rotation_size_mb",
    "logging.max_files",
    "logging.format",
    "display.style",
    "display.width",
    "display.smoothing",
    "display.clear_on_close",
    "display.min_interval_ms",
    "display.min_iterations",
    "display.stream"
};

}

ConfigCommand::ConfigCommand() : was_called_(false) {}

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;

    set_cmd_ = subcommand->add_subcommand("set", "Set configuration value");
    set_cmd_->add_option("key", set_key_, "Configuration key")->required();
    set_cmd_->add_option("value", set_value_, "Configuration value")->required();
    set_cmd_->callback([this]() { was_called_ = true; });

    get_cmd_ = subcommand->add_subcommand("get", "Get configuration value");
    get_cmd_->add_option("key", get_key_, "Configuration key (optional)");
    get_cmd_->callback([this]() { was_called_ = true; });

    show_cmd_ = subcommand->add_subcommand("show", "Show configuration file");
    show_cmd_->callback([this]() { was_called_ = true; });

    validate_cmd_ = subcommand->add_subcommand("validate", "Validate configuration");
    validate_cmd_->callback([this]() { was_called_ = true; });

    path_cmd_ = subcommand->add_subcommand("path", "Print the configuration search paths");
    path_cmd_->callback([this]() { was_called_ = true; });
}

bool ConfigCommand::wasCalled() const {
    return was_called_;
}

int ConfigCommand::execute() {
    if (set_cmd_->parsed()) {
        return executeSet();
    } else if (get_cmd_->parsed()) {
        return executeGet();
    } else if (show_cmd_->parsed()) {
        return executeShow();
    } else if (validate_cmd_->parsed()) {
        return executeValidate();
    } else if (path_cmd_->parsed()) {
        return executePath();
    }

    std::cout << subcommand_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeSet() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();

    if (!canWriteConfig(config_path)) {
        std::cerr << "\033[31mError: Permission denied\033[0m\n\n";
        std::cerr << "Resource: " << config_path << "\n";
        std::cerr << "Check file permissions: ls -l " << config_path << "\n";
        return 1;
    }

    try {
        config.setValue(set_key_, set_value_);
    } catch (const core::ConfigurationError& e) {
        std::cerr << "\033[31mError:\033[0m " << e.what() << "\n";
        return 1;
    }

    config::ConfigValidator validator;
    auto result = validator.validate(config.global());
    if (!result.is_valid) {
        for (const auto& error : result.errors) {
            std::cerr << "  ERROR: " << error << "\n";
        }
        std::cerr << "Configuration not saved.\n";
        return 1;
    }

    if (config.save(config_path)) {
        std::cout << "✓ Configuration updated: " << set_key_ << " = " << set_value_ << "\n";
        return 0;
    }

    std::cerr << "Failed to save configuration.\n";
    return 1;
}

int ConfigCommand::executeGet() {
    auto& config = common::Config::instance();

    if (get_key_.empty()) {
        std::cout << "Configuration:\n";
        for (const char* key : ALL_KEYS) {
            auto value = config.getValue(key);
            std::cout << "  " << key << " = " << (value ? *value : "(not set)") << "\n";
        }
        return 0;
    }

    auto value = config.getValue(get_key_);
    if (!value) {
        std::cerr << "Unknown configuration key: " << get_key_ << "\n";
        return 1;
    }

    std::cout << *value << "\n";
    return 0;
}

int ConfigCommand::executeShow() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();

    if (!std::filesystem::exists(config_path)) {
        std::cerr << "Configuration file does not exist.\n";
        std::cerr << "Expected: " << config_path << "\n";
        std::cerr << "Run: multibar config set display.style block\n";
        return 1;
    }

    std::cout << "Configuration file: " << config_path << "\n\n";

    std::ifstream file(config_path);
    if (!file) {
        std::cerr << "Failed to read configuration file.\n";
        return 1;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::cout << line << "\n";
    }

    return 0;
}

int ConfigCommand::executeValidate() {
    auto& config = common::Config::instance();
    std::string config_path = config.getConfigPath();

    config::ConfigValidator validator;
    config::ValidationResult result;

    if (std::filesystem::exists(config_path)) {
        std::cout << "Validating: " << config_path << "\n\n";
        result = validator.validateFile(config_path);
    } else {
        std::cout << "Validating: built-in defaults\n\n";
        result = validator.validate(config.global());
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

int ConfigCommand::executePath() {
    auto& config = common::Config::instance();
    auto active = config.findBestConfig();

    std::cout << "Search order:\n";
    for (const auto& path : common::PathManager::instance().getConfigSearchPaths()) {
        bool is_active = active && *active == path;
        std::cout << (is_active ? "  * " : "    ") << path << "\n";
    }
    std::cout << "\nWrite target: " << config.getConfigPath() << "\n";
    return 0;
}

bool ConfigCommand::canWriteConfig(const std::string& config_path) {
    if (config_path.empty()) {
        return false;
    }

    if (std::filesystem::exists(config_path)) {
        return access(config_path.c_str(), W_OK) == 0;
    }

    // Missing directories are created on save; check the nearest existing ancestor.
    std::filesystem::path parent = std::filesystem::path(config_path).parent_path();
    while (!parent.empty() && !std::filesystem::exists(parent)) {
        parent = parent.parent_path();
    }
    return !parent.empty() && access(parent.c_str(), W_OK) == 0;
}

}}
