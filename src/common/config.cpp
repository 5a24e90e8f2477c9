#include "multibar/common/config.hpp"
#include "multibar/common/constants.hpp"
#include "multibar/common/paths.hpp"
#include "multibar/common/logger.hpp"
#include "multibar/core/error_codes.hpp"
#include <toml.hpp>
#include <fstream>
#include <filesystem>
#include <type_traits>
#include <unistd.h>

namespace multibar {
namespace common {

namespace {

core::ConfigurationError invalidValue(const std::string& key, const std::string& value) {
    return core::ConfigurationError(core::ProgressErrorCode::CONFIG_VALUE_INVALID,
                                    {"Config", {{"key", key}, {"value", value}}});
}

bool parseBool(const std::string& key, const std::string& value) {
    if (value == "true" || value == "1") return true;
    if (value == "false" || value == "0") return false;
    throw invalidValue(key, value);
}

template<typename T, typename Parser>
T parseNumber(const std::string& key, const std::string& value, Parser parser) {
    // stoull accepts "-1" and wraps it around.
    if (std::is_unsigned<T>::value) {
        size_t first = value.find_first_not_of(" \t");
        if (first != std::string::npos && value[first] == '-') {
            throw invalidValue(key, value);
        }
    }
    try {
        size_t consumed = 0;
        T result = static_cast<T>(parser(value, &consumed));
        if (consumed != value.size()) {
            throw invalidValue(key, value);
        }
        return result;
    } catch (const std::logic_error&) {
        throw invalidValue(key, value);
    }
}

std::string formatNumber(double value) {
    return fmt::format("{}", value);
}

}

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

std::optional<LogLevel> parseLogLevel(const std::string& value) {
    if (value == "DEBUG") return LogLevel::DEBUG;
    if (value == "INFO") return LogLevel::INFO;
    if (value == "WARN") return LogLevel::WARN;
    if (value == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;

    GlobalConfig config;

    config.log_file = "";
    config.log_level = LogLevel::WARN;

    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;

    config.display.style = STYLE;
    config.display.width = WIDTH;
    config.display.smoothing = SMOOTHING;
    config.display.clear_on_close = CLEAR_ON_CLOSE;
    config.display.min_interval_ms = MIN_INTERVAL_MS;
    config.display.min_iterations = MIN_ITERATIONS;
    config.display.stream = STREAM;

    return config;
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

    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            current_config_path_.clear();
            Logger::instance().debug("[Config] No config file found, using defaults");
            return true;
        }
        effective_config_file = *best;
    }

    current_config_path_ = effective_config_file;
    return tryLoadTomlFile(effective_config_file);
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().debug("[Config] Not found | path={}", path);
        return false;
    }

    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] Not readable | path={}", path);
        return false;
    }

    try {
        auto data = toml::parse(path);

        if (data.contains("global")) {
            auto global_section = data.at("global");

            if (global_section.contains("log_file")) {
                global_.log_file = toml::find<std::string>(global_section, "log_file");
            }
            if (global_section.contains("log_level")) {
                std::string level = toml::find<std::string>(global_section, "log_level");
                auto parsed = parseLogLevel(level);
                if (parsed) {
                    global_.log_level = *parsed;
                } else {
                    Logger::instance().warn("[Config] Unknown log level | value={}", level);
                }
            }
        }

        if (data.contains("logging")) {
            auto logging_section = data.at("logging");

            if (logging_section.contains("rotation_size_mb")) {
                global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                global_.logging.format = (format_str == "json") ? LogFormat::JSON : LogFormat::TEXT;
            }
        }

        if (data.contains("display")) {
            auto display_section = data.at("display");

            if (display_section.contains("style")) {
                global_.display.style = toml::find<std::string>(display_section, "style");
            }
            if (display_section.contains("width")) {
                global_.display.width = toml::find<size_t>(display_section, "width");
            }
            if (display_section.contains("smoothing")) {
                global_.display.smoothing = toml::find<double>(display_section, "smoothing");
            }
            if (display_section.contains("clear_on_close")) {
                global_.display.clear_on_close = toml::find<bool>(display_section, "clear_on_close");
            }
            if (display_section.contains("min_interval_ms")) {
                global_.display.min_interval_ms = toml::find<double>(display_section, "min_interval_ms");
            }
            if (display_section.contains("min_iterations")) {
                global_.display.min_iterations = toml::find<uint64_t>(display_section, "min_iterations");
            }
            if (display_section.contains("stream")) {
                global_.display.stream = toml::find<std::string>(display_section, "stream");
            }
        }

        Logger::instance().info("[Config] Loaded | path={}", path);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }
}

bool Config::save(const std::string& config_file) {
    try {
        std::string effective_config_file = config_file;
        if (effective_config_file.empty()) {
            effective_config_file = current_config_path_.empty()
                ? PathManager::instance().getConfigFile()
                : current_config_path_;
        }

        if (effective_config_file.empty()) {
            Logger::instance().error("[Config] No writable config location");
            return false;
        }

        toml::value data = toml::table{
            {"global", toml::table{
                {"log_file", global_.log_file},
                {"log_level", to_string(global_.log_level)}
            }},
            {"logging", toml::table{
                {"rotation_size_mb", global_.logging.rotation_size_mb},
                {"max_files", global_.logging.max_files},
                {"format", global_.logging.format == LogFormat::JSON ? "json" : "text"}
            }},
            {"display", toml::table{
                {"style", global_.display.style},
                {"width", global_.display.width},
                {"smoothing", global_.display.smoothing},
                {"clear_on_close", global_.display.clear_on_close},
                {"min_interval_ms", global_.display.min_interval_ms},
                {"min_iterations", global_.display.min_iterations},
                {"stream", global_.display.stream}
            }}
        };

        std::filesystem::path parent = std::filesystem::path(effective_config_file).parent_path();
        std::error_code ec;
        if (!parent.empty() && !std::filesystem::exists(parent, ec)) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                Logger::instance().error("[Config] Directory creation failed | path={} | error={}",
                                         parent.string(), ec.message());
                return false;
            }
        }

        std::ofstream file(effective_config_file);
        if (!file) {
            Logger::instance().error("[Config] File open failed | path={}", effective_config_file);
            return false;
        }

        file << toml::format(data);
        file.close();

        current_config_path_ = effective_config_file;

        Logger::instance().info("[Config] Saved | path={}", effective_config_file);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Save failed | error={}", e.what());
        return false;
    }
}

void Config::setValue(const std::string& key, const std::string& value) {
    if (key == "log_file") global_.log_file = value;
    else if (key == "log_level") {
        auto parsed = parseLogLevel(value);
        if (!parsed) throw invalidValue(key, value);
        global_.log_level = *parsed;
    }
    else if (key == "logging.rotation_size_mb") {
        global_.logging.rotation_size_mb = parseNumber<size_t>(key, value,
            [](const std::string& s, size_t* pos) { return std::stoull(s, pos); });
    }
    else if (key == "logging.max_files") {
        global_.logging.max_files = parseNumber<size_t>(key, value,
            [](const std::string& s, size_t* pos) { return std::stoull(s, pos); });
    }
    else if (key == "logging.format") {
        if (value != "json" && value != "text") throw invalidValue(key, value);
        global_.logging.format = (value == "json") ? LogFormat::JSON : LogFormat::TEXT;
    }
    else if (key == "display.style") global_.display.style = value;
    else if (key == "display.width") {
        global_.display.width = parseNumber<size_t>(key, value,
            [](const std::string& s, size_t* pos) { return std::stoull(s, pos); });
    }
    else if (key == "display.smoothing") {
        global_.display.smoothing = parseNumber<double>(key, value,
            [](const std::string& s, size_t* pos) { return std::stod(s, pos); });
    }
    else if (key == "display.clear_on_close") global_.display.clear_on_close = parseBool(key, value);
    else if (key == "display.min_interval_ms") {
        global_.display.min_interval_ms = parseNumber<double>(key, value,
            [](const std::string& s, size_t* pos) { return std::stod(s, pos); });
    }
    else if (key == "display.min_iterations") {
        global_.display.min_iterations = parseNumber<uint64_t>(key, value,
            [](const std::string& s, size_t* pos) { return std::stoull(s, pos); });
    }
    else if (key == "display.stream") global_.display.stream = value;
    else {
        throw core::ConfigurationError(core::ProgressErrorCode::CONFIG_KEY_UNKNOWN,
                                       {"Config", {{"key", key}}});
    }
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    if (key == "log_file") return global_.log_file;
    else if (key == "log_level") return to_string(global_.log_level);
    else if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    else if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    else if (key == "logging.format") return global_.logging.format == LogFormat::JSON ? "json" : "text";
    else if (key == "display.style") return global_.display.style;
    else if (key == "display.width") return std::to_string(global_.display.width);
    else if (key == "display.smoothing") return formatNumber(global_.display.smoothing);
    else if (key == "display.clear_on_close") return global_.display.clear_on_close ? "true" : "false";
    else if (key == "display.min_interval_ms") return formatNumber(global_.display.min_interval_ms);
    else if (key == "display.min_iterations") return std::to_string(global_.display.min_iterations);
    else if (key == "display.stream") return global_.display.stream;

    return std::nullopt;
}

std::string Config::getConfigPath() const {
    if (!current_config_path_.empty()) {
        return current_config_path_;
    }
    return PathManager::instance().getConfigFile();
}

}}
