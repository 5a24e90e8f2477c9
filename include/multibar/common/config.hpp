#pragma once

#include <string>
#include <map>
#include <optional>
#include <cstdint>

namespace multibar {
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

// Seeds the per-bar defaults of every Display.
struct DisplayConfig {
    std::string style;
    size_t width;                 // 0 = follow the terminal
    double smoothing;
    bool clear_on_close;
    double min_interval_ms;
    uint64_t min_iterations;
    std::string stream;
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

    static GlobalConfig createDefaultConfig();

    bool load(const std::string& config_file = "");
    bool save(const std::string& config_file = "");

    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }

    // Throws core::ConfigurationError for unknown keys or unparsable values.
    void setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key) const;

    std::optional<std::string> findBestConfig() const;
    std::string getConfigPath() const;

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;

    bool tryLoadTomlFile(const std::string& path);
};

std::string to_string(LogLevel level);
std::optional<LogLevel> parseLogLevel(const std::string& value);

}}
