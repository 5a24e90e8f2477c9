#pragma once

#include <string>
#include <array>
#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace multibar {
namespace constants {

namespace version {
    constexpr const char* VERSION = "0.4.0";

    inline std::string getFullVersion() {
        return std::string("multibar v") + VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "multibar";
    constexpr const char* CONFIG_ENV = "MULTIBAR_CONFIG";
    constexpr const char* CONFIG_FILE_NAME = "multibar.toml";
    constexpr const char* SYSTEM_CONFIG_DIR = "/etc/multibar";
}

namespace styles {
    constexpr const char* DEFAULT = "block";
    constexpr const char* CUSTOM_PREFIX = "custom:";
}

namespace streams {
    constexpr std::array<const char*, 2> SUPPORTED = {"stderr", "stdout"};

    inline bool isSupported(const std::string& name) {
        return std::find(SUPPORTED.begin(), SUPPORTED.end(), name) != SUPPORTED.end();
    }
}

namespace terminal {
    constexpr size_t FALLBACK_COLUMNS = 80;
    constexpr size_t FALLBACK_ROWS = 24;
}

namespace limits {
    constexpr double DEFAULT_SMOOTHING = 0.3;
    constexpr double DEFAULT_MIN_INTERVAL_MS = 1000.0 / 24.0;
    constexpr uint64_t DEFAULT_MIN_ITERATIONS = 1;

    // Widest line the renderer will lay out, whatever width a bar asks for.
    constexpr size_t MAX_RENDER_WIDTH = 4096;

    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace config_defaults {
    constexpr const char* STYLE = styles::DEFAULT;
    constexpr size_t WIDTH = 0;
    constexpr double SMOOTHING = limits::DEFAULT_SMOOTHING;
    constexpr bool CLEAR_ON_CLOSE = false;
    constexpr double MIN_INTERVAL_MS = limits::DEFAULT_MIN_INTERVAL_MS;
    constexpr uint64_t MIN_ITERATIONS = limits::DEFAULT_MIN_ITERATIONS;
    constexpr const char* STREAM = "stderr";

    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
