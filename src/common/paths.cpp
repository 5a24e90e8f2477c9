#include "multibar/common/paths.hpp"
#include "multibar/common/constants.hpp"
#include <cstdlib>
#include <cstring>

namespace multibar {
namespace common {

PathManager& PathManager::instance() {
    static PathManager instance;
    return instance;
}

std::vector<std::string> PathManager::getConfigSearchPaths() const {
    std::vector<std::string> paths;

    const char* env = std::getenv(constants::system::CONFIG_ENV);
    if (env && strlen(env) > 0) {
        paths.push_back(env);
    }

    std::string user_config = getConfigFile();
    if (!user_config.empty()) {
        paths.push_back(user_config);
    }

    paths.push_back(getSystemConfigFile());

    return paths;
}

std::string PathManager::getConfigDir() const {
    std::string base = getXdgConfigHome();
    if (base.empty()) {
        return "";
    }
    return base + "/multibar";
}

std::string PathManager::getLogDir() const {
    std::string base = getXdgStateHome();
    if (base.empty()) {
        return "./logs";
    }
    return base + "/multibar";
}

std::string PathManager::getConfigFile() const {
    std::string dir = getConfigDir();
    if (dir.empty()) {
        return "";
    }
    return dir + "/" + constants::system::CONFIG_FILE_NAME;
}

std::string PathManager::getSystemConfigFile() const {
    return std::string(constants::system::SYSTEM_CONFIG_DIR) + "/" + constants::system::CONFIG_FILE_NAME;
}

std::string PathManager::getXdgConfigHome() const {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.config" : "";
}

std::string PathManager::getXdgStateHome() const {
    const char* xdg = std::getenv("XDG_STATE_HOME");
    if (xdg && strlen(xdg) > 0) {
        return xdg;
    }
    const char* home = std::getenv("HOME");
    return home ? std::string(home) + "/.local/state" : "";
}

}}
