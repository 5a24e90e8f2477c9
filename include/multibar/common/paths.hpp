#pragma once

#include <string>
#include <vector>

namespace multibar {
namespace common {

class PathManager {
public:
    static PathManager& instance();

    std::string getConfigDir() const;
    std::string getLogDir() const;

    std::string getConfigFile() const;
    std::string getSystemConfigFile() const;

    // Candidate config files in priority order: $MULTIBAR_CONFIG, user, system.
    std::vector<std::string> getConfigSearchPaths() const;

private:
    PathManager() = default;

    std::string getXdgConfigHome() const;
    std::string getXdgStateHome() const;
};

}}
