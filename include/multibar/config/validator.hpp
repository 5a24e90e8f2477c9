#pragma once

#include "../common/config.hpp"
#include <string>
#include <vector>

namespace multibar {
namespace config {

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};

class ConfigValidator {
public:
    ValidationResult validate(const common::GlobalConfig& config);
    ValidationResult validateFile(const std::string& path);

    static bool validateStyle(const std::string& style);
    static bool validateSmoothing(double smoothing);
    static bool canCreateDirectory(const std::string& path);
};

}}
