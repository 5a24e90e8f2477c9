#include "multibar/core/error_codes.hpp"

namespace multibar {
namespace core {

ConfigurationError::ConfigurationError(ProgressErrorCode code, const common::ErrorContext& context)
    : std::runtime_error(buildMessage(code, context)),
      code_(code),
      context_(context) {}

std::string ConfigurationError::buildMessage(ProgressErrorCode code, const common::ErrorContext& context) {
    std::string message = "[";
    message += ProgressErrorCodeHelper::toString(code);
    message += "] ";
    message += ProgressErrorCodeHelper::getMessage(code);

    std::string details = common::formatContext(context);
    if (!details.empty()) {
        message += " | " + details;
    }
    return message;
}

}}
