#include "termbar/progress/error_codes.hpp"
#include <utility>

namespace termbar {
namespace progress {

ProgressBarError::ProgressBarError(ProgressErrorCode code, common::ErrorContext context)
    : std::runtime_error(buildMessage(code, context)),
      code_(code),
      context_(std::move(context)) {
}

std::string ProgressBarError::buildMessage(ProgressErrorCode code, const common::ErrorContext& context) {
    std::string message = std::string(ProgressErrorCodeHelper::toString(code)) + ": " +
                          ProgressErrorCodeHelper::getMessage(code);

    std::string details = common::formatContext(context);
    if (!details.empty()) {
        message += " (" + details + ")";
    }
    return message;
}

}}
