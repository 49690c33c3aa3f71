#pragma once

#include "../common/error_framework.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace termbar {
namespace progress {

enum class ProgressErrorCode {
    INVALID_CONFIGURATION = 100,
    INVALID_WIDTH = 101
};

using ProgressErrorCodeHelper = common::ErrorRegistry<ProgressErrorCode>;

class ProgressBarError : public std::runtime_error {
public:
    ProgressBarError(ProgressErrorCode code, common::ErrorContext context);

    ProgressErrorCode code() const { return code_; }
    const common::ErrorContext& context() const { return context_; }

private:
    ProgressErrorCode code_;
    common::ErrorContext context_;

    static std::string buildMessage(ProgressErrorCode code, const common::ErrorContext& context);
};

}
}

namespace termbar {
namespace common {

template<>
inline const std::unordered_map<progress::ProgressErrorCode, ErrorInfo<progress::ProgressErrorCode>>&
ErrorRegistry<progress::ProgressErrorCode>::getInfoMap() {
    static const std::unordered_map<progress::ProgressErrorCode, ErrorInfo<progress::ProgressErrorCode>> map = {
        {progress::ProgressErrorCode::INVALID_CONFIGURATION, {
            progress::ProgressErrorCode::INVALID_CONFIGURATION,
            "INVALID_CONFIGURATION",
            "End value must be non-zero"
        }},
        {progress::ProgressErrorCode::INVALID_WIDTH, {
            progress::ProgressErrorCode::INVALID_WIDTH,
            "INVALID_WIDTH",
            "Bar width must be positive"
        }}
    };
    return map;
}

}
}
