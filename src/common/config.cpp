#include "termbar/common/config.hpp"
#include "termbar/common/constants.hpp"
#include <algorithm>
#include <cctype>

namespace termbar {
namespace common {

LoggingConfig defaultLoggingConfig() {
    using namespace constants::logging;

    LoggingConfig config;
    config.rotation_size_mb = DEFAULT_ROTATION_SIZE_MB;
    config.max_files = DEFAULT_MAX_FILES;
    config.format = LogFormat::TEXT;
    return config;
}

std::optional<LogLevel> parseLogLevel(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "error") return LogLevel::ERROR;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "debug") return LogLevel::DEBUG;
    return std::nullopt;
}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "error";
        case LogLevel::WARN: return "warn";
        case LogLevel::INFO: return "info";
        case LogLevel::DEBUG: return "debug";
        default: return "info";
    }
}

}}
