#pragma once

#include <string>
#include <optional>
#include <cstddef>

namespace termbar {
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

LoggingConfig defaultLoggingConfig();

std::optional<LogLevel> parseLogLevel(const std::string& value);
std::string logLevelToString(LogLevel level);

}}
