#include "termbar/common/logger.hpp"
#include "termbar/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <filesystem>

namespace termbar {
namespace common {

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(LogMode mode, const std::string& log_file, LogLevel level, const LoggingConfig& logging_config) {
    if (initialized_) {
        if (logger_) {
            logger_->warn("[Logger] Already initialized, ignoring duplicate initialization");
        }
        return;
    }

    const char* name = constants::logging::LOGGER_NAME;
    auto spdlog_level = toSpdlogLevel(level);

    spdlog::sink_ptr sink;
    current_format_ = LogFormat::TEXT;

    if (mode == LogMode::FILE_ONLY) {
        sink = createFileSink(log_file, logging_config);
        if (sink) {
            current_format_ = logging_config.format;
        } else {
            std::cerr << "[Logger] Falling back to console output" << std::endl;
        }
    }

    if (!sink) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
    sink->set_level(spdlog_level);

    logger_ = std::make_shared<spdlog::logger>(name, sink);
    logger_->set_pattern(patternFor(current_format_));
    logger_->set_level(spdlog_level);

    if (mode == LogMode::FILE_ONLY) {
        logger_->flush_on(spdlog::level::info);
    }

    spdlog::drop(name);
    spdlog::register_logger(logger_);
    initialized_ = true;

    logger_->debug("[Logger] {} logging at {}", constants::version::getFullVersion(), logLevelToString(level));
}

spdlog::sink_ptr Logger::createFileSink(const std::string& log_file, const LoggingConfig& logging_config) const {
    if (log_file.empty()) {
        std::cerr << "[Logger] Log file path required for FILE_ONLY mode" << std::endl;
        return nullptr;
    }

    std::filesystem::path log_dir = std::filesystem::path(log_file).parent_path();
    std::error_code ec;
    if (!log_dir.empty() && !std::filesystem::exists(log_dir, ec)) {
        std::filesystem::create_directories(log_dir, ec);
    }
    if (ec) {
        std::cerr << "[Logger] Failed to create log directory: " << log_dir
                  << " - " << ec.message() << std::endl;
        return nullptr;
    }

    try {
        size_t max_size = logging_config.rotation_size_mb * 1024 * 1024;
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            getLogFileWithSuffix(logging_config.format, log_file), max_size, logging_config.max_files);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Failed to open log file: " << log_file
                  << " - " << ex.what() << std::endl;
        return nullptr;
    }
}

const char* Logger::patternFor(LogFormat format) {
    if (format == LogFormat::JSON) {
        return R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","message":"%v"})";
    }
    return "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
}

void Logger::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(toSpdlogLevel(level));
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::logging::LOGGER_NAME);
        logger_.reset();
    }
    initialized_ = false;
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
        default: return spdlog::level::info;
    }
}

std::string Logger::getLogFileWithSuffix(LogFormat format, const std::string& base_path) const {
    if (format != LogFormat::JSON) {
        return base_path;
    }

    std::filesystem::path p(base_path);
    std::string json_name = p.stem().string() + ".json" + p.extension().string();
    return p.has_parent_path() ? (p.parent_path() / json_name).string() : json_name;
}

}}
