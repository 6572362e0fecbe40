#pragma once

#include <spdlog/spdlog.h>
#include <string>

/**
 * Logging system for ocrlayer
 *
 * Thin layer over spdlog. Call sites use the LOG_* macros with fmt-style
 * "{}" placeholders. Until InitLogger() is called, spdlog's default
 * stdout logger is used.
 */

// Log levels
#define LOG_LEVEL_OFF SPDLOG_LEVEL_OFF
#define LOG_LEVEL_ERROR SPDLOG_LEVEL_ERROR
#define LOG_LEVEL_WARN SPDLOG_LEVEL_WARN
#define LOG_LEVEL_INFO SPDLOG_LEVEL_INFO
#define LOG_LEVEL_DEBUG SPDLOG_LEVEL_DEBUG
#define LOG_LEVEL_TRACE SPDLOG_LEVEL_TRACE

#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_WARN(...) SPDLOG_WARN(__VA_ARGS__)
#define LOG_INFO(...) SPDLOG_INFO(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)

namespace ocrlayer {

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    std::string logDir;                     // empty: console only
    std::string logFile = "ocrlayer.log";   // file name inside logDir
    std::string level = "info";             // trace/debug/info/warn/error/off
    bool console = true;                    // colored stdout sink
    size_t maxFileSize = 10 * 1024 * 1024;  // rotate after 10 MB
    size_t maxFiles = 3;

    bool Validate(std::string& error_msg) const;
};

/**
 * @brief Install the process logger
 * @throws spdlog::spdlog_ex if a sink cannot be created
 */
void InitLogger(const LoggerConfig& config);

/**
 * @brief Flush and drop all registered loggers
 */
void ShutdownLogger();

} // namespace ocrlayer
