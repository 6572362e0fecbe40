#include "common/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <memory>
#include <vector>

namespace ocrlayer {

bool LoggerConfig::Validate(std::string& error_msg) const {
    auto lvl = spdlog::level::from_str(level);
    // from_str falls back to "off" for unknown names
    if (lvl == spdlog::level::off && level != "off") {
        error_msg = "unknown log level '" + level + "'";
        return false;
    }
    if (!console && logDir.empty()) {
        error_msg = "logging needs a console or a log directory";
        return false;
    }
    return true;
}

void InitLogger(const LoggerConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console->set_pattern("%^[%Y-%m-%d %H:%M:%S] [%l]%$ [%s:%#] %v");
        sinks.push_back(console);
    }

    if (!config.logDir.empty()) {
        std::filesystem::create_directories(config.logDir);
        auto path = (std::filesystem::path(config.logDir) / config.logFile).string();
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path, config.maxFileSize, config.maxFiles);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [thread %t] [%s:%#] %v");
        sinks.push_back(file);
    }

    auto logger = std::make_shared<spdlog::logger>("ocrlayer", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::from_str(config.level));
    logger->flush_on(spdlog::level::warn);

    spdlog::set_default_logger(logger);
}

void ShutdownLogger() {
    spdlog::shutdown();
}

} // namespace ocrlayer
