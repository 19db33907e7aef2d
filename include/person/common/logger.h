/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Wraps spdlog with standardized configuration: colored console output and
 * an optional rotating log file.
 */

#pragma once

#include "person/common/config_manager.h"
#include "person/exception/ConfigException.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>
#include <vector>

namespace person::common {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    static constexpr std::size_t MAX_FILE_SIZE = 1024 * 1024 * 10;  // 10MB
    static constexpr std::size_t MAX_FILES = 3;

    /**
     * @brief Map a level name to spdlog's level
     *
     * trace, debug, info, warn, error, critical, off. Unknown names map to info.
     */
    static spdlog::level::level_enum parseLevel(const std::string& level) {
        if (level == "trace") return spdlog::level::trace;
        if (level == "debug") return spdlog::level::debug;
        if (level == "info") return spdlog::level::info;
        if (level == "warn") return spdlog::level::warn;
        if (level == "error") return spdlog::level::err;
        if (level == "critical") return spdlog::level::critical;
        if (level == "off") return spdlog::level::off;
        return spdlog::level::info;
    }

    /**
     * @brief Initialize the default logger
     * @param settings Logger name, level (trace, debug, info, warn, error,
     *                 critical, off), and optional log file
     * @throws exception::ConfigException if file logging cannot be set up
     */
    static void initialize(const LogSettings& settings) {
        if (settings.logToFile && settings.logFile.empty()) {
            throw exception::ConfigException("file logging enabled but no log file path given");
        }

        try {
            std::vector<spdlog::sink_ptr> sinks;

            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            if (settings.logToFile) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    settings.logFile, MAX_FILE_SIZE, MAX_FILES);
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(settings.name, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(settings.level));

            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::info("Logger initialized: name={}, level={}, file={}",
                         settings.name, settings.level,
                         settings.logToFile ? settings.logFile : "none");

        } catch (const spdlog::spdlog_ex& ex) {
            throw exception::ConfigException(std::string("logger initialization failed: ") + ex.what());
        }
    }

    static void initialize(const std::string& name, const std::string& logLevel) {
        LogSettings settings;
        settings.name = name;
        settings.level = logLevel;
        initialize(settings);
    }

    /**
     * @brief Initialize from LOG_NAME, LOG_LEVEL, LOG_TO_FILE and LOG_FILE
     */
    static void initializeFromConfig(const ConfigManager& config) {
        initialize(config.logSettings());
    }

    /**
     * @brief Set log level at runtime
     */
    static void setLevel(const std::string& level) {
        spdlog::set_level(parseLevel(level));
        spdlog::info("Log level changed to: {}", level);
    }

    /**
     * @brief Flush all loggers
     */
    static void flush() {
        spdlog::default_logger()->flush();
    }
};

} // namespace person::common
