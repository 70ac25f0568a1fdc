/**
 * @file logger.h
 * @brief Structured Logging Wrapper
 *
 * Wraps spdlog with standardized configuration and provides structured
 * logging of domain exceptions.
 */

#pragma once

#include "domaincore/exception/exception_base.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace domaincore {
namespace logging {

/**
 * @brief Logger initialization and configuration
 */
class Logger {
public:
    static constexpr size_t DEFAULT_MAX_FILE_SIZE = 1024 * 1024 * 10;  // 10MB
    static constexpr size_t DEFAULT_MAX_FILES = 3;

    /**
     * @brief Initialize the default logger
     * @param serviceName Logger name (e.g., "billing")
     * @param logLevel Log level (trace, debug, info, warn, error, critical)
     * @param logToFile Enable file logging
     * @param logFile Log file path
     * @param maxFileSize Rotation threshold in bytes
     * @param maxFiles Number of rotated files kept
     */
    static void initialize(
        const std::string& serviceName,
        const std::string& logLevel = "info",
        bool logToFile = false,
        const std::string& logFile = "",
        size_t maxFileSize = DEFAULT_MAX_FILE_SIZE,
        size_t maxFiles = DEFAULT_MAX_FILES
    ) {
        try {
            std::vector<spdlog::sink_ptr> sinks;

            // Console sink (colored)
            auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            consoleSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            sinks.push_back(consoleSink);

            // File sink (if enabled)
            if (logToFile && !logFile.empty()) {
                auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    logFile, maxFileSize, maxFiles
                );
                fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
                sinks.push_back(fileSink);
            }

            auto logger = std::make_shared<spdlog::logger>(serviceName, sinks.begin(), sinks.end());
            logger->set_level(parseLevel(logLevel));

            // Set as default logger
            spdlog::set_default_logger(logger);
            spdlog::flush_on(spdlog::level::warn);

            spdlog::info("Logger initialized: service={}, level={}, file={}",
                        serviceName, logLevel, logToFile ? logFile : "none");

        } catch (const spdlog::spdlog_ex& ex) {
            std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
        }
    }

    /**
     * @brief Map a level name to spdlog's level, defaulting to info
     */
    static spdlog::level::level_enum parseLevel(const std::string& level) {
        if (level == "trace") {
            return spdlog::level::trace;
        } else if (level == "debug") {
            return spdlog::level::debug;
        } else if (level == "info") {
            return spdlog::level::info;
        } else if (level == "warn") {
            return spdlog::level::warn;
        } else if (level == "error") {
            return spdlog::level::err;
        } else if (level == "critical") {
            return spdlog::level::critical;
        } else if (level == "off") {
            return spdlog::level::off;
        }
        return spdlog::level::info;
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

/**
 * @brief Log a domain exception as one structured JSON line
 *
 * The stack is left out of the line unless includeStack is set.
 */
inline void logException(const exception::ExceptionBase& ex,
                         spdlog::level::level_enum level = spdlog::level::err,
                         bool includeStack = false) {
    exception::SerializedException serialized = ex.serialize();
    if (!includeStack) {
        serialized.stack.reset();
    }
    spdlog::log(level, "{}", serialized.toJsonString());
}

} // namespace logging
} // namespace domaincore
