/**
 * @file bootstrap.cpp
 */

#include "domaincore/bootstrap.h"
#include "domaincore/exception/exception_base.h"
#include "domaincore/logging/logger.h"

namespace domaincore {

void initialize(const config::ConfigManager& configManager) {
    int maxFileSize = configManager.getInt(config::ConfigManager::LOG_MAX_FILE_SIZE,
                                           static_cast<int>(logging::Logger::DEFAULT_MAX_FILE_SIZE));
    int maxFiles = configManager.getInt(config::ConfigManager::LOG_MAX_FILES,
                                        static_cast<int>(logging::Logger::DEFAULT_MAX_FILES));
    if (maxFileSize <= 0) {
        spdlog::warn("Invalid {} {} (using default)", config::ConfigManager::LOG_MAX_FILE_SIZE, maxFileSize);
        maxFileSize = static_cast<int>(logging::Logger::DEFAULT_MAX_FILE_SIZE);
    }
    if (maxFiles <= 0) {
        spdlog::warn("Invalid {} {} (using default)", config::ConfigManager::LOG_MAX_FILES, maxFiles);
        maxFiles = static_cast<int>(logging::Logger::DEFAULT_MAX_FILES);
    }

    logging::Logger::initialize(
        configManager.getString(config::ConfigManager::SERVICE_NAME, "domaincore"),
        configManager.getString(config::ConfigManager::LOG_LEVEL, "info"),
        configManager.getBool(config::ConfigManager::LOG_TO_FILE, false),
        configManager.getString(config::ConfigManager::LOG_FILE),
        static_cast<size_t>(maxFileSize),
        static_cast<size_t>(maxFiles)
    );

    bool captureStack = configManager.getBool(config::ConfigManager::CAPTURE_STACK_TRACE, true);
    exception::ExceptionBase::setStackCaptureEnabled(captureStack);
    spdlog::debug("Exception stack capture {}", captureStack ? "enabled" : "disabled");
}

void initialize() {
    initialize(config::ConfigManager::getInstance());
}

} // namespace domaincore
