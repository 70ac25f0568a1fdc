/**
 * @file bootstrap.h
 * @brief Process-wide set-up from configuration
 */

#pragma once

#include "domaincore/config/config_manager.h"

namespace domaincore {

/**
 * @brief Apply configuration to logging and exception stack capture
 *
 * Reads SERVICE_NAME, LOG_LEVEL, LOG_TO_FILE, LOG_FILE, LOG_MAX_FILE_SIZE,
 * LOG_MAX_FILES and CAPTURE_STACK_TRACE.
 */
void initialize(const config::ConfigManager& configManager);

/**
 * @brief Same as initialize(ConfigManager::getInstance())
 */
void initialize();

} // namespace domaincore
