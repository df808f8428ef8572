/**
 * @file logging.hxx
 * @brief Access to the spdlog logger used by tatar.
 */

#pragma once

#include <memory>

#include <spdlog/common.h>
#include <spdlog/logger.h>

namespace tatar {

/**
 * @brief The "tatar" logger, created and registered with spdlog on first use.
 *
 * It writes to stderr and starts at the warn level unless SPDLOG_LEVEL
 * configures the "tatar" logger (for example SPDLOG_LEVEL=tatar=debug).
 * Global and foreign entries of SPDLOG_LEVEL are left to the application.
 */
std::shared_ptr<spdlog::logger> logger();

/// Change the level of the tatar logger.
void set_log_level(spdlog::level::level_enum level);

} // namespace tatar
