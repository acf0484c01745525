#pragma once
/**
 * @file log.hpp
 * @brief Engine diagnostics via a single named spdlog logger.
 *
 * All library code logs through logger(); it writes to stderr so stdout is
 * left for CLI results (tables, CSV, JSON). The default level is "warn".
 */

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace netroster {

/** @brief The process-wide "netroster" logger, created on first call. */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Set the log level by name: trace, debug, info, warn, error, off.
 * @return false (level unchanged) for an unknown name.
 */
bool init_logging(const std::string& level);

} // namespace netroster
