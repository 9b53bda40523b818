/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Logging for libflightseg, backed by spdlog.
 */

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace flight_seg {

/// Default pattern: time, logger name, level, message
constexpr const char *DEFAULT_LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

/**
 * Initialize the logger. Safe to call more than once; later calls only
 * change the level and pattern.
 *
 * Throws ConfigError if the level isn't one of
 * trace, debug, info, warn, error, critical, off.
 */
void initLogging(const std::string &level = "info", const std::string &pattern = DEFAULT_LOG_PATTERN);

/// The library logger; created with defaults on first use.
std::shared_ptr<spdlog::logger> getLogger();

/// Change the log level at runtime. Throws ConfigError on an unknown level.
void setLogLevel(const std::string &level);

} // namespace flight_seg

#define FLIGHTSEG_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(flight_seg::getLogger(), __VA_ARGS__)
#define FLIGHTSEG_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(flight_seg::getLogger(), __VA_ARGS__)
#define FLIGHTSEG_LOG_INFO(...) SPDLOG_LOGGER_INFO(flight_seg::getLogger(), __VA_ARGS__)
#define FLIGHTSEG_LOG_WARN(...) SPDLOG_LOGGER_WARN(flight_seg::getLogger(), __VA_ARGS__)
#define FLIGHTSEG_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(flight_seg::getLogger(), __VA_ARGS__)
#define FLIGHTSEG_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(flight_seg::getLogger(), __VA_ARGS__)
