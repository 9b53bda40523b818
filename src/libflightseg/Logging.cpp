/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <spdlog/sinks/stdout_color_sinks.h>

#include "Errors.hpp"
#include "Logging.hpp"

namespace flight_seg {

namespace {

constexpr const char *LOGGER_NAME = "flightseg";

std::shared_ptr<spdlog::logger> g_logger;

spdlog::level::level_enum parseLevel(const std::string &level)
{
    if (level == "trace") {
        return spdlog::level::trace;
    }
    if (level == "debug") {
        return spdlog::level::debug;
    }
    if (level == "info") {
        return spdlog::level::info;
    }
    if (level == "warn" || level == "warning") {
        return spdlog::level::warn;
    }
    if (level == "error") {
        return spdlog::level::err;
    }
    if (level == "critical") {
        return spdlog::level::critical;
    }
    if (level == "off") {
        return spdlog::level::off;
    }
    throw ConfigError{"unknown log level '" + level + "'"};
}

void createLogger()
{
    // another component may already have registered the name
    g_logger = spdlog::get(LOGGER_NAME);
    if (!g_logger) {
        g_logger = spdlog::stdout_color_mt(LOGGER_NAME);
    }
}

} // namespace

void initLogging(const std::string &level, const std::string &pattern)
{
    auto parsedLevel = parseLevel(level);
    if (!g_logger) {
        createLogger();
    }
    g_logger->set_pattern(pattern);
    g_logger->set_level(parsedLevel);
}

std::shared_ptr<spdlog::logger> getLogger()
{
    if (!g_logger) {
        createLogger();
        g_logger->set_pattern(DEFAULT_LOG_PATTERN);
        g_logger->set_level(spdlog::level::info);
    }
    return g_logger;
}

void setLogLevel(const std::string &level) { getLogger()->set_level(parseLevel(level)); }

} // namespace flight_seg
