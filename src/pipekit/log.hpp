#pragma once

#include <spdlog/spdlog.h>

#include <memory>

// pipekit logging macros mapped to spdlog
#define PIPEKIT_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::pipekit::logger(), __VA_ARGS__)
#define PIPEKIT_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::pipekit::logger(), __VA_ARGS__)
#define PIPEKIT_LOG_WARN(...) SPDLOG_LOGGER_WARN(::pipekit::logger(), __VA_ARGS__)

namespace pipekit {

/**
 * @brief The library logger, named "pipekit".
 *
 * Writes to stderr at level `warn` unless the PIPEKIT_LOG_LEVEL environment variable says
 * otherwise (using spdlog's env syntax, e.g. "debug" or "pipekit=trace").
 */
const std::shared_ptr<spdlog::logger>& logger();

}  // namespace pipekit
