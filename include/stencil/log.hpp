#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace stencil {
namespace log {

/// Name of the library logger.
inline constexpr const char* kLoggerName = "stencil";

/**
 * @brief Library-wide logger
 *
 * Created on first use with a colored stderr sink at level `warn`. The
 * engine only logs diagnostics (parse failures, lenient misses), never
 * rendered prompt content.
 *
 * @threadsafety Thread-safe.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Replace the library logger
 *
 * Lets an application route engine diagnostics through its own sinks.
 * Passing nullptr restores the default stderr logger.
 */
void set_logger(std::shared_ptr<spdlog::logger> logger);

/** @brief Set the level of the current library logger. */
void set_level(spdlog::level::level_enum level);

} // namespace log
} // namespace stencil
