// prism - CPU Whitted-style ray tracer
// Copyright (c) 2025 prism Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace prism::log {

/**
 * @brief Initialize the logging system
 *
 * Safe to call more than once; later calls only change the level.
 *
 * @param level Log level (trace, debug, info, warn, error, critical)
 */
void init(spdlog::level::level_enum level = spdlog::level::info);

/**
 * @brief Get the default logger, initializing it on first use
 *
 * @return std::shared_ptr<spdlog::logger> The logger instance
 */
std::shared_ptr<spdlog::logger> get_logger();

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error", "critical")
 *
 * Unknown names map to info.
 */
spdlog::level::level_enum parse_level(const std::string& value);

} // namespace prism::log

// Convenience macros
#define PRISM_LOG_TRACE(...) ::prism::log::get_logger()->trace(__VA_ARGS__)
#define PRISM_LOG_DEBUG(...) ::prism::log::get_logger()->debug(__VA_ARGS__)
#define PRISM_LOG_INFO(...)  ::prism::log::get_logger()->info(__VA_ARGS__)
#define PRISM_LOG_WARN(...)  ::prism::log::get_logger()->warn(__VA_ARGS__)
#define PRISM_LOG_ERROR(...) ::prism::log::get_logger()->error(__VA_ARGS__)
#define PRISM_LOG_CRITICAL(...) ::prism::log::get_logger()->critical(__VA_ARGS__)
