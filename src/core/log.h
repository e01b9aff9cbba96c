#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace core {

/**
 * Get (or lazily create) the named component logger.
 * Loggers write to a coloured stderr sink, leaving stdout to command output.
 */
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/**
 * Apply a level name ("trace", "debug", "info", "warn", "error", "off")
 * to every registered logger and to loggers created later.
 * Returns false if the name is not recognised.
 */
bool set_log_level(const std::string& level);

} // namespace core
