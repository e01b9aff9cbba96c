#include "log.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace core {

namespace {

std::mutex logger_mutex;
spdlog::level::level_enum default_level = spdlog::level::info;

}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    std::lock_guard<std::mutex> lock(logger_mutex);

    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }

    logger = spdlog::stderr_color_mt(name);
    logger->set_level(default_level);
    return logger;
}

bool set_log_level(const std::string& level) {
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }

    std::lock_guard<std::mutex> lock(logger_mutex);
    default_level = parsed;
    spdlog::set_level(parsed);
    return true;
}

} // namespace core
