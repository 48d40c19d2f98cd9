#include "fluxconf/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace {

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

std::vector<fluxconf::Logger>& created_loggers() {
    static std::vector<fluxconf::Logger> loggers;
    return loggers;
}

spdlog::level::level_enum& current_level() {
    static spdlog::level::level_enum level = spdlog::level::info;
    return level;
}

void set_global_pattern(spdlog::logger& logger) {
    logger.set_pattern("[%Y-%m-%d %H:%M:%S][%l][%n] %v");
}

} // anonymous namespace

namespace fluxconf {

Logger create_logger(const std::string& tag) {
    std::lock_guard<std::mutex> lock(logger_mutex());
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
        logger = spdlog::stdout_color_mt(tag);
        set_global_pattern(*logger);
        logger->set_level(current_level());
        created_loggers().push_back(logger);
    }
    return logger;
}

void set_log_level(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(logger_mutex());
    current_level() = level;
    for (auto& logger : created_loggers()) {
        logger->set_level(level);
    }
}

} // namespace fluxconf
