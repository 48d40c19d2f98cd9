/**
 * @file Logger.hpp
 * @brief Tagged spdlog loggers used across fluxconf
 */

#ifndef FLUXCONF_LOGGER_HPP
#define FLUXCONF_LOGGER_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace fluxconf {

using Logger = std::shared_ptr<spdlog::logger>;

/**
 * Provide logger object
 * @param tag - tagging name for identifying logger
 * @return logger object, shared with every other caller using the same tag
 */
Logger create_logger(const std::string& tag);

/**
 * Set the level of every logger created through create_logger(), and of
 * loggers created afterwards
 */
void set_log_level(spdlog::level::level_enum level);

} // namespace fluxconf

#endif // FLUXCONF_LOGGER_HPP
