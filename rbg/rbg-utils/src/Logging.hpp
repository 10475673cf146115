#ifndef RBG_UTILS_LOGGING_HPP
#define RBG_UTILS_LOGGING_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace rbg_utils
{

/**
 * @brief Get (or create) a named colored console logger
 *
 * Loggers are shared through the spdlog registry, so every system asking for
 * the same name writes through the same logger instance.
 *
 * @param name Logger name, shown in every line (e.g. "gameplay")
 * @return Shared logger instance
 */
std::shared_ptr<spdlog::logger> getLogger(const std::string& name);

/**
 * @brief Create a logger that discards all output
 *
 * Not registered with the spdlog registry. Used by tests and by callers that
 * want a system to run silently.
 */
std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name = "null");

/**
 * @brief Set the level of every registered logger and of loggers created later
 * @param level One of "trace", "debug", "info", "warning", "error",
 *        "critical", "off"
 * @throws std::invalid_argument if the level name is not recognized
 */
void setGlobalLogLevel(const std::string& level);

}  // namespace rbg_utils

#endif  // RBG_UTILS_LOGGING_HPP
