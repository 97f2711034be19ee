#ifndef DEVMUX_UTILS_LOGGING_HPP
#define DEVMUX_UTILS_LOGGING_HPP

#include <memory>
#include <spdlog/spdlog.h>

// Logging macros forward to the shared "devmux" spdlog logger.
// Arguments use fmt syntax: DEVMUX_LOG_INFO("device {} ready", id);
#define DEVMUX_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::devmux::utils::logger(), __VA_ARGS__)
#define DEVMUX_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::devmux::utils::logger(), __VA_ARGS__)
#define DEVMUX_LOG_INFO(...)  SPDLOG_LOGGER_INFO(::devmux::utils::logger(), __VA_ARGS__)
#define DEVMUX_LOG_WARN(...)  SPDLOG_LOGGER_WARN(::devmux::utils::logger(), __VA_ARGS__)
#define DEVMUX_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::devmux::utils::logger(), __VA_ARGS__)

namespace devmux {
namespace utils {

/**
 * @brief Returns the library logger, creating it on first use.
 *
 * The logger writes to stderr. Applications that want a different sink can
 * register their own spdlog logger named "devmux" before the first call.
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Sets the minimum level emitted by the library logger.
 */
void setLogLevel(spdlog::level::level_enum level);

} // namespace utils
} // namespace devmux

#endif // DEVMUX_UTILS_LOGGING_HPP
