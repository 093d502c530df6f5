#ifndef MCPHUB_UTILS_LOGGING_HPP_
#define MCPHUB_UTILS_LOGGING_HPP_

#include <functional>
#include <string>

namespace mcphub {
namespace logging {

/**
 * @brief Log levels
 */
enum class Level { Trace, Debug, Info, Warning, Error, Fatal };

/**
 * @brief Convert a log level to a string
 *
 * @param level The log level
 * @return std::string The string representation
 */
std::string levelToString(Level level);

/**
 * @brief Parse a log level from a string
 *
 * @param level_str The string representation
 * @return Level The log level
 * @throws std::invalid_argument if the string is not a valid log level
 */
Level levelFromString(const std::string &level_str);

/**
 * @brief Map a protocol logging level onto a local level
 *
 * Protocol levels follow syslog severities (debug, info, notice, warning,
 * error, critical, alert, emergency). Unknown names map to Info.
 *
 * @param protocol_level The level carried by a notifications/message
 * @return Level The local log level
 */
Level levelFromProtocol(const std::string &protocol_level);

/**
 * @brief Log handler function type
 */
using LogHandler = std::function<void(Level level, const std::string &message,
                                      const std::string &file, int line)>;

/**
 * @brief Set the global log level
 */
void setLevel(Level level);

/**
 * @brief Get the global log level
 */
Level getLevel();

/**
 * @brief Set the global log handler
 *
 * @param handler The log handler, or nullptr to restore the default
 */
void setHandler(LogHandler handler);

/**
 * @brief Log a message
 *
 * @param level The log level
 * @param message The log message
 * @param file The source file
 * @param line The source line
 */
void log(Level level, const std::string &message, const std::string &file = "",
         int line = 0);

/**
 * @brief Check if a log level is enabled
 */
bool isEnabled(Level level);

/**
 * @brief Default log handler that logs to stderr
 */
void defaultHandler(Level level, const std::string &message,
                    const std::string &file, int line);

} // namespace logging
} // namespace mcphub

#define MCPHUB_LOG_AT(lvl, msg)                                                \
  do {                                                                         \
    if (mcphub::logging::isEnabled(lvl)) {                                     \
      mcphub::logging::log(lvl, msg, __FILE__, __LINE__);                      \
    }                                                                          \
  } while (0)

#define MCPHUB_LOG_TRACE(msg)                                                  \
  MCPHUB_LOG_AT(mcphub::logging::Level::Trace, msg)
#define MCPHUB_LOG_DEBUG(msg)                                                  \
  MCPHUB_LOG_AT(mcphub::logging::Level::Debug, msg)
#define MCPHUB_LOG_INFO(msg) MCPHUB_LOG_AT(mcphub::logging::Level::Info, msg)
#define MCPHUB_LOG_WARNING(msg)                                                \
  MCPHUB_LOG_AT(mcphub::logging::Level::Warning, msg)
#define MCPHUB_LOG_ERROR(msg)                                                  \
  MCPHUB_LOG_AT(mcphub::logging::Level::Error, msg)
#define MCPHUB_LOG_FATAL(msg)                                                  \
  MCPHUB_LOG_AT(mcphub::logging::Level::Fatal, msg)

#endif // MCPHUB_UTILS_LOGGING_HPP_
