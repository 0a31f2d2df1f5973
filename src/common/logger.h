#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace tellcore {
namespace common {

/**
 * @brief Log levels for the binding
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,  // Not ERROR, which collides with a Windows macro
    CRITICAL = 5,
    OFF = 6
};

/**
 * @brief Initialize the logger with console output and an optional file sink
 * @param filename Log file name, empty for console only
 * @param level Log level
 */
void initLogger(const std::string& filename, LogLevel level);

/**
 * @brief Change the level of the active logger
 */
void setLogLevel(LogLevel level);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error",
 * "critical", "off"), case-insensitive
 * @throws std::invalid_argument for unknown names
 */
LogLevel parseLogLevel(const std::string& name);

std::string logLevelToString(LogLevel level);

/**
 * @brief The logger used by the binding; falls back to the spdlog default
 */
std::shared_ptr<spdlog::logger> getLogger();

void logTrace(const std::string& message, const std::string& component = "");
void logDebug(const std::string& message, const std::string& component = "");
void logInfo(const std::string& message, const std::string& component = "");
void logWarning(const std::string& message, const std::string& component = "");
void logError(const std::string& message, const std::string& component = "");
void logCritical(const std::string& message, const std::string& component = "");

} // namespace common
} // namespace tellcore
