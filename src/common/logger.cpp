#include "logger.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <vector>

namespace tellcore {
namespace common {

namespace {

std::mutex g_loggerMutex;
std::shared_ptr<spdlog::logger> g_logger;

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE:
            return spdlog::level::trace;
        case LogLevel::DEBUG:
            return spdlog::level::debug;
        case LogLevel::INFO:
            return spdlog::level::info;
        case LogLevel::WARN:
            return spdlog::level::warn;
        case LogLevel::ERR:
            return spdlog::level::err;
        case LogLevel::CRITICAL:
            return spdlog::level::critical;
        case LogLevel::OFF:
            return spdlog::level::off;
        default:
            return spdlog::level::info;
    }
}

std::string tagged(const std::string& message, const std::string& component) {
    return component.empty() ? message : "[" + component + "] " + message;
}

} // namespace

void initLogger(const std::string& filename, LogLevel level) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (!filename.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, true));
        }

        auto logger = std::make_shared<spdlog::logger>("tellcore", sinks.begin(), sinks.end());
        logger->set_level(toSpdlogLevel(level));
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");

        std::lock_guard<std::mutex> lock(g_loggerMutex);
        g_logger = logger;
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void setLogLevel(LogLevel level) {
    getLogger()->set_level(toSpdlogLevel(level));
}

LogLevel parseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error" || lower == "err") return LogLevel::ERR;
    if (lower == "critical") return LogLevel::CRITICAL;
    if (lower == "off") return LogLevel::OFF;
    throw std::invalid_argument("Invalid log level: " + name);
}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERR: return "error";
        case LogLevel::CRITICAL: return "critical";
        case LogLevel::OFF: return "off";
        default: return "info";
    }
}

std::shared_ptr<spdlog::logger> getLogger() {
    std::lock_guard<std::mutex> lock(g_loggerMutex);
    if (g_logger) {
        return g_logger;
    }
    return spdlog::default_logger();
}

void logTrace(const std::string& message, const std::string& component) {
    getLogger()->trace(tagged(message, component));
}

void logDebug(const std::string& message, const std::string& component) {
    getLogger()->debug(tagged(message, component));
}

void logInfo(const std::string& message, const std::string& component) {
    getLogger()->info(tagged(message, component));
}

void logWarning(const std::string& message, const std::string& component) {
    getLogger()->warn(tagged(message, component));
}

void logError(const std::string& message, const std::string& component) {
    getLogger()->error(tagged(message, component));
}

void logCritical(const std::string& message, const std::string& component) {
    getLogger()->critical(tagged(message, component));
}

} // namespace common
} // namespace tellcore
