#include "tellcore/core/library_config.h"
#include "tellcore/core/string_encoding.h"

#include "common/logger.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace tellcore {
namespace core {

namespace {
constexpr const char* kComponent = "LibraryConfig";
}

std::string ConfigValidationResult::toString() const {
    std::ostringstream oss;
    oss << "Validation " << (isValid ? "passed" : "failed");
    if (!errors.empty()) {
        oss << "\nErrors:";
        for (const auto& error : errors) {
            oss << "\n  - " << error;
        }
    }
    if (!warnings.empty()) {
        oss << "\nWarnings:";
        for (const auto& warning : warnings) {
            oss << "\n  - " << warning;
        }
    }
    return oss.str();
}

json LibraryConfig::toJson() const {
    json j;
    j["libraryPath"] = libraryPath;
    j["stringEncoding"] = stringEncoding;
    j["dispatcher"] = dispatcherKindToString(dispatcher);
    j["logLevel"] = logLevel;
    j["logFile"] = logFile;
    return j;
}

void LibraryConfig::fromJson(const json& j) {
    if (j.contains("libraryPath")) {
        libraryPath = j["libraryPath"].get<std::string>();
    }
    if (j.contains("stringEncoding")) {
        stringEncoding = j["stringEncoding"].get<std::string>();
    }
    if (j.contains("dispatcher")) {
        dispatcher = parseDispatcherKind(j["dispatcher"].get<std::string>());
    }
    if (j.contains("logLevel")) {
        logLevel = j["logLevel"].get<std::string>();
    }
    if (j.contains("logFile")) {
        logFile = j["logFile"].get<std::string>();
    }
}

ConfigValidationResult LibraryConfig::validate() const {
    ConfigValidationResult result;

    if (stringEncoding.empty()) {
        result.addError("String encoding cannot be empty");
    } else if (!StringEncoding::isSupported(stringEncoding)) {
        result.addError("Unsupported string encoding: " + stringEncoding);
    }

    try {
        common::parseLogLevel(logLevel);
    } catch (const std::invalid_argument&) {
        result.addError("Invalid log level: " + logLevel);
    }

    if (dispatcher == DispatcherKind::NONE) {
        result.addWarning("No callback dispatcher, event registration disabled");
    }

    return result;
}

bool LibraryConfig::loadFromFile(const std::string& filePath) {
    try {
        std::ifstream file(filePath);
        if (!file.is_open()) {
            common::logError("Cannot open file: " + filePath, kComponent);
            return false;
        }

        json j;
        file >> j;
        fromJson(j);

        common::logInfo("Loaded configuration from " + filePath, kComponent);
        return true;

    } catch (const std::exception& e) {
        common::logError("Failed to load from file " + filePath + ": " + e.what(),
                         kComponent);
        return false;
    }
}

bool LibraryConfig::saveToFile(const std::string& filePath) const {
    try {
        std::ofstream file(filePath);
        if (!file.is_open()) {
            common::logError("Cannot create file: " + filePath, kComponent);
            return false;
        }

        file << toJson().dump(2);
        return true;

    } catch (const std::exception& e) {
        common::logError("Failed to save to file " + filePath + ": " + e.what(),
                         kComponent);
        return false;
    }
}

void LibraryConfig::loadFromEnvironment(const std::string& prefix) {
    if (const char* path = std::getenv((prefix + "LIBRARY_PATH").c_str())) {
        libraryPath = path;
    }
    if (const char* encoding =
            std::getenv((prefix + "STRING_ENCODING").c_str())) {
        stringEncoding = encoding;
    }
    if (const char* kind = std::getenv((prefix + "DISPATCHER").c_str())) {
        dispatcher = parseDispatcherKind(kind);
    }
    if (const char* level = std::getenv((prefix + "LOG_LEVEL").c_str())) {
        logLevel = level;
    }
    if (const char* file = std::getenv((prefix + "LOG_FILE").c_str())) {
        logFile = file;
    }
}

void LibraryConfig::applyLogging() const {
    common::initLogger(logFile, common::parseLogLevel(logLevel));
}

void LibraryConfig::applyEncoding() const {
    StringEncoding::getInstance().setEncoding(stringEncoding);
}

std::shared_ptr<CallbackDispatcher> LibraryConfig::createDispatcher() const {
    switch (dispatcher) {
        case DispatcherKind::DIRECT:
            return std::make_shared<DirectCallbackDispatcher>();
        case DispatcherKind::QUEUED:
            return std::make_shared<QueuedCallbackDispatcher>();
        case DispatcherKind::NONE:
            break;
    }
    return nullptr;
}

bool LibraryConfig::matchesDispatcher(
    const std::shared_ptr<CallbackDispatcher>& existing) const {
    switch (dispatcher) {
        case DispatcherKind::DIRECT:
            return std::dynamic_pointer_cast<DirectCallbackDispatcher>(existing) != nullptr;
        case DispatcherKind::QUEUED:
            return std::dynamic_pointer_cast<QueuedCallbackDispatcher>(existing) != nullptr;
        case DispatcherKind::NONE:
            break;
    }
    return false;
}

std::string LibraryConfig::dispatcherKindToString(DispatcherKind kind) {
    switch (kind) {
        case DispatcherKind::DIRECT:
            return "direct";
        case DispatcherKind::QUEUED:
            return "queued";
        case DispatcherKind::NONE:
            break;
    }
    return "none";
}

LibraryConfig::DispatcherKind
LibraryConfig::parseDispatcherKind(const std::string& name) {
    if (name == "none" || name.empty()) {
        return DispatcherKind::NONE;
    }
    if (name == "direct") {
        return DispatcherKind::DIRECT;
    }
    if (name == "queued") {
        return DispatcherKind::QUEUED;
    }
    throw std::invalid_argument("Unknown dispatcher kind: " + name);
}

} // namespace core
} // namespace tellcore
