#pragma once

#include "tellcore/core/callback_dispatcher.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace tellcore {
namespace core {

using json = nlohmann::json;

/**
 * @brief Configuration validation result
 */
struct ConfigValidationResult {
    bool isValid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void addError(const std::string& error) {
        errors.push_back(error);
        isValid = false;
    }

    void addWarning(const std::string& warning) {
        warnings.push_back(warning);
    }

    std::string toString() const;
};

/**
 * @brief Settings used to bring up a Library
 */
struct LibraryConfig {
    enum class DispatcherKind {
        NONE,   ///< callbacks unavailable
        DIRECT, ///< run on the native callback thread
        QUEUED  ///< queued until the consumer processes them
    };

    /// Library file name or path; empty selects the platform default
    std::string libraryPath;
    std::string stringEncoding = "utf-8";
    DispatcherKind dispatcher = DispatcherKind::NONE;
    std::string logLevel = "info";
    std::string logFile;

    json toJson() const;

    /**
     * @throws std::invalid_argument for an unknown dispatcher kind
     * @throws nlohmann::json::exception for values of the wrong type
     */
    void fromJson(const json& j);

    ConfigValidationResult validate() const;

    bool loadFromFile(const std::string& filePath);
    bool saveToFile(const std::string& filePath) const;

    /**
     * @brief Override settings from PREFIX_LIBRARY_PATH, PREFIX_STRING_ENCODING,
     * PREFIX_DISPATCHER, PREFIX_LOG_LEVEL and PREFIX_LOG_FILE
     */
    void loadFromEnvironment(const std::string& prefix = "TELLCORE_");

    /**
     * @brief Initialise the binding logger from logLevel and logFile
     */
    void applyLogging() const;

    /**
     * @brief Make stringEncoding the process-wide native encoding
     */
    void applyEncoding() const;

    /**
     * @brief Dispatcher matching the configured kind, nullptr for NONE
     */
    std::shared_ptr<CallbackDispatcher> createDispatcher() const;

    /**
     * @brief Whether an existing dispatcher is of the configured kind
     */
    bool matchesDispatcher(const std::shared_ptr<CallbackDispatcher>& existing) const;

    static std::string dispatcherKindToString(DispatcherKind kind);

    /**
     * @throws std::invalid_argument for unknown names
     */
    static DispatcherKind parseDispatcherKind(const std::string& name);
};

} // namespace core
} // namespace tellcore
