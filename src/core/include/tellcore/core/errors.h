#pragma once

#include <stdexcept>
#include <string>

namespace tellcore {
namespace core {

/**
 * @brief The closed set of error codes returned by Telldus Core
 */
enum class ErrorCode : int {
    SUCCESS = 0,
    NOT_FOUND = -1,
    PERMISSION_DENIED = -2,
    DEVICE_NOT_FOUND = -3,
    METHOD_NOT_SUPPORTED = -4,
    COMMUNICATION = -5,
    CONNECTING_SERVICE = -6,
    UNKNOWN_RESPONSE = -7,
    SYNTAX = -8,
    BROKEN_PIPE = -9,
    COMMUNICATING_SERVICE = -10,
    CONFIG_SYNTAX = -11,
    UNKNOWN = -99
};

/**
 * @brief Map a raw native code onto the closed set; codes outside it map to
 * ErrorCode::UNKNOWN
 */
ErrorCode toErrorCode(int code);

/**
 * @brief Symbolic name, e.g. "TELLSTICK_ERROR_NOT_FOUND"
 */
std::string errorCodeToString(ErrorCode code);

/**
 * @brief Built-in English description used when the native library cannot
 * provide one
 */
std::string errorCodeDescription(ErrorCode code);

/**
 * @brief Base class of every error raised by the binding
 */
class TellcoreError : public std::runtime_error {
public:
    explicit TellcoreError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief The native module could not be located or loaded
 */
class LoadError : public TellcoreError {
public:
    LoadError(const std::string& libraryName, const std::string& reason);

    const std::string& libraryName() const { return libraryName_; }

private:
    std::string libraryName_;
};

/**
 * @brief A native call reported failure
 *
 * Raised for negative integer results and for false boolean results. The raw
 * code is kept exactly as returned by the native library.
 */
class NativeCallError : public TellcoreError {
public:
    NativeCallError(int code, const std::string& description);

    int code() const { return code_; }
    ErrorCode errorCode() const { return toErrorCode(code_); }
    const std::string& description() const { return description_; }

private:
    int code_;
    std::string description_;
};

/**
 * @brief The loaded native module does not export the requested entry point
 */
class NotSupportedError : public TellcoreError {
public:
    explicit NotSupportedError(const std::string& functionName);

    const std::string& functionName() const { return functionName_; }

private:
    std::string functionName_;
};

/**
 * @brief Misuse of the binding API (double release, conflicting dispatcher,
 * callbacks without a dispatcher)
 */
class ContractViolation : public std::logic_error {
public:
    explicit ContractViolation(const std::string& message)
        : std::logic_error(message) {}
};

} // namespace core
} // namespace tellcore
