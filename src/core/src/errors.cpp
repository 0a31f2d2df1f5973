#include "tellcore/core/errors.h"

namespace tellcore {
namespace core {

ErrorCode toErrorCode(int code) {
    switch (code) {
        case 0:
        case -1:
        case -2:
        case -3:
        case -4:
        case -5:
        case -6:
        case -7:
        case -8:
        case -9:
        case -10:
        case -11:
        case -99:
            return static_cast<ErrorCode>(code);
        default:
            return ErrorCode::UNKNOWN;
    }
}

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:
            return "TELLSTICK_SUCCESS";
        case ErrorCode::NOT_FOUND:
            return "TELLSTICK_ERROR_NOT_FOUND";
        case ErrorCode::PERMISSION_DENIED:
            return "TELLSTICK_ERROR_PERMISSION_DENIED";
        case ErrorCode::DEVICE_NOT_FOUND:
            return "TELLSTICK_ERROR_DEVICE_NOT_FOUND";
        case ErrorCode::METHOD_NOT_SUPPORTED:
            return "TELLSTICK_ERROR_METHOD_NOT_SUPPORTED";
        case ErrorCode::COMMUNICATION:
            return "TELLSTICK_ERROR_COMMUNICATION";
        case ErrorCode::CONNECTING_SERVICE:
            return "TELLSTICK_ERROR_CONNECTING_SERVICE";
        case ErrorCode::UNKNOWN_RESPONSE:
            return "TELLSTICK_ERROR_UNKNOWN_RESPONSE";
        case ErrorCode::SYNTAX:
            return "TELLSTICK_ERROR_SYNTAX";
        case ErrorCode::BROKEN_PIPE:
            return "TELLSTICK_ERROR_BROKEN_PIPE";
        case ErrorCode::COMMUNICATING_SERVICE:
            return "TELLSTICK_ERROR_COMMUNICATING_SERVICE";
        case ErrorCode::CONFIG_SYNTAX:
            return "TELLSTICK_ERROR_CONFIG_SYNTAX";
        case ErrorCode::UNKNOWN:
        default:
            return "TELLSTICK_ERROR_UNKNOWN";
    }
}

std::string errorCodeDescription(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:
            return "Success";
        case ErrorCode::NOT_FOUND:
            return "TellStick not found";
        case ErrorCode::PERMISSION_DENIED:
            return "Permission denied";
        case ErrorCode::DEVICE_NOT_FOUND:
            return "Device not found";
        case ErrorCode::METHOD_NOT_SUPPORTED:
            return "The method you tried to use is not supported by the device";
        case ErrorCode::COMMUNICATION:
            return "An error occurred while communicating with TellStick";
        case ErrorCode::CONNECTING_SERVICE:
            return "Could not connect to the Telldus Service";
        case ErrorCode::UNKNOWN_RESPONSE:
            return "Received an unknown response";
        case ErrorCode::SYNTAX:
            return "Syntax error";
        case ErrorCode::BROKEN_PIPE:
            return "Broken pipe";
        case ErrorCode::COMMUNICATING_SERVICE:
            return "An error occurred while communicating with the Telldus Service";
        case ErrorCode::CONFIG_SYNTAX:
            return "Syntax error in the configuration file";
        case ErrorCode::UNKNOWN:
        default:
            return "Unknown error";
    }
}

LoadError::LoadError(const std::string& libraryName, const std::string& reason)
    : TellcoreError("Failed to load " + libraryName + ": " + reason),
      libraryName_(libraryName) {}

NativeCallError::NativeCallError(int code, const std::string& description)
    : TellcoreError(description + " (" + std::to_string(code) + ")"),
      code_(code), description_(description) {}

NotSupportedError::NotSupportedError(const std::string& functionName)
    : TellcoreError(functionName +
                    " is not supported by the loaded Telldus Core library"),
      functionName_(functionName) {}

} // namespace core
} // namespace tellcore
