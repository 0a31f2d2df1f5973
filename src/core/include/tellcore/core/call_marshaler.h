#pragma once

#include "tellcore/core/function_table.h"

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace tellcore {
namespace core {

/// Size of the protocol, model and value buffers passed to tdSensor and
/// tdSensorValue.
constexpr int kSensorBufferSize = 20;

/// Size of the name and value buffers passed to tdController and
/// tdControllerValue.
constexpr int kControllerBufferSize = 255;

/**
 * @brief Text that is already in the native encoding and must be passed on
 * unchanged
 */
struct NativeBytes {
    std::string data;
};

/**
 * @brief A text parameter of a native call
 *
 * Built from UTF-8 text, which is converted to the configured native encoding,
 * or from NativeBytes, which are passed verbatim.
 */
class TextArg {
public:
    TextArg(const std::string& text);
    TextArg(const char* text);
    TextArg(NativeBytes bytes);

    const char* c_str() const { return native_.c_str(); }
    const std::string& native() const { return native_; }

private:
    std::string native_;
};

/**
 * @brief Applies the error and ownership policies of the function table to
 * individual native calls
 */
class CallMarshaler {
public:
    explicit CallMarshaler(const FunctionTable& table) : table_(table) {}

    /**
     * @brief Call an entry point and post-process its result
     *
     * Integer results are checked and returned, boolean results are checked,
     * string results are copied, released and returned as an optional (empty
     * for a null pointer).
     *
     * @throws NotSupportedError if the entry point is not bound
     * @throws NativeCallError if the result signals an error
     */
    template <FunctionId Id, typename... Args>
    auto invoke(Args&&... args) const {
        auto function = table_.get<Id>();
        using Result = decltype(function(std::forward<Args>(args)...));
        if constexpr (std::is_void<Result>::value) {
            function(std::forward<Args>(args)...);
        } else if constexpr (std::is_same<Result, bool>::value) {
            checkBoolean(function(std::forward<Args>(args)...));
        } else if constexpr (std::is_same<Result, char*>::value) {
            return takeString(function(std::forward<Args>(args)...));
        } else {
            return checkInteger(function(std::forward<Args>(args)...));
        }
    }

    /**
     * @brief Integer policy
     * @return The result if non-negative
     * @throws NativeCallError carrying the result if negative
     */
    int checkInteger(int result) const;

    /**
     * @brief Boolean policy
     * @throws NativeCallError(TELLSTICK_ERROR_DEVICE_NOT_FOUND) on false
     */
    void checkBoolean(bool result) const;

    /**
     * @brief String policy: copy out, release exactly once, decode
     */
    std::optional<std::string> takeString(char* result) const;

    /**
     * @brief Error description from tdGetErrorString, or the built-in one when
     * the library cannot provide it
     */
    std::string errorString(int code) const;

    /**
     * @brief Build the exception for a native error code
     */
    NativeCallError makeError(int code) const;

    /**
     * @brief Decode a NUL terminated output buffer back to UTF-8
     */
    static std::string decodeBuffer(const char* buffer, std::size_t size);

    const FunctionTable& table() const { return table_; }

private:
    const FunctionTable& table_;
};

} // namespace core
} // namespace tellcore
