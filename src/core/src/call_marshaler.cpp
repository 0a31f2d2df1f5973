#include "tellcore/core/call_marshaler.h"
#include "tellcore/core/constants.h"
#include "tellcore/core/string_encoding.h"

#include "common/logger.h"

#include <cstring>

namespace tellcore {
namespace core {

TextArg::TextArg(const std::string& text)
    : native_(StringEncoding::getInstance().encode(text)) {}

TextArg::TextArg(const char* text)
    : native_(StringEncoding::getInstance().encode(text ? text : "")) {}

TextArg::TextArg(NativeBytes bytes) : native_(std::move(bytes.data)) {}

int CallMarshaler::checkInteger(int result) const {
    if (result < 0) {
        throw makeError(result);
    }
    return result;
}

void CallMarshaler::checkBoolean(bool result) const {
    if (!result) {
        throw makeError(constants::TELLSTICK_ERROR_DEVICE_NOT_FOUND);
    }
}

std::optional<std::string> CallMarshaler::takeString(char* result) const {
    if (!result) {
        return std::nullopt;
    }
    std::string copy(result);
    if (table_.has(FunctionId::RELEASE_STRING)) {
        table_.get<FunctionId::RELEASE_STRING>()(result);
    } else {
        common::logWarning("tdReleaseString unavailable, string not released",
                           "CallMarshaler");
    }
    return StringEncoding::getInstance().decode(copy);
}

std::string CallMarshaler::errorString(int code) const {
    if (table_.has(FunctionId::GET_ERROR_STRING)) {
        auto description =
            takeString(table_.get<FunctionId::GET_ERROR_STRING>()(code));
        if (description && !description->empty()) {
            return *description;
        }
    }
    return errorCodeDescription(toErrorCode(code));
}

NativeCallError CallMarshaler::makeError(int code) const {
    return NativeCallError(code, errorString(code));
}

std::string CallMarshaler::decodeBuffer(const char* buffer, std::size_t size) {
    const void* terminator = std::memchr(buffer, '\0', size);
    const std::size_t length =
        terminator ? static_cast<const char*>(terminator) - buffer : size;
    return StringEncoding::getInstance().decode(std::string(buffer, length));
}

} // namespace core
} // namespace tellcore
