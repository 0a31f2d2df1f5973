#include "tellcore/core/string_encoding.h"

#include "common/logger.h"

#include <boost/locale/encoding.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace tellcore {
namespace core {

namespace {

constexpr const char* kUtf8 = "UTF-8";

bool namesUtf8(const std::string& charset) {
    std::string normalized;
    for (char c : charset) {
        if (c == '-' || c == '_') {
            continue;
        }
        normalized.push_back(
            static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return normalized == "utf8";
}

} // namespace

StringEncoding& StringEncoding::getInstance() {
    static StringEncoding instance;
    return instance;
}

void StringEncoding::setEncoding(const std::string& charset) {
    if (charset.empty() || !isSupported(charset)) {
        throw std::invalid_argument("Unsupported string encoding: " + charset);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    charset_ = charset;
    common::logDebug("Native string encoding set to " + charset,
                     "StringEncoding");
}

std::string StringEncoding::encoding() const { return snapshot(); }

bool StringEncoding::isUtf8() const { return namesUtf8(snapshot()); }

std::string StringEncoding::encode(const std::string& text) const {
    const std::string charset = snapshot();
    if (namesUtf8(charset)) {
        return text;
    }
    try {
        return boost::locale::conv::between(text, charset, kUtf8,
                                            boost::locale::conv::stop);
    } catch (const boost::locale::conv::conversion_error&) {
        throw std::invalid_argument("Text cannot be represented in " + charset);
    }
}

std::string StringEncoding::decode(const std::string& bytes) const {
    const std::string charset = snapshot();
    if (namesUtf8(charset)) {
        return bytes;
    }
    return boost::locale::conv::between(bytes, kUtf8, charset,
                                        boost::locale::conv::skip);
}

bool StringEncoding::isSupported(const std::string& charset) {
    if (namesUtf8(charset)) {
        return true;
    }
    try {
        boost::locale::conv::between("", charset, kUtf8);
        return true;
    } catch (const boost::locale::conv::invalid_charset_error&) {
        return false;
    }
}

std::string StringEncoding::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return charset_;
}

} // namespace core
} // namespace tellcore
