#pragma once

#include <mutex>
#include <string>

namespace tellcore {
namespace core {

/**
 * @brief Process-wide text encoding used at the native boundary
 *
 * Consumer text is always UTF-8. Strings are converted to this encoding before
 * they are handed to Telldus Core, and strings coming back are converted from
 * it. The default is "utf-8", in which case no conversion takes place.
 */
class StringEncoding {
public:
    static StringEncoding& getInstance();

    /**
     * @brief Select the native encoding
     * @param charset Any charset name understood by Boost.Locale
     * @throws std::invalid_argument if the charset is not supported
     */
    void setEncoding(const std::string& charset);

    std::string encoding() const;

    bool isUtf8() const;

    /**
     * @brief UTF-8 text to native bytes
     * @throws std::invalid_argument if the text cannot be represented
     */
    std::string encode(const std::string& text) const;

    /**
     * @brief Native bytes to UTF-8 text; invalid sequences are skipped
     */
    std::string decode(const std::string& bytes) const;

    /**
     * @brief Check whether Boost.Locale can convert to and from a charset
     */
    static bool isSupported(const std::string& charset);

private:
    StringEncoding() = default;
    StringEncoding(const StringEncoding&) = delete;
    StringEncoding& operator=(const StringEncoding&) = delete;

    std::string snapshot() const;

    mutable std::mutex mutex_;
    std::string charset_ = "utf-8";
};

} // namespace core
} // namespace tellcore
