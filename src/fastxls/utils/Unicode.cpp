#include "fastxls/utils/Unicode.hpp"
#include "fastxls/core/Exception.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utf8.h>

namespace fastxls {
namespace utils {

std::u16string utf8ToUtf16(const std::string& utf8) {
    std::u16string result;
    try {
        utf8::utf8to16(utf8.begin(), utf8.end(), std::back_inserter(result));
    } catch (const utf8::exception& e) {
        FASTXLS_THROW(core::FormatException, std::string("Invalid UTF-8 text: ") + e.what());
    }
    return result;
}

std::string utf16ToUtf8(const std::u16string& utf16) {
    std::string result;
    try {
        utf8::utf16to8(utf16.begin(), utf16.end(), std::back_inserter(result));
    } catch (const utf8::exception& e) {
        FASTXLS_THROW(core::FormatException, std::string("Invalid UTF-16 text: ") + e.what());
    }
    return result;
}

bool isValidUtf8(const std::string& text) {
    return utf8::is_valid(text.begin(), text.end());
}

bool isLatin1(const std::u16string& text) {
    return std::all_of(text.begin(), text.end(), [](char16_t c) { return c <= 0xFF; });
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) != std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string toUpperAscii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

} // namespace utils
} // namespace fastxls
