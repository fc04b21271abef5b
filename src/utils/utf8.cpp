#include "utf8.h"
#include <cctype>
#include <unicode/uchar.h>

namespace hotstring {
namespace utils {

std::string utf32ToUtf8(char32_t codepoint) {
    std::string result;

    if (codepoint <= 0x7F) {
        // 1-byte sequence
        result.push_back(static_cast<char>(codepoint));
    }
    else if (codepoint <= 0x7FF) {
        // 2-byte sequence
        result.push_back(static_cast<char>(0xC0 | (codepoint >> 6)));
        result.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
    else if (codepoint <= 0xFFFF) {
        // 3-byte sequence
        result.push_back(static_cast<char>(0xE0 | (codepoint >> 12)));
        result.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
    else if (codepoint <= 0x10FFFF) {
        // 4-byte sequence
        result.push_back(static_cast<char>(0xF0 | (codepoint >> 18)));
        result.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        result.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }

    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32) {
    std::string result;
    result.reserve(utf32.size());
    for (char32_t ch : utf32) {
        result += utf32ToUtf8(ch);
    }
    return result;
}

char32_t utf8ToChar32(const std::string& utf8, size_t offset, size_t& bytesConsumed) {
    bytesConsumed = 0;

    if (offset >= utf8.size()) {
        return 0;
    }

    uint8_t byte1 = static_cast<uint8_t>(utf8[offset]);
    size_t sequenceLength = 0;
    char32_t codepoint = 0;
    char32_t minimum = 0;

    if (byte1 <= 0x7F) {
        bytesConsumed = 1;
        return byte1;
    }
    else if ((byte1 & 0xE0) == 0xC0) {
        sequenceLength = 2;
        codepoint = byte1 & 0x1F;
        minimum = 0x80;
    }
    else if ((byte1 & 0xF0) == 0xE0) {
        sequenceLength = 3;
        codepoint = byte1 & 0x0F;
        minimum = 0x800;
    }
    else if ((byte1 & 0xF8) == 0xF0) {
        sequenceLength = 4;
        codepoint = byte1 & 0x07;
        minimum = 0x10000;
    }
    else {
        return 0;  // Invalid first byte
    }

    if (offset + sequenceLength > utf8.size()) {
        return 0;
    }

    for (size_t j = 1; j < sequenceLength; j++) {
        uint8_t contByte = static_cast<uint8_t>(utf8[offset + j]);
        if ((contByte & 0xC0) != 0x80) {
            return 0;  // Invalid continuation byte
        }
        codepoint = (codepoint << 6) | (contByte & 0x3F);
    }

    // Overlong forms, surrogates and out-of-range values
    if (codepoint < minimum || codepoint > 0x10FFFF ||
        (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
        return 0;
    }

    bytesConsumed = sequenceLength;
    return codepoint;
}

bool utf8ToUtf32(const std::string& utf8, std::u32string& out) {
    out.clear();
    std::u32string result;
    result.reserve(utf8.size());

    size_t i = 0;
    while (i < utf8.size()) {
        size_t consumed = 0;
        char32_t ch = utf8ToChar32(utf8, i, consumed);
        if (consumed == 0) {
            return false;
        }
        result.push_back(ch);
        i += consumed;
    }

    out = std::move(result);
    return true;
}

bool isValidUtf8(const std::string& utf8) {
    size_t i = 0;

    while (i < utf8.size()) {
        size_t consumed = 0;
        utf8ToChar32(utf8, i, consumed);
        if (consumed == 0) {
            return false;
        }
        i += consumed;
    }

    return true;
}

char32_t toLower(char32_t ch) {
    if (ch > 0x10FFFF) {
        return ch;
    }
    return static_cast<char32_t>(u_tolower(static_cast<UChar32>(ch)));
}

char32_t toUpper(char32_t ch) {
    if (ch > 0x10FFFF) {
        return ch;
    }
    return static_cast<char32_t>(u_toupper(static_cast<UChar32>(ch)));
}

std::u32string toLower(const std::u32string& text) {
    std::u32string result(text);
    for (auto& ch : result) {
        ch = toLower(ch);
    }
    return result;
}

std::u32string toUpper(const std::u32string& text) {
    std::u32string result(text);
    for (auto& ch : result) {
        ch = toUpper(ch);
    }
    return result;
}

bool isEndCharacter(char32_t ch) {
    // ASCII symbols such as '@', '+' and '~' count as punctuation too
    if (ch < 0x80) {
        int c = static_cast<int>(ch);
        return std::isspace(c) || std::ispunct(c);
    }
    if (ch > 0x10FFFF) {
        return false;
    }
    UChar32 c = static_cast<UChar32>(ch);
    return u_isUWhiteSpace(c) || u_ispunct(c);
}

} // namespace utils
} // namespace hotstring
