#ifndef HOTSTRING_UTF8_H
#define HOTSTRING_UTF8_H

#include <string>
#include <cstdint>

namespace hotstring {
namespace utils {

// UTF-32 <-> UTF-8 conversions
std::string utf32ToUtf8(char32_t codepoint);
std::string utf32ToUtf8(const std::u32string& utf32);

// Decodes a whole string; returns false (and leaves out empty) on malformed input
bool utf8ToUtf32(const std::string& utf8, std::u32string& out);

// Decodes one code point starting at offset; bytesConsumed is 0 when malformed
char32_t utf8ToChar32(const std::string& utf8, size_t offset, size_t& bytesConsumed);

// UTF-8 string utilities
bool isValidUtf8(const std::string& utf8);

// Simple Unicode case mapping per code point (no multi-character mappings)
char32_t toLower(char32_t ch);
char32_t toUpper(char32_t ch);
std::u32string toLower(const std::u32string& text);
std::u32string toUpper(const std::u32string& text);

inline bool isUpper(char32_t ch) {
    return toLower(ch) != ch;
}

inline bool isLower(char32_t ch) {
    return toUpper(ch) != ch;
}

// Characters whose case can change
inline bool isCaseable(char32_t ch) {
    return isUpper(ch) || isLower(ch);
}

// Unicode whitespace or punctuation, plus every ASCII punctuation character
bool isEndCharacter(char32_t ch);

} // namespace utils
} // namespace hotstring

#endif // HOTSTRING_UTF8_H
