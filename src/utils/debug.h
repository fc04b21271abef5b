#ifndef HOTSTRING_DEBUG_H
#define HOTSTRING_DEBUG_H

#include <string>

namespace hotstring {
namespace utils {

// Debug logging (only active in debug builds)
void debugLog(const std::string& message);

// Warnings about configuration and callbacks (always active)
void warningLog(const std::string& message);

// Printable form of a code point for log lines, e.g. "a" or "U+0020"
std::string describeCharacter(char32_t ch);

} // namespace utils
} // namespace hotstring

#endif // HOTSTRING_DEBUG_H
