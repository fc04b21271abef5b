#include "debug.h"
#include "utf8.h"
#include <iostream>
#include <sstream>
#include <iomanip>

namespace hotstring {
namespace utils {

void debugLog(const std::string& message) {
#ifdef HOTSTRING_DEBUG
    std::cerr << "[Hotstring] " << message << std::endl;
#endif
}

void warningLog(const std::string& message) {
    std::cerr << "[Hotstring] warning: " << message << std::endl;
}

std::string describeCharacter(char32_t ch) {
    if (ch > 0x20 && ch < 0x7F) {
        return std::string(1, static_cast<char>(ch));
    }
    if (ch > 0x7F && ch <= 0x10FFFF && !isEndCharacter(ch)) {
        return utf32ToUtf8(ch);
    }

    std::stringstream ss;
    ss << "U+" << std::uppercase << std::setfill('0') << std::setw(4) << std::hex
       << static_cast<uint32_t>(ch);
    return ss.str();
}

} // namespace utils
} // namespace hotstring
