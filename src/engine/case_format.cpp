#include "case_format.h"
#include "../utils/utf8.h"

namespace hotstring {

std::u32string matchCase(const std::u32string& typed, const std::u32string& output) {
    size_t caseable = 0;
    size_t upper = 0;
    bool firstIsUpper = false;

    for (char32_t ch : typed) {
        if (!utils::isCaseable(ch)) {
            continue;
        }
        if (caseable == 0) {
            firstIsUpper = utils::isUpper(ch);
        }
        ++caseable;
        if (utils::isUpper(ch)) {
            ++upper;
        }
    }

    if (caseable == 0 || !firstIsUpper || output.empty()) {
        return output;
    }
    if (caseable > 1 && upper == caseable) {
        return utils::toUpper(output);
    }

    std::u32string result(output);
    result[0] = utils::toUpper(result[0]);
    return result;
}

} // namespace hotstring
