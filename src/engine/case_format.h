#ifndef HOTSTRING_CASE_FORMAT_H
#define HOTSTRING_CASE_FORMAT_H

#include <string>

namespace hotstring {

// Adapts an expansion to the capitalization of the typed abbreviation:
//   "btw" -> unchanged, "Btw" or "BTw" -> first letter upper-cased,
//   "BTW" -> whole output upper-cased.
// Only characters that have case in the typed text count; a lone upper-case
// letter capitalizes the first letter only.
std::u32string matchCase(const std::u32string& typed, const std::u32string& output);

} // namespace hotstring

#endif // HOTSTRING_CASE_FORMAT_H
