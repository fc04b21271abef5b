#ifndef HOTSTRING_RULE_SET_H
#define HOTSTRING_RULE_SET_H

#include <hotstring/types.h>
#include <string>

namespace hotstring {

// Turns a configured rule table into resolved rules
class RuleSetBuilder {
public:
    // Applies defaults to every entry and validates it. On failure out is
    // left empty and error describes the first offending entry.
    static Result build(const RuleTable& table, const RuleDefaults& defaults,
                        RuleList& out, std::string& error);

    // Merges one entry's overrides with the defaults
    static RuleFlags resolveFlags(const RuleOptions& options, const RuleDefaults& defaults);
};

} // namespace hotstring

#endif // HOTSTRING_RULE_SET_H
