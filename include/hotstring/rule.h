#ifndef HOTSTRING_RULE_H
#define HOTSTRING_RULE_H

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hotstring {

// Produces the expansion text (UTF-8) at the moment the rule fires
using OutputCallback = std::function<std::string()>;

// Static expansion text (UTF-8) or a callback evaluated when triggered
using RuleOutput = std::variant<std::string, OutputCallback>;

// Per-rule behaviour flags
struct RuleFlags {
    bool backspace = true;             // Erase the typed abbreviation first
    bool caseSensitive = false;        // Match the abbreviation case exactly
    bool internal = false;             // May fire in the middle of a word
    bool matchCase = true;             // Adapt output case to the typed trigger
    bool resetRecognizer = false;      // Forget everything typed after firing
    bool sendCompletionKey = true;     // Retype the key that completed the match
    bool waitForCompletionKey = true;  // Fire only after an end character
};

// Defaults applied to every option a rule does not set itself
struct RuleDefaults {
    RuleFlags flags;
    int priority = 0;
};

// Optional per-rule overrides
struct RuleOptions {
    std::optional<bool> backspace;
    std::optional<bool> caseSensitive;
    std::optional<bool> internal;
    std::optional<bool> matchCase;
    std::optional<bool> resetRecognizer;
    std::optional<bool> sendCompletionKey;
    std::optional<bool> waitForCompletionKey;
    std::optional<int> priority;
};

// Configured value of one abbreviation in a rule table
struct RuleConfig {
    RuleOutput output;
    RuleOptions options;

    RuleConfig() : output(std::string()) {}
    RuleConfig(const std::string& text) : output(text) {}
    RuleConfig(const char* text) : output(std::string(text)) {}
    RuleConfig(OutputCallback callback) : output(std::move(callback)) {}
    RuleConfig(RuleOutput out, const RuleOptions& opts)
        : output(std::move(out)), options(opts) {}
};

// Abbreviation (UTF-8) -> configuration
using RuleTable = std::map<std::string, RuleConfig>;

// A fully resolved expansion rule
struct Rule {
    size_t id = 0;                  // Position in the rule set
    std::u32string abbreviation;    // As configured (not case folded)
    RuleOutput output;
    RuleFlags flags;
    int priority = 0;

    // Evaluates the output; callbacks may throw
    std::string evaluate() const;
};

using RulePtr = std::shared_ptr<const Rule>;
using RuleList = std::vector<RulePtr>;

// Strict priority order between two rules. When neither rule is preferred
// by any visible attribute, *ambiguous is set and the abbreviation text and
// rule id decide.
bool takesPriorityOver(const Rule& lhs, const Rule& rhs, bool* ambiguous = nullptr);

} // namespace hotstring

#endif // HOTSTRING_RULE_H
