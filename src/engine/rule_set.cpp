#include "rule_set.h"
#include "../utils/utf8.h"

namespace hotstring {

std::string Rule::evaluate() const {
    if (const auto* text = std::get_if<std::string>(&output)) {
        return *text;
    }
    return std::get<OutputCallback>(output)();
}

RuleFlags RuleSetBuilder::resolveFlags(const RuleOptions& options, const RuleDefaults& defaults) {
    RuleFlags flags = defaults.flags;
    flags.backspace = options.backspace.value_or(flags.backspace);
    flags.caseSensitive = options.caseSensitive.value_or(flags.caseSensitive);
    flags.internal = options.internal.value_or(flags.internal);
    flags.matchCase = options.matchCase.value_or(flags.matchCase);
    flags.resetRecognizer = options.resetRecognizer.value_or(flags.resetRecognizer);
    flags.sendCompletionKey = options.sendCompletionKey.value_or(flags.sendCompletionKey);
    flags.waitForCompletionKey = options.waitForCompletionKey.value_or(flags.waitForCompletionKey);
    return flags;
}

Result RuleSetBuilder::build(const RuleTable& table, const RuleDefaults& defaults,
                             RuleList& out, std::string& error) {
    out.clear();
    RuleList rules;
    rules.reserve(table.size());

    for (const auto& entry : table) {
        const std::string& abbreviation = entry.first;
        const RuleConfig& config = entry.second;

        if (abbreviation.empty()) {
            error = "empty abbreviation";
            return Result::ErrorInvalidRule;
        }

        auto rule = std::make_shared<Rule>();
        if (!utils::utf8ToUtf32(abbreviation, rule->abbreviation)) {
            error = "abbreviation is not valid UTF-8";
            return Result::ErrorUtf8Conversion;
        }

        if (const auto* text = std::get_if<std::string>(&config.output)) {
            if (!utils::isValidUtf8(*text)) {
                error = "output of \"" + abbreviation + "\" is not valid UTF-8";
                return Result::ErrorUtf8Conversion;
            }
        } else if (!std::get<OutputCallback>(config.output)) {
            error = "output callback of \"" + abbreviation + "\" is empty";
            return Result::ErrorInvalidRule;
        }

        rule->id = rules.size();
        rule->output = config.output;
        rule->flags = resolveFlags(config.options, defaults);
        rule->priority = config.options.priority.value_or(defaults.priority);
        rules.push_back(std::move(rule));
    }

    out = std::move(rules);
    return Result::Success;
}

} // namespace hotstring
