#include "priority.h"
#include "../utils/debug.h"
#include "../utils/utf8.h"
#include <algorithm>

namespace hotstring {

bool takesPriorityOver(const Rule& lhs, const Rule& rhs, bool* ambiguous) {
    if (ambiguous) {
        *ambiguous = false;
    }
    if (&lhs == &rhs) {
        return false;
    }

    if (lhs.priority != rhs.priority) {
        return lhs.priority > rhs.priority;
    }
    if (lhs.abbreviation.size() != rhs.abbreviation.size()) {
        return lhs.abbreviation.size() > rhs.abbreviation.size();
    }
    // Word-boundary abbreviations are more specific than internal ones
    if (lhs.flags.internal != rhs.flags.internal) {
        return !lhs.flags.internal;
    }
    if (lhs.flags.caseSensitive != rhs.flags.caseSensitive) {
        return lhs.flags.caseSensitive;
    }

    if (ambiguous) {
        *ambiguous = true;
    }
    if (lhs.abbreviation != rhs.abbreviation) {
        return lhs.abbreviation < rhs.abbreviation;
    }
    return lhs.id < rhs.id;
}

void ConflictLog::report(const Rule& winner, const Rule& loser) {
    auto key = std::make_pair(std::min(winner.id, loser.id), std::max(winner.id, loser.id));
    if (!seen_.insert(key).second) {
        return;
    }

    std::string message = "ambiguous priority between \"" +
        utils::utf32ToUtf8(winner.abbreviation) + "\" and \"" +
        utils::utf32ToUtf8(loser.abbreviation) + "\"; using \"" +
        utils::utf32ToUtf8(winner.abbreviation) + "\" (rule " +
        std::to_string(winner.id) + ")";
    utils::warningLog(message);
    messages_.push_back(message);
}

void ConflictLog::clear() {
    seen_.clear();
    messages_.clear();
}

const Rule* bestOf(const Rule* current, const Rule* candidate, ConflictLog* conflicts) {
    if (!current) return candidate;
    if (!candidate || candidate == current) return current;

    bool ambiguous = false;
    bool better = takesPriorityOver(*candidate, *current, &ambiguous);
    const Rule* winner = better ? candidate : current;
    if (ambiguous && conflicts) {
        conflicts->report(*winner, better ? *current : *candidate);
    }
    return winner;
}

const Rule* bestOf(const std::vector<const Rule*>& candidates, ConflictLog* conflicts) {
    const Rule* best = nullptr;
    for (const Rule* rule : candidates) {
        best = bestOf(best, rule, conflicts);
    }
    return best;
}

} // namespace hotstring
