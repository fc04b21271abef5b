#include "match_engine.h"
#include "../utils/debug.h"
#include "../utils/utf8.h"

namespace hotstring {

MatchEngine::MatchEngine(bool caseInsensitive, EndCharPredicate isEndChar, size_t historyDepth)
    : caseInsensitive_(caseInsensitive)
    , isEndChar_(std::move(isEndChar))
    , history_(historyDepth)
    , current_(kStartState)
    , completionPending_(false) {
}

const Rule* MatchEngine::followEdge(char32_t ch) {
    // A completed match restarts at a word boundary without its own undo step
    if (completionPending_) {
        completionPending_ = false;
        current_ = kStartState;
    }

    if (caseInsensitive_) {
        ch = utils::toLower(ch);
    }
    bool isEnd = isEndChar_(ch);

    Step step;
    uint32_t completion = isEnd ? completionFrom(current_) : 0;
    if (completion != 0) {
        step.state = completion;
        step.completion = true;
    } else {
        step.state = transitionFrom(current_, static_cast<Symbol>(ch), isEnd);
    }

    utils::debugLog("edge " + std::to_string(current_) + " -" + utils::describeCharacter(ch) +
                    "-> " + std::to_string(step.state) + (step.completion ? " (complete)" : ""));

    history_.push(step);
    current_ = step.state;
    completionPending_ = step.completion;
    return expansionAt(current_);
}

void MatchEngine::rewind() {
    if (!history_.pop()) {
        return;
    }
    auto previous = history_.head();
    current_ = previous ? previous->state : kStartState;
    completionPending_ = previous ? previous->completion : false;
}

void MatchEngine::reset() {
    history_.clear();
    current_ = kStartState;
    completionPending_ = false;
}

} // namespace hotstring
