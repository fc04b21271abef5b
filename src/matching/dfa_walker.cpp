#include "dfa_walker.h"

namespace hotstring {

DfaWalker::DfaWalker(const Dfa& dfa, bool caseInsensitive, EndCharPredicate isEndChar, size_t historyDepth)
    : MatchEngine(caseInsensitive, std::move(isEndChar), historyDepth)
    , dfa_(dfa) {
}

uint32_t DfaWalker::completionFrom(uint32_t state) const {
    return dfa_.next(state, kCompletionSymbol);
}

uint32_t DfaWalker::transitionFrom(uint32_t state, Symbol symbol, bool isEnd) const {
    StateId next = dfa_.next(state, symbol);
    if (next != kNoState) {
        return next;
    }
    // Nothing continues from here; start over as if from the internal root
    next = dfa_.next(kInternalState, symbol);
    if (next != kNoState) {
        return next;
    }
    return isEnd ? kWordBoundaryState : kInternalState;
}

const Rule* DfaWalker::expansionAt(uint32_t state) const {
    return dfa_.state(state).expansion;
}

} // namespace hotstring
