#ifndef HOTSTRING_DFA_WALKER_H
#define HOTSTRING_DFA_WALKER_H

#include "match_engine.h"
#include "../automaton/dfa.h"

namespace hotstring {

// Walks a precompiled automaton; each step is one or two table lookups
class DfaWalker : public MatchEngine {
public:
    DfaWalker(const Dfa& dfa, bool caseInsensitive, EndCharPredicate isEndChar, size_t historyDepth);

protected:
    uint32_t completionFrom(uint32_t state) const override;
    uint32_t transitionFrom(uint32_t state, Symbol symbol, bool isEnd) const override;
    const Rule* expansionAt(uint32_t state) const override;

private:
    const Dfa& dfa_;
};

} // namespace hotstring

#endif // HOTSTRING_DFA_WALKER_H
