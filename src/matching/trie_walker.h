#ifndef HOTSTRING_TRIE_WALKER_H
#define HOTSTRING_TRIE_WALKER_H

#include "match_engine.h"
#include "../automaton/trie.h"

namespace hotstring {

// Walks a decorated trie directly, following suffix links on mismatch
class TrieWalker : public MatchEngine {
public:
    TrieWalker(const Trie& trie, bool caseInsensitive, EndCharPredicate isEndChar, size_t historyDepth);

protected:
    uint32_t completionFrom(uint32_t state) const override;
    uint32_t transitionFrom(uint32_t state, Symbol symbol, bool isEnd) const override;
    const Rule* expansionAt(uint32_t state) const override;

private:
    const Trie& trie_;
};

} // namespace hotstring

#endif // HOTSTRING_TRIE_WALKER_H
