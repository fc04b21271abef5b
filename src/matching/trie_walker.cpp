#include "trie_walker.h"

namespace hotstring {

TrieWalker::TrieWalker(const Trie& trie, bool caseInsensitive, EndCharPredicate isEndChar, size_t historyDepth)
    : MatchEngine(caseInsensitive, std::move(isEndChar), historyDepth)
    , trie_(trie) {
}

uint32_t TrieWalker::completionFrom(uint32_t state) const {
    for (NodeId k = state; k != kNoNode; k = trie_.node(k).suffix) {
        NodeId completion = trie_.child(k, kCompletionSymbol);
        if (completion != kNoNode) {
            return completion;
        }
    }
    return kNoNode;
}

uint32_t TrieWalker::transitionFrom(uint32_t state, Symbol symbol, bool isEnd) const {
    for (NodeId k = state; k != kNoNode; k = trie_.node(k).suffix) {
        NodeId next = trie_.child(k, symbol);
        if (next != kNoNode) {
            return next;
        }
    }
    return isEnd ? kWordBoundaryRoot : kInternalRoot;
}

const Rule* TrieWalker::expansionAt(uint32_t state) const {
    return trie_.node(state).expansion;
}

} // namespace hotstring
