#ifndef HOTSTRING_STATE_MANAGER_H
#define HOTSTRING_STATE_MANAGER_H

#include <hotstring/types.h>
#include "match_engine.h"
#include "../automaton/dfa.h"
#include "../automaton/trie.h"
#include <memory>
#include <string>
#include <vector>

namespace hotstring {

class ConflictLog;

// Runs the case-sensitive and case-insensitive rule partitions side by side
// and picks the preferred match across them.
class StateManager {
public:
    StateManager(const RuleList& rules, EndCharPredicate isEndChar, size_t historyDepth,
                 EngineKind kind, ConflictLog* conflicts);
    ~StateManager();

    const Rule* followEdge(char32_t ch);
    void rewind();
    void reset();

    size_t partitionCount() const { return partitions_.size(); }
    std::string dump() const;

private:
    struct Partition {
        bool caseSensitive = false;
        RuleList rules;
        std::unique_ptr<Trie> trie;
        std::unique_ptr<Dfa> dfa;
        std::unique_ptr<MatchEngine> walker;
    };

    std::vector<std::unique_ptr<Partition>> partitions_;
};

} // namespace hotstring

#endif // HOTSTRING_STATE_MANAGER_H
