#ifndef HOTSTRING_DFA_H
#define HOTSTRING_DFA_H

#include "trie.h"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace hotstring {

class ConflictLog;

using StateId = uint32_t;
constexpr StateId kNoState = 0;
constexpr StateId kWordBoundaryState = 1;
constexpr StateId kInternalState = 2;

struct DfaState {
    StateId id = kNoState;
    std::vector<NodeId> nodes;               // Trie nodes this state stands for
    std::map<Symbol, StateId> transitions;
    const Rule* expansion = nullptr;
};

// Deterministic automaton compiled from a trie. Immutable once built.
class Dfa {
public:
    const DfaState& state(StateId id) const { return states_[id - 1]; }
    StateId next(StateId id, Symbol symbol) const;
    size_t size() const { return states_.size(); }

    std::string dump() const;

private:
    friend class DfaFactory;
    std::vector<DfaState> states_;
};

// Subset construction over trie node sets
class DfaFactory {
public:
    static Dfa create(const Trie& trie, const EndCharPredicate& isEndChar, ConflictLog* conflicts);
};

} // namespace hotstring

#endif // HOTSTRING_DFA_H
