#include "dfa.h"
#include "priority.h"
#include "../utils/debug.h"
#include "../utils/utf8.h"
#include <algorithm>
#include <deque>
#include <sstream>
#include <unordered_map>

namespace hotstring {

namespace {

using NodeSet = std::vector<NodeId>;

struct NodeSetHash {
    size_t operator()(const NodeSet& nodes) const {
        size_t hash = nodes.size();
        for (NodeId id : nodes) {
            hash ^= std::hash<NodeId>()(id) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
        }
        return hash;
    }
};

void canonicalize(NodeSet& nodes) {
    std::sort(nodes.begin(), nodes.end());
    nodes.erase(std::unique(nodes.begin(), nodes.end()), nodes.end());
}

} // anonymous namespace

StateId Dfa::next(StateId id, Symbol symbol) const {
    const auto& transitions = state(id).transitions;
    auto it = transitions.find(symbol);
    return it == transitions.end() ? kNoState : it->second;
}

Dfa DfaFactory::create(const Trie& trie, const EndCharPredicate& isEndChar, ConflictLog* conflicts) {
    Dfa dfa;
    std::unordered_map<NodeSet, StateId, NodeSetHash> ids;
    std::deque<NodeSet> queue;

    auto intern = [&](const NodeSet& nodes) {
        auto it = ids.find(nodes);
        if (it != ids.end()) {
            return it->second;
        }
        DfaState state;
        state.id = static_cast<StateId>(dfa.states_.size() + 1);
        state.nodes = nodes;
        dfa.states_.push_back(std::move(state));
        ids.emplace(nodes, dfa.states_.back().id);
        queue.push_back(nodes);
        return dfa.states_.back().id;
    };

    intern(NodeSet{kWordBoundaryRoot});
    intern(NodeSet{kInternalRoot});

    while (!queue.empty()) {
        NodeSet nodes = std::move(queue.front());
        queue.pop_front();
        StateId id = ids.at(nodes);

        std::map<Symbol, NodeSet> targets;
        std::vector<const Rule*> candidates;
        for (NodeId nodeId : nodes) {
            const TrieNode& node = trie.node(nodeId);
            candidates.insert(candidates.end(), node.expansions.begin(), node.expansions.end());

            for (const auto& edge : node.transitions) {
                auto it = targets.find(edge.first);
                if (it == targets.end()) {
                    it = targets.emplace(edge.first, NodeSet()).first;
                    // An internal abbreviation can start at any character
                    if (nodeId != kInternalRoot) {
                        NodeId restart = trie.child(kInternalRoot, edge.first);
                        if (restart != kNoNode) {
                            it->second.push_back(restart);
                        }
                    }
                }
                it->second.push_back(edge.second);
                if (isEndSymbol(isEndChar, edge.first)) {
                    it->second.push_back(kWordBoundaryRoot);
                }
            }
        }

        const Rule* expansion = bestOf(candidates, conflicts);
        std::map<Symbol, StateId> transitions;
        for (auto& target : targets) {
            canonicalize(target.second);
            transitions[target.first] = intern(target.second);
        }

        // intern() may grow the state vector, so look the state up afterwards
        DfaState& state = dfa.states_[id - 1];
        state.transitions = std::move(transitions);
        state.expansion = expansion;
    }

    utils::debugLog("Compiled automaton with " + std::to_string(dfa.size()) + " states from " +
                    std::to_string(trie.size()) + " trie nodes");
    return dfa;
}

std::string Dfa::dump() const {
    std::stringstream ss;
    for (const auto& state : states_) {
        ss << state.id << " {";
        for (size_t i = 0; i < state.nodes.size(); ++i) {
            ss << (i ? "," : "") << state.nodes[i];
        }
        ss << "}";
        for (const auto& edge : state.transitions) {
            ss << " " << symbolToString(edge.first) << ":" << edge.second;
        }
        if (state.expansion) {
            ss << " expansion=\"" << utils::utf32ToUtf8(state.expansion->abbreviation) << "\"";
        }
        ss << "\n";
    }
    return ss.str();
}

} // namespace hotstring
