#include "state_manager.h"
#include "dfa_walker.h"
#include "trie_walker.h"
#include "../automaton/priority.h"
#include "../utils/debug.h"
#include <sstream>

namespace hotstring {

StateManager::StateManager(const RuleList& rules, EndCharPredicate isEndChar, size_t historyDepth,
                           EngineKind kind, ConflictLog* conflicts) {
    for (bool caseSensitive : {true, false}) {
        auto partition = std::make_unique<Partition>();
        partition->caseSensitive = caseSensitive;
        for (const auto& rule : rules) {
            if (rule->flags.caseSensitive == caseSensitive) {
                partition->rules.push_back(rule);
            }
        }
        if (partition->rules.empty()) {
            continue;
        }

        partition->trie = std::make_unique<Trie>(Trie::build(partition->rules, !caseSensitive));
        if (kind == EngineKind::Trie) {
            partition->trie->decorate(isEndChar, conflicts);
            partition->walker = std::make_unique<TrieWalker>(
                *partition->trie, !caseSensitive, isEndChar, historyDepth);
        } else {
            partition->dfa = std::make_unique<Dfa>(
                DfaFactory::create(*partition->trie, isEndChar, conflicts));
            partition->walker = std::make_unique<DfaWalker>(
                *partition->dfa, !caseSensitive, isEndChar, historyDepth);
        }

        utils::debugLog(std::string(caseSensitive ? "Case-sensitive" : "Case-insensitive") +
                        " partition ready with " + std::to_string(partition->rules.size()) + " rules");
        partitions_.push_back(std::move(partition));
    }
}

StateManager::~StateManager() = default;

const Rule* StateManager::followEdge(char32_t ch) {
    const Rule* best = nullptr;
    for (auto& partition : partitions_) {
        // Case sensitivity always separates partitions, so no tie is possible here
        best = bestOf(best, partition->walker->followEdge(ch), nullptr);
    }
    return best;
}

void StateManager::rewind() {
    for (auto& partition : partitions_) {
        partition->walker->rewind();
    }
}

void StateManager::reset() {
    for (auto& partition : partitions_) {
        partition->walker->reset();
    }
}

std::string StateManager::dump() const {
    std::stringstream ss;
    for (const auto& partition : partitions_) {
        ss << (partition->caseSensitive ? "[case-sensitive]" : "[case-insensitive]") << "\n";
        ss << (partition->dfa ? partition->dfa->dump() : partition->trie->dump());
    }
    return ss.str();
}

} // namespace hotstring
