#include "trie.h"
#include "priority.h"
#include "../utils/debug.h"
#include "../utils/utf8.h"
#include <deque>
#include <sstream>

namespace hotstring {

std::string symbolToString(Symbol symbol) {
    switch (symbol) {
        case kCompletionSymbol: return "<complete>";
        case kWordBoundarySymbol: return "<boundary>";
        default: return utils::describeCharacter(static_cast<char32_t>(symbol));
    }
}

Trie::Trie() : decorated_(false) {
    addNode(kNoNode, kWordBoundarySymbol);  // word-boundary root
    addNode(kNoNode, 0);                    // internal root
    mutableNode(kWordBoundaryRoot).parent = kInternalRoot;
}

NodeId Trie::addNode(NodeId parent, Symbol label) {
    TrieNode node;
    node.id = counter_.next();
    node.parent = parent;
    node.label = label;
    nodes_.push_back(std::move(node));
    return nodes_.back().id;
}

NodeId Trie::child(NodeId id, Symbol symbol) const {
    const auto& transitions = node(id).transitions;
    auto it = transitions.find(symbol);
    return it == transitions.end() ? kNoNode : it->second;
}

NodeId Trie::childOrCreate(NodeId parent, Symbol label) {
    NodeId existing = child(parent, label);
    if (existing != kNoNode) {
        return existing;
    }
    NodeId created = addNode(parent, label);
    mutableNode(parent).transitions[label] = created;
    return created;
}

Trie Trie::build(const RuleList& rules, bool homogenizeCase) {
    Trie trie;

    for (const auto& rule : rules) {
        std::u32string abbreviation = homogenizeCase
            ? utils::toLower(rule->abbreviation)
            : rule->abbreviation;

        NodeId current = rule->flags.internal ? kInternalRoot : kWordBoundaryRoot;
        for (char32_t ch : abbreviation) {
            current = trie.childOrCreate(current, static_cast<Symbol>(ch));
        }
        if (rule->flags.waitForCompletionKey) {
            current = trie.childOrCreate(current, kCompletionSymbol);
        }
        trie.mutableNode(current).expansions.push_back(rule.get());
    }

    utils::debugLog("Built trie with " + std::to_string(trie.size()) + " nodes from " +
                    std::to_string(rules.size()) + " rules");
    return trie;
}

void Trie::decorate(const EndCharPredicate& isEndChar, ConflictLog* conflicts) {
    // The internal root is the top of the combined tree and the word-boundary
    // root hangs below it, so word-boundary nodes come first at every depth.
    // A suffix link therefore always points at a node visited earlier.
    TrieNode& internalRoot = mutableNode(kInternalRoot);
    internalRoot.suffix = kNoNode;
    internalRoot.nextExpansion = kNoNode;
    internalRoot.expansion = bestOf(internalRoot.expansions, conflicts);

    std::deque<NodeId> queue;
    queue.push_back(kWordBoundaryRoot);
    for (const auto& edge : internalRoot.transitions) {
        queue.push_back(edge.second);
    }

    while (!queue.empty()) {
        NodeId id = queue.front();
        queue.pop_front();

        NodeId suffix = kInternalRoot;
        if (id != kWordBoundaryRoot) {
            const TrieNode& current = node(id);
            suffix = kNoNode;
            for (NodeId k = node(current.parent).suffix; k != kNoNode; k = node(k).suffix) {
                NodeId candidate = child(k, current.label);
                if (candidate != kNoNode && candidate != id) {
                    suffix = candidate;
                    break;
                }
            }
            if (suffix == kNoNode) {
                suffix = isEndSymbol(isEndChar, current.label) ? kWordBoundaryRoot : kInternalRoot;
            }
        }

        const TrieNode& suffixNode = node(suffix);
        TrieNode& current = mutableNode(id);
        current.suffix = suffix;
        current.nextExpansion = suffixNode.expansions.empty() ? suffixNode.nextExpansion : suffix;

        const Rule* best = bestOf(current.expansions, conflicts);
        if (current.nextExpansion != kNoNode) {
            best = bestOf(best, node(current.nextExpansion).expansion, conflicts);
        }
        current.expansion = best;

        for (const auto& edge : current.transitions) {
            queue.push_back(edge.second);
        }
    }

    decorated_ = true;
}

std::string Trie::dump() const {
    std::stringstream ss;
    for (const auto& n : nodes_) {
        ss << n.id;
        if (n.parent != kNoNode) {
            ss << " (" << n.parent << " -" << symbolToString(n.label) << "->)";
        }
        for (const auto& edge : n.transitions) {
            ss << " " << symbolToString(edge.first) << ":" << edge.second;
        }
        if (decorated_) {
            ss << " suffix=" << n.suffix;
            if (n.expansion) {
                ss << " expansion=\"" << utils::utf32ToUtf8(n.expansion->abbreviation) << "\"";
            }
        }
        ss << "\n";
    }
    return ss.str();
}

} // namespace hotstring
