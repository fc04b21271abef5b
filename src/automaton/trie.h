#ifndef HOTSTRING_TRIE_H
#define HOTSTRING_TRIE_H

#include <hotstring/rule.h>
#include "counter.h"
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace hotstring {

class ConflictLog;

// Node identifiers; 0 means "no node"
using NodeId = uint32_t;
constexpr NodeId kNoNode = 0;
constexpr NodeId kWordBoundaryRoot = 1;   // Abbreviations that start after an end character
constexpr NodeId kInternalRoot = 2;       // Abbreviations that may start anywhere

// Edge labels: Unicode code points plus two sentinels above U+10FFFF
using Symbol = uint32_t;
constexpr Symbol kCompletionSymbol = 0x110000;    // Any end character that completes a match
constexpr Symbol kWordBoundarySymbol = 0x110001;  // Internal root -> word-boundary root

using EndCharPredicate = std::function<bool(char32_t)>;

// Sentinels are never end characters
inline bool isEndSymbol(const EndCharPredicate& isEndChar, Symbol symbol) {
    return symbol <= 0x10FFFF && isEndChar(static_cast<char32_t>(symbol));
}

struct TrieNode {
    NodeId id = kNoNode;
    NodeId parent = kNoNode;
    Symbol label = 0;
    std::map<Symbol, NodeId> transitions;
    std::vector<const Rule*> expansions;    // Rules whose abbreviation ends here

    // Set by Trie::decorate()
    NodeId suffix = kNoNode;                // Longest proper suffix present in the trie
    NodeId nextExpansion = kNoNode;         // Nearest suffix that has its own expansions
    const Rule* expansion = nullptr;        // Best rule matching at this node
};

// Arena of trie nodes addressed by id. The two roots always exist.
class Trie {
public:
    Trie();

    // Inserts every rule in order. Case-insensitive partitions pass
    // homogenizeCase so abbreviations are stored lower-cased.
    static Trie build(const RuleList& rules, bool homogenizeCase);

    // Adds Aho-Corasick suffix links and resolves each node's expansion
    void decorate(const EndCharPredicate& isEndChar, ConflictLog* conflicts);

    const TrieNode& node(NodeId id) const { return nodes_[id - 1]; }
    NodeId child(NodeId id, Symbol symbol) const;
    size_t size() const { return nodes_.size(); }
    bool isDecorated() const { return decorated_; }

    std::string dump() const;

private:
    NodeId addNode(NodeId parent, Symbol label);
    NodeId childOrCreate(NodeId parent, Symbol label);
    TrieNode& mutableNode(NodeId id) { return nodes_[id - 1]; }

    std::vector<TrieNode> nodes_;
    Counter counter_;
    bool decorated_;
};

// Printable form of an edge label
std::string symbolToString(Symbol symbol);

} // namespace hotstring

#endif // HOTSTRING_TRIE_H
