#ifndef HOTSTRING_MATCH_ENGINE_H
#define HOTSTRING_MATCH_ENGINE_H

#include <hotstring/rule.h>
#include "../automaton/trie.h"
#include "../utils/circular_buffer.h"
#include <cstdint>

namespace hotstring {

// Walks an automaton one character at a time and can step back through a
// bounded history. State 1 is the word-boundary start in every backend.
class MatchEngine {
public:
    MatchEngine(bool caseInsensitive, EndCharPredicate isEndChar, size_t historyDepth);
    virtual ~MatchEngine() = default;

    MatchEngine(const MatchEngine&) = delete;
    MatchEngine& operator=(const MatchEngine&) = delete;

    // Advances on ch and returns the rule matching at the new position
    const Rule* followEdge(char32_t ch);

    // Undoes the most recent followEdge; no-op when the history is empty
    void rewind();

    // Back to the word-boundary start with no history
    void reset();

    uint32_t currentState() const { return current_; }
    bool isCompletionPending() const { return completionPending_; }
    size_t historySize() const { return history_.size(); }

    static constexpr uint32_t kStartState = 1;

protected:
    struct Step {
        uint32_t state = kStartState;
        bool completion = false;
    };

    // Completion transition on an end character, if any
    virtual uint32_t completionFrom(uint32_t state) const = 0;

    // Ordinary transition; always lands somewhere
    virtual uint32_t transitionFrom(uint32_t state, Symbol symbol, bool isEnd) const = 0;

    virtual const Rule* expansionAt(uint32_t state) const = 0;

private:
    bool caseInsensitive_;
    EndCharPredicate isEndChar_;
    utils::CircularBuffer<Step> history_;
    uint32_t current_;
    bool completionPending_;
};

} // namespace hotstring

#endif // HOTSTRING_MATCH_ENGINE_H
