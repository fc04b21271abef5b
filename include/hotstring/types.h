#ifndef HOTSTRING_TYPES_H
#define HOTSTRING_TYPES_H

#include <cstdint>
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include "virtual_keys.h"
#include "rule.h"

namespace hotstring {

// Error codes
enum class Result {
    Success = 0,
    ErrorInvalidParameter = -1,
    ErrorUtf8Conversion = -2,
    ErrorInvalidRule = -3
};

// Action types for output
enum class ActionType {
    None = 0,
    Insert = 1,
    BackspaceDelete = 2,
    BackspaceDeleteAndInsert = 3
};

// Matching backend
enum class EngineKind {
    Dfa = 0,     // Precompiled automaton (default)
    Trie = 1     // Suffix-linked trie walked directly
};

// Engine configuration
struct Config {
    size_t historyDepth = 50;          // Undo steps kept by each walker
    double timeoutSeconds = 3.0;       // Idle time before the buffer is forgotten; <= 0 disables
    EngineKind engineKind = EngineKind::Dfa;
    RuleDefaults defaults;
    std::u32string endCharacters;      // Empty: whitespace and punctuation

    Config() = default;
};

// Key modifiers
struct Modifiers {
    bool shift = false;
    bool ctrl = false;
    bool alt = false;
    bool capsLock = false;
    bool meta = false;  // Windows key / Command key

    Modifiers() = default;
    Modifiers(bool s, bool c, bool a, bool caps = false, bool m = false)
        : shift(s), ctrl(c), alt(a), capsLock(caps), meta(m) {}

    // Ctrl or Cmd chords are shortcuts, never text
    bool isShortcutChord() const {
        return ctrl || meta;
    }

    bool operator==(const Modifiers& other) const {
        return shift == other.shift &&
               ctrl == other.ctrl &&
               alt == other.alt &&
               capsLock == other.capsLock &&
               meta == other.meta;
    }
};

// Input event
struct Input {
    VirtualKey keyCode;   // Virtual key code
    char32_t character;   // Unicode character (if applicable)
    Modifiers modifiers;

    Input() : keyCode(VirtualKey::Null), character(0) {}
    Input(VirtualKey kc, char32_t ch, const Modifiers& mods = Modifiers())
        : keyCode(kc), character(ch), modifiers(mods) {}

    static Input Character(char32_t ch) {
        return Input(VirtualKey::Null, ch);
    }
};

// Keystroke plan for the host
struct Output {
    ActionType action = ActionType::None;
    std::string text;           // UTF-8 encoded text to type
    int deleteCount = 0;        // Number of characters to erase first
    bool isProcessed = false;   // Whether the key was consumed
    bool deferred = false;      // Deliver the key before typing text

    Output() = default;

    // Helper constructors
    static Output None() {
        return Output();
    }

    static Output Insert(const std::string& text) {
        Output out;
        out.action = ActionType::Insert;
        out.text = text;
        out.isProcessed = true;
        return out;
    }

    static Output DeleteAndInsert(int count, const std::string& text) {
        if (count == 0) {
            return Insert(text);
        }
        Output out;
        out.action = text.empty() ? ActionType::BackspaceDelete : ActionType::BackspaceDeleteAndInsert;
        out.deleteCount = count;
        out.text = text;
        out.isProcessed = true;
        return out;
    }

    // Key passes through, text is typed after it
    static Output Deferred(const std::string& text) {
        Output out;
        out.action = ActionType::Insert;
        out.text = text;
        out.deferred = true;
        return out;
    }
};

// Helper functions
inline std::string resultToString(Result result) {
    switch (result) {
        case Result::Success: return "Success";
        case Result::ErrorInvalidParameter: return "Invalid parameter";
        case Result::ErrorUtf8Conversion: return "UTF-8 conversion error";
        case Result::ErrorInvalidRule: return "Invalid rule";
        default: return "Unknown error";
    }
}

} // namespace hotstring

#endif // HOTSTRING_TYPES_H
