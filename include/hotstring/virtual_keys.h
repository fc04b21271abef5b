#ifndef HOTSTRING_VIRTUAL_KEYS_H
#define HOTSTRING_VIRTUAL_KEYS_H

#include <cstdint>
#include <string>

namespace hotstring {

// Virtual key codes - internal representation (NOT Windows VK codes)
// Only the keys that influence the recognizer are named; every other key
// arrives as Null together with the character it produces.
enum class VirtualKey : uint16_t {
    // Special value
    Null = 1,              // Character key or unknown key

    // Control keys
    Back = 2,              // Backspace
    Tab = 3,               // Tab
    Return = 4,            // Enter
    Shift = 5,             // Shift
    Control = 6,           // Ctrl
    Menu = 7,              // Alt
    Pause = 8,             // Pause
    Capital = 9,           // Caps Lock
    Escape = 11,           // Escape
    Space = 12,            // Space
    Prior = 13,            // Page Up
    Next = 14,             // Page Down
    Delete = 15,           // Forward delete

    // Modifier keys (left/right variants)
    LShift = 80,
    RShift = 81,
    LControl = 82,
    RControl = 83,
    LMenu = 84,            // Left Alt
    RMenu = 85,            // Right Alt/AltGr
    IcoHelp = 100,         // Help

    // Navigation keys
    End = 102,
    Home = 103,
    Left = 104,
    Up = 105,
    Right = 106,
    Down = 107,
    Insert = 108
};

// What the recognizer does with a key
enum class KeyAction {
    Character,   // Feed the produced character
    Delete,      // Rewind one character
    Reset,       // Forget the abbreviation underway
    Ignore       // Leave the recognizer untouched (bare modifiers)
};

// Helper class for VirtualKey operations
class VirtualKeyHelper {
public:
    // Convert Windows VK code to internal VirtualKey
    static VirtualKey fromWindowsVK(int vkCode);

    // Keys that clear the abbreviation buffer when pressed
    static bool isResetKey(VirtualKey key);
};

inline bool isModifierKey(VirtualKey key) {
    switch (key) {
        case VirtualKey::Shift:
        case VirtualKey::Control:
        case VirtualKey::Menu:
        case VirtualKey::Capital:
        case VirtualKey::LShift:
        case VirtualKey::RShift:
        case VirtualKey::LControl:
        case VirtualKey::RControl:
        case VirtualKey::LMenu:
        case VirtualKey::RMenu:
            return true;
        default:
            return false;
    }
}

inline bool isNavigationKey(VirtualKey key) {
    return key >= VirtualKey::End && key <= VirtualKey::Down;
}

} // namespace hotstring

#endif // HOTSTRING_VIRTUAL_KEYS_H
