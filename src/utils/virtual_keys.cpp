#include <hotstring/virtual_keys.h>

namespace hotstring {

VirtualKey VirtualKeyHelper::fromWindowsVK(int vkCode) {
    switch (vkCode) {
        case 0x08: return VirtualKey::Back;
        case 0x09: return VirtualKey::Tab;
        case 0x0D: return VirtualKey::Return;
        case 0x10: return VirtualKey::Shift;
        case 0x11: return VirtualKey::Control;
        case 0x12: return VirtualKey::Menu;
        case 0x13: return VirtualKey::Pause;
        case 0x14: return VirtualKey::Capital;
        case 0x1B: return VirtualKey::Escape;
        case 0x20: return VirtualKey::Space;
        case 0x21: return VirtualKey::Prior;
        case 0x22: return VirtualKey::Next;
        case 0x23: return VirtualKey::End;
        case 0x24: return VirtualKey::Home;
        case 0x25: return VirtualKey::Left;
        case 0x26: return VirtualKey::Up;
        case 0x27: return VirtualKey::Right;
        case 0x28: return VirtualKey::Down;
        case 0x2D: return VirtualKey::Insert;
        case 0x2E: return VirtualKey::Delete;
        case 0x2F: return VirtualKey::IcoHelp;
        case 0xA0: return VirtualKey::LShift;
        case 0xA1: return VirtualKey::RShift;
        case 0xA2: return VirtualKey::LControl;
        case 0xA3: return VirtualKey::RControl;
        case 0xA4: return VirtualKey::LMenu;
        case 0xA5: return VirtualKey::RMenu;

        default: return VirtualKey::Null;  // Character keys carry their text instead
    }
}

bool VirtualKeyHelper::isResetKey(VirtualKey key) {
    switch (key) {
        case VirtualKey::Escape:
        case VirtualKey::IcoHelp:
        case VirtualKey::Delete:
        case VirtualKey::Prior:
        case VirtualKey::Next:
            return true;
        default:
            return isNavigationKey(key);
    }
}

} // namespace hotstring
