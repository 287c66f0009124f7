#include "hotkey_manager.hpp"
#include <algorithm>
#include <cctype>
#include <linux/input-event-codes.h>

namespace talkpaste {

std::string HotkeyManager::evdev_key_name(const std::string& name) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (key.rfind("KEY_", 0) == 0) return key;

    // Friendly names used in config files
    static const struct { const char* alias; const char* evdev; } aliases[] = {
        {"RIGHT_ALT", "KEY_RIGHTALT"},
        {"LEFT_ALT", "KEY_LEFTALT"},
        {"RIGHT_CTRL", "KEY_RIGHTCTRL"},
        {"LEFT_CTRL", "KEY_LEFTCTRL"},
        {"RIGHT_SHIFT", "KEY_RIGHTSHIFT"},
        {"LEFT_SHIFT", "KEY_LEFTSHIFT"},
        {"RIGHT_META", "KEY_RIGHTMETA"},
        {"LEFT_META", "KEY_LEFTMETA"},
        {"SCROLL_LOCK", "KEY_SCROLLLOCK"},
        {"CAPS_LOCK", "KEY_CAPSLOCK"},
        {"PAUSE", "KEY_PAUSE"},
        {"INSERT", "KEY_INSERT"},
        {"MENU", "KEY_COMPOSE"},
    };
    for (const auto& a : aliases) {
        if (key == a.alias) return a.evdev;
    }

    return "KEY_" + key;
}

void KeyEventFilter::set_hotkey(uint32_t keycode) {
    hotkey_ = keycode;
    hotkey_down_ = false;
}

KeyEventFilter::Action KeyEventFilter::feed(uint16_t code, int value) {
    if (value == 2) return Action::None;
    const bool down = value == 1;

    // Modifier state is tracked even when a modifier is the hotkey
    switch (code) {
        case KEY_LEFTCTRL: ctrl_down_[0] = down; break;
        case KEY_RIGHTCTRL: ctrl_down_[1] = down; break;
        case KEY_LEFTSHIFT: shift_down_[0] = down; break;
        case KEY_RIGHTSHIFT: shift_down_[1] = down; break;
        case KEY_Q: q_down_ = down; break;
        default: break;
    }

    if (hotkey_ != 0 && code == hotkey_) {
        if (down && !hotkey_down_) {
            hotkey_down_ = true;
            return Action::HotkeyDown;
        }
        if (!down && hotkey_down_) {
            hotkey_down_ = false;
            return Action::HotkeyUp;
        }
        return Action::None;
    }

    // The chord fires on the press that completes it, in any order
    const bool ctrl = ctrl_down_[0] || ctrl_down_[1];
    const bool shift = shift_down_[0] || shift_down_[1];
    if (down && ctrl && shift && q_down_ &&
        (code == KEY_Q || code == KEY_LEFTCTRL || code == KEY_RIGHTCTRL ||
         code == KEY_LEFTSHIFT || code == KEY_RIGHTSHIFT)) {
        return Action::Quit;
    }
    return Action::None;
}

// Platform-specific implementations in platform/*/hotkey_*.cpp

} // namespace talkpaste
