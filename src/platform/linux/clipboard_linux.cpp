#include "clipboard.hpp"
#include "delivery.hpp"
#include "shell_pipe.hpp"
#include <iostream>
#include <thread>
#include <chrono>

#include <X11/Xlib.h>
#include <X11/keysym.h>
#include <X11/extensions/XTest.h>

namespace talkpaste {

bool Clipboard::set_text(const std::string& text) {
    // First try xclip, then xsel
    if (pipe_to_command("xclip -selection clipboard 2>/dev/null", text)) return true;
    if (pipe_to_command("xsel --clipboard --input 2>/dev/null", text)) return true;

    std::cerr << "Failed to set clipboard. Install xclip or xsel." << std::endl;
    return false;
}

bool Clipboard::paste() {
    Display* display = XOpenDisplay(nullptr);
    if (!display) {
        std::cerr << "Failed to open X display" << std::endl;
        return false;
    }

    // Simulate Ctrl+V
    KeyCode ctrl_keycode = XKeysymToKeycode(display, XK_Control_L);
    KeyCode v_keycode = XKeysymToKeycode(display, XK_v);

    if (ctrl_keycode == 0 || v_keycode == 0) {
        std::cerr << "Failed to get keycodes" << std::endl;
        XCloseDisplay(display);
        return false;
    }

    XTestFakeKeyEvent(display, ctrl_keycode, True, 0);
    XTestFakeKeyEvent(display, v_keycode, True, 0);
    XTestFakeKeyEvent(display, v_keycode, False, 0);
    XTestFakeKeyEvent(display, ctrl_keycode, False, 0);
    XFlush(display);

    XCloseDisplay(display);
    return true;
}

ClipboardDelivery::ClipboardDelivery(bool auto_paste, int paste_delay_ms)
    : auto_paste_(auto_paste)
    , paste_delay_ms_(paste_delay_ms) {
}

bool ClipboardDelivery::deliver(const std::string& text) {
    if (!Clipboard::set_text(text)) {
        return false;
    }

    if (!auto_paste_) {
        std::cout << "Copied to clipboard" << std::endl;
        return true;
    }

    // Delay to ensure clipboard is fully set before pasting
    std::this_thread::sleep_for(std::chrono::milliseconds(paste_delay_ms_));
    return Clipboard::paste();
}

} // namespace talkpaste
