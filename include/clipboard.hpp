#pragma once

#include <string>

namespace talkpaste {

class Clipboard {
public:
    // Set text to clipboard
    static bool set_text(const std::string& text);

    // Paste clipboard content (simulates Ctrl+V)
    static bool paste();
};

} // namespace talkpaste
