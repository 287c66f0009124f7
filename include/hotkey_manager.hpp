#pragma once

#include <functional>
#include <atomic>
#include <thread>
#include <memory>
#include <string>
#include <cstdint>

namespace talkpaste {

// Turns raw evdev key events into hotkey press/release and the Ctrl+Shift+Q
// quit chord. Auto-repeat (value 2) never produces an action.
class KeyEventFilter {
public:
    enum class Action {
        None,
        HotkeyDown,
        HotkeyUp,
        Quit
    };

    explicit KeyEventFilter(uint32_t hotkey = 0) : hotkey_(hotkey) {}

    void set_hotkey(uint32_t keycode);

    // Feed one EV_KEY event (value: 1 press, 0 release, 2 repeat)
    Action feed(uint16_t code, int value);

    bool hotkey_down() const { return hotkey_down_; }

private:
    uint32_t hotkey_;
    bool hotkey_down_ = false;
    bool ctrl_down_[2] = {false, false};
    bool shift_down_[2] = {false, false};
    bool q_down_ = false;
};

class HotkeyManager {
public:
    using HotkeyCallback = std::function<void(bool pressed)>;
    using QuitCallback = std::function<void()>;

    HotkeyManager();
    ~HotkeyManager();

    HotkeyManager(const HotkeyManager&) = delete;
    HotkeyManager& operator=(const HotkeyManager&) = delete;

    // Set the hotkey by evdev key code
    void set_hotkey(uint32_t keycode) {
        keycode_ = keycode;
        filter_.set_hotkey(keycode);
    }
    uint32_t hotkey() const { return keycode_; }

    // Resolve a configured key ("f9", "right_alt", "KEY_PAUSE", "67") to an evdev code
    static bool resolve_key(const std::string& name, uint32_t& keycode);

    // Config key name to evdev name: "f9" -> "KEY_F9", "right_alt" -> "KEY_RIGHTALT"
    static std::string evdev_key_name(const std::string& name);

    // Set callback for key press/release. Auto-repeat is not forwarded.
    void set_callback(HotkeyCallback callback) { callback_ = callback; }

    // Called when Ctrl+Shift+Q is pressed on the hotkey's keyboard
    void set_quit_callback(QuitCallback callback) { quit_callback_ = callback; }

    // Start/stop listening
    bool start();
    void stop();
    bool is_running() const { return running_.load(); }

private:
    struct PlatformState;

    void run_loop();
    void dispatch(uint16_t code, int value);

    uint32_t keycode_ = 0;
    HotkeyCallback callback_;
    QuitCallback quit_callback_;
    KeyEventFilter filter_;

    std::atomic<bool> running_{false};
    std::thread listener_thread_;

    std::unique_ptr<PlatformState> platform_;
};

} // namespace talkpaste
