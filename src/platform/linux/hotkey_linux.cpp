#include "hotkey_manager.hpp"
#include <iostream>
#include <filesystem>
#include <algorithm>
#include <vector>
#include <cerrno>
#include <cctype>
#include <cstdlib>
#include <fcntl.h>
#include <unistd.h>
#include <linux/input.h>
#include <sys/select.h>
#include <libevdev/libevdev.h>

namespace talkpaste {

struct HotkeyManager::PlatformState {
    int keyboard_fd = -1;
    struct libevdev* dev = nullptr;

    ~PlatformState() { close_device(); }

    void close_device() {
        if (dev) {
            libevdev_free(dev);
            dev = nullptr;
        }
        if (keyboard_fd >= 0) {
            close(keyboard_fd);
            keyboard_fd = -1;
        }
    }
};

HotkeyManager::HotkeyManager()
    : platform_(new PlatformState()) {
}

HotkeyManager::~HotkeyManager() {
    stop();
}

bool HotkeyManager::resolve_key(const std::string& name, uint32_t& keycode) {
    if (name.empty()) return false;

    // Numeric evdev code
    if (std::all_of(name.begin(), name.end(), [](unsigned char c) { return std::isdigit(c); })) {
        keycode = static_cast<uint32_t>(std::strtoul(name.c_str(), nullptr, 10));
        return keycode > 0 && keycode <= KEY_MAX;
    }

    int code = libevdev_event_code_from_name(EV_KEY, evdev_key_name(name).c_str());
    if (code < 0) return false;

    keycode = static_cast<uint32_t>(code);
    return true;
}

bool HotkeyManager::start() {
    if (running_.load()) return true;
    if (keycode_ == 0) {
        std::cerr << "No hotkey configured" << std::endl;
        return false;
    }

    filter_.set_hotkey(keycode_);

    // Scan input devices for one that can emit the hotkey
    std::vector<std::string> candidates;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/dev/input", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("event", 0) == 0) {
            candidates.push_back(entry.path().string());
        }
    }
    std::sort(candidates.begin(), candidates.end());

    for (const auto& path : candidates) {
        int fd = open(path.c_str(), O_RDONLY | O_NONBLOCK);
        if (fd < 0) continue;

        struct libevdev* dev = nullptr;
        if (libevdev_new_from_fd(fd, &dev) >= 0) {
            if (libevdev_has_event_type(dev, EV_KEY) &&
                libevdev_has_event_code(dev, EV_KEY, keycode_)) {
                platform_->keyboard_fd = fd;
                platform_->dev = dev;
                std::cout << "Using keyboard: " << path << " (" << libevdev_get_name(dev) << ")" << std::endl;
                break;
            }
            libevdev_free(dev);
        }
        close(fd);
    }

    if (platform_->keyboard_fd < 0) {
        std::cerr << "Failed to open keyboard device. Try running with sudo or add user to input group." << std::endl;
        return false;
    }

    running_.store(true);

    // Start listener thread
    listener_thread_ = std::thread([this]() {
        run_loop();
    });

    return true;
}

void HotkeyManager::stop() {
    running_.store(false);

    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }

    platform_->close_device();
}

void HotkeyManager::dispatch(uint16_t code, int value) {
    switch (filter_.feed(code, value)) {
        case KeyEventFilter::Action::HotkeyDown:
            if (callback_) callback_(true);
            break;
        case KeyEventFilter::Action::HotkeyUp:
            if (callback_) callback_(false);
            break;
        case KeyEventFilter::Action::Quit:
            std::cout << "Quit chord pressed" << std::endl;
            if (quit_callback_) quit_callback_();
            break;
        case KeyEventFilter::Action::None:
            break;
    }
}

void HotkeyManager::run_loop() {
    struct input_event ev;
    unsigned int read_flag = LIBEVDEV_READ_FLAG_NORMAL;

    while (running_.load()) {
        fd_set fds;
        FD_ZERO(&fds);
        FD_SET(platform_->keyboard_fd, &fds);

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 100000; // 100ms timeout

        int ret = select(platform_->keyboard_fd + 1, &fds, nullptr, nullptr, &tv);
        if (ret <= 0) continue;

        int rc;
        do {
            rc = libevdev_next_event(platform_->dev, read_flag, &ev);
            if (rc == LIBEVDEV_READ_STATUS_SYNC) {
                // Dropped events: replay the device state before continuing
                read_flag = LIBEVDEV_READ_FLAG_SYNC;
            } else if (rc == -EAGAIN && read_flag == LIBEVDEV_READ_FLAG_SYNC) {
                read_flag = LIBEVDEV_READ_FLAG_NORMAL;
                rc = LIBEVDEV_READ_STATUS_SUCCESS;
                continue;
            }

            if (rc >= 0 && ev.type == EV_KEY) {
                dispatch(ev.code, ev.value);
            }
        } while (rc == LIBEVDEV_READ_STATUS_SUCCESS || rc == LIBEVDEV_READ_STATUS_SYNC);

        if (rc == -ENODEV) {
            std::cerr << "Keyboard device disconnected" << std::endl;
            running_.store(false);
        }
    }
}

} // namespace talkpaste
