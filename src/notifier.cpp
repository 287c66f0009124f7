#include "notifier.hpp"
#include <iostream>
#include <utility>

namespace talkpaste {

const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::Recording: return "recording";
        case SessionStatus::Transcribing: return "transcribing";
        case SessionStatus::Delivered: return "delivered";
        case SessionStatus::Empty: return "empty";
        case SessionStatus::TooShort: return "too short";
        case SessionStatus::Failed: return "failed";
    }
    return "unknown";
}

const char* session_error_name(SessionError error) {
    switch (error) {
        case SessionError::None: return "none";
        case SessionError::DeviceUnavailable: return "no audio input device";
        case SessionError::AuthFailure: return "invalid API key";
        case SessionError::RateLimited: return "rate limited, try again later";
        case SessionError::NetworkTimeout: return "network timeout";
        case SessionError::PayloadTooLarge: return "recording too long";
        case SessionError::ServerError: return "server error";
        case SessionError::DeliveryFailed: return "paste failed";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// DeferredTask

DeferredTask::DeferredTask() {
    worker_ = std::thread([this]() { run_loop(); });
}

DeferredTask::~DeferredTask() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        quit_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void DeferredTask::schedule(std::chrono::milliseconds delay, std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        task_ = std::move(task);
        due_ = std::chrono::steady_clock::now() + delay;
        armed_ = true;
        ++generation_;
    }
    cv_.notify_all();
}

void DeferredTask::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        armed_ = false;
        task_ = nullptr;
        ++generation_;
    }
    cv_.notify_all();
}

bool DeferredTask::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_;
}

void DeferredTask::run_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!quit_) {
        if (!armed_) {
            cv_.wait(lock, [this]() { return armed_ || quit_; });
            continue;
        }

        const uint64_t generation = generation_;
        const auto due = due_;
        cv_.wait_until(lock, due, [this, generation]() {
            return quit_ || generation_ != generation;
        });

        // Rescheduled or cancelled while waiting: start over
        if (quit_ || generation_ != generation) continue;
        if (std::chrono::steady_clock::now() < due) continue;

        std::function<void()> task = std::move(task_);
        task_ = nullptr;
        armed_ = false;

        lock.unlock();
        if (task) task();
        lock.lock();
    }
}

// ---------------------------------------------------------------------------
// TrayNotifier

TrayNotifier::TrayNotifier(std::chrono::milliseconds clear_delay, Sink sink)
    : clear_delay_(clear_delay)
    , sink_(sink ? std::move(sink) : Sink([](const std::string& line) {
          std::cout << "[talkpaste] " << line << std::endl;
      })) {
}

void TrayNotifier::notify(const StatusEvent& event) {
    // Any new event supersedes a pending clear from an earlier session
    clear_task_.cancel();
    uint64_t serial;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        serial = ++event_serial_;
    }

    switch (event.status) {
        case SessionStatus::Recording:
            show("Recording...", "Hold the key and speak");
            return;
        case SessionStatus::Transcribing:
            show("Transcribing...", "");
            return;
        case SessionStatus::Delivered:
            show("Ready", "Pasted: " + event.message);
            break;
        case SessionStatus::Empty:
            show("Ready", "Nothing recognized");
            break;
        case SessionStatus::TooShort:
            show("Ready", "Recording too short, ignored");
            break;
        case SessionStatus::Failed: {
            std::string text = std::string("Error: ") + session_error_name(event.error);
            if (!event.message.empty()) {
                text += " (" + event.message + ")";
            }
            show("Ready", text);
            break;
        }
    }

    // Terminal: the message goes away on its own, the indicator already reads Ready
    clear_task_.schedule(clear_delay_, [this, serial]() { clear_if_current(serial); });
}

void TrayNotifier::clear_if_current(uint64_t serial) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (serial != event_serial_) return;
        indicator_ = "Ready";
        message_.clear();
    }
    sink_("Ready");
}

void TrayNotifier::show(const std::string& indicator, const std::string& message) {
    std::string line;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        indicator_ = indicator;
        message_ = message;
        line = message.empty() ? indicator : indicator + " - " + message;
    }
    sink_(line);
}

std::string TrayNotifier::indicator() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return indicator_;
}

std::string TrayNotifier::message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return message_;
}

} // namespace talkpaste
