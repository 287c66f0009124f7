#pragma once

#include <string>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>
#include <cstdint>

namespace talkpaste {

enum class SessionStatus {
    Recording,
    Transcribing,
    Delivered,      // Terminal: text pasted
    Empty,          // Terminal: nothing to deliver
    TooShort,       // Terminal: below minimum duration
    Failed          // Terminal: see SessionError
};

enum class SessionError {
    None,
    DeviceUnavailable,
    AuthFailure,
    RateLimited,
    NetworkTimeout,
    PayloadTooLarge,
    ServerError,
    DeliveryFailed
};

const char* session_status_name(SessionStatus status);
const char* session_error_name(SessionError error);

// Terminal statuses return the controller to Idle
inline bool is_terminal(SessionStatus status) {
    return status != SessionStatus::Recording && status != SessionStatus::Transcribing;
}

struct StatusEvent {
    uint64_t session_id = 0;
    SessionStatus status = SessionStatus::Recording;
    SessionError error = SessionError::None;
    std::string message;    // Delivered text or failure detail
};

// Receives one event per session state transition, in transition order.
// Implementations must not call back into the SessionController.
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const StatusEvent& event) = 0;
};

// Runs a callback after a delay unless cancelled or superseded by a newer schedule()
class DeferredTask {
public:
    DeferredTask();
    ~DeferredTask();

    DeferredTask(const DeferredTask&) = delete;
    DeferredTask& operator=(const DeferredTask&) = delete;

    void schedule(std::chrono::milliseconds delay, std::function<void()> task);
    void cancel();
    bool pending() const;

private:
    void run_loop();

    std::thread worker_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::function<void()> task_;
    std::chrono::steady_clock::time_point due_;
    uint64_t generation_ = 0;
    bool armed_ = false;
    bool quit_ = false;
};

// Console tray: shows the session state and a transient status message that
// clears itself after clear_delay. Terminal events restore the idle indicator
// immediately; a newer event cancels a pending clear.
class TrayNotifier : public Notifier {
public:
    using Sink = std::function<void(const std::string& line)>;

    explicit TrayNotifier(std::chrono::milliseconds clear_delay = std::chrono::seconds(3),
                          Sink sink = nullptr);

    void notify(const StatusEvent& event) override;

    // Currently displayed indicator and message
    std::string indicator() const;
    std::string message() const;

private:
    void show(const std::string& indicator, const std::string& message);
    void clear_if_current(uint64_t serial);

    std::chrono::milliseconds clear_delay_;
    Sink sink_;
    mutable std::mutex mutex_;
    std::string indicator_ = "Ready";
    std::string message_;
    uint64_t event_serial_ = 0;
    DeferredTask clear_task_;
};

} // namespace talkpaste
