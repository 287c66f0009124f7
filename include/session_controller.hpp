#pragma once

#include "audio_capture.hpp"
#include "transcriber.hpp"
#include "text_corrector.hpp"
#include "delivery.hpp"
#include "notifier.hpp"

#include <mutex>
#include <condition_variable>
#include <thread>
#include <chrono>
#include <cstdint>

namespace talkpaste {

enum class SessionState {
    Idle,
    Recording,
    Transcribing
};

const char* session_state_name(SessionState state);

struct RecordingSession {
    uint64_t id = 0;
    SessionState state = SessionState::Idle;
    std::chrono::steady_clock::time_point start_time;
};

// Push-to-talk state machine: Idle -> Recording -> Transcribing -> Idle.
//
// key_down()/key_up() are the only entry points and are serialized by one
// mutex. At most one session is in Recording or Transcribing; events that do
// not fit the current state are ignored. Transcription, correction and
// delivery run on a worker thread so hotkey intake never blocks on the
// network. Every transition emits exactly one StatusEvent.
class SessionController {
public:
    SessionController(AudioCapture& audio,
                      Transcriber& transcriber,
                      const TextCorrector& corrector,
                      DeliveryGateway& delivery,
                      Notifier& notifier);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Hotkey callback
    void on_hotkey(bool pressed);

    // Returns true if a new session started recording
    bool key_down();

    // Returns true if a recording was stopped (whatever the outcome)
    bool key_up();

    SessionState state() const;
    RecordingSession session() const;

    // Block until the controller is Idle or the timeout expires
    bool wait_idle(std::chrono::milliseconds timeout);

private:
    void run_transcription(uint64_t session_id, std::vector<uint8_t> wav);
    void finish(uint64_t session_id, SessionStatus status, SessionError error,
                const std::string& message);
    void emit(uint64_t session_id, SessionStatus status,
              SessionError error = SessionError::None,
              const std::string& message = "");

    static SessionError map_error(TranscriptionError error);

    AudioCapture& audio_;
    Transcriber& transcriber_;
    const TextCorrector& corrector_;
    DeliveryGateway& delivery_;
    Notifier& notifier_;

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    RecordingSession session_;
    uint64_t next_session_id_ = 0;

    std::thread worker_;
};

} // namespace talkpaste
