#include "session_controller.hpp"
#include <iostream>
#include <exception>
#include <utility>

namespace talkpaste {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Recording: return "recording";
        case SessionState::Transcribing: return "transcribing";
    }
    return "unknown";
}

SessionController::SessionController(AudioCapture& audio,
                                     Transcriber& transcriber,
                                     const TextCorrector& corrector,
                                     DeliveryGateway& delivery,
                                     Notifier& notifier)
    : audio_(audio)
    , transcriber_(transcriber)
    , corrector_(corrector)
    , delivery_(delivery)
    , notifier_(notifier) {
}

SessionController::~SessionController() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.state == SessionState::Recording) {
            // Abandon the recording; nothing is sent
            audio_.stop_recording();
            session_.state = SessionState::Idle;
        }
    }

    // An in-flight transcription runs to its deadline
    if (worker_.joinable()) {
        worker_.join();
    }
}

void SessionController::on_hotkey(bool pressed) {
    if (pressed) {
        key_down();
    } else {
        key_up();
    }
}

bool SessionController::key_down() {
    std::lock_guard<std::mutex> lock(mutex_);

    // At most one active session; repeats and presses during Transcribing are no-ops
    if (session_.state != SessionState::Idle) return false;

    // The previous worker has already returned the controller to Idle
    if (worker_.joinable()) {
        worker_.join();
    }

    session_.id = ++next_session_id_;
    session_.state = SessionState::Recording;
    session_.start_time = std::chrono::steady_clock::now();
    emit(session_.id, SessionStatus::Recording);

    CaptureStatus status = audio_.start_recording();
    if (status != CaptureStatus::Ok) {
        std::cerr << "Session " << session_.id << ": failed to start capture ("
                  << capture_status_name(status) << ")" << std::endl;
        session_.state = SessionState::Idle;
        emit(session_.id, SessionStatus::Failed, SessionError::DeviceUnavailable);
        idle_cv_.notify_all();
        return false;
    }

    return true;
}

bool SessionController::key_up() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (session_.state != SessionState::Recording) return false;

    CapturedAudio captured = audio_.stop_recording();
    const uint64_t id = session_.id;

    if (captured.status == CaptureStatus::TooShort) {
        std::cout << "Session " << id << ": recording too short ("
                  << captured.duration_sec << "s), ignored" << std::endl;
        session_.state = SessionState::Idle;
        emit(id, SessionStatus::TooShort);
        idle_cv_.notify_all();
        return true;
    }

    if (captured.status != CaptureStatus::Ok) {
        session_.state = SessionState::Idle;
        emit(id, SessionStatus::Failed, SessionError::DeviceUnavailable,
             capture_status_name(captured.status));
        idle_cv_.notify_all();
        return true;
    }

    std::cout << "Session " << id << ": captured " << captured.duration_sec << "s ("
              << captured.wav.size() << " bytes)" << std::endl;

    session_.state = SessionState::Transcribing;
    emit(id, SessionStatus::Transcribing);

    worker_ = std::thread(&SessionController::run_transcription, this, id, std::move(captured.wav));
    return true;
}

void SessionController::run_transcription(uint64_t session_id, std::vector<uint8_t> wav) {
    try {
        TranscriptionResult result = transcriber_.transcribe(std::move(wav));
        if (!result.success()) {
            finish(session_id, SessionStatus::Failed, map_error(result.error), result.detail);
            return;
        }

        // Correction completes before anything is delivered
        std::string final_text = corrector_.apply(result.text);
        if (result.text != final_text) {
            std::cout << "  (raw: \"" << result.text << "\")" << std::endl;
        }

        if (final_text.empty()) {
            finish(session_id, SessionStatus::Empty, SessionError::None, "");
            return;
        }

        if (!delivery_.deliver(final_text)) {
            finish(session_id, SessionStatus::Failed, SessionError::DeliveryFailed, final_text);
            return;
        }

        finish(session_id, SessionStatus::Delivered, SessionError::None, final_text);
    } catch (const std::exception& e) {
        std::cerr << "Session " << session_id << ": " << e.what() << std::endl;
        finish(session_id, SessionStatus::Failed, SessionError::ServerError, e.what());
    }
}

void SessionController::finish(uint64_t session_id, SessionStatus status, SessionError error,
                               const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    session_.state = SessionState::Idle;
    emit(session_id, status, error, message);
    idle_cv_.notify_all();
}

void SessionController::emit(uint64_t session_id, SessionStatus status, SessionError error,
                             const std::string& message) {
    StatusEvent event;
    event.session_id = session_id;
    event.status = status;
    event.error = error;
    event.message = message;
    notifier_.notify(event);
}

SessionError SessionController::map_error(TranscriptionError error) {
    switch (error) {
        case TranscriptionError::None: return SessionError::None;
        case TranscriptionError::AuthFailure: return SessionError::AuthFailure;
        case TranscriptionError::RateLimited: return SessionError::RateLimited;
        case TranscriptionError::NetworkTimeout: return SessionError::NetworkTimeout;
        case TranscriptionError::PayloadTooLarge: return SessionError::PayloadTooLarge;
        case TranscriptionError::ServerError: return SessionError::ServerError;
    }
    return SessionError::ServerError;
}

SessionState SessionController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.state;
}

RecordingSession SessionController::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

bool SessionController::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this]() {
        return session_.state == SessionState::Idle;
    });
}

} // namespace talkpaste
