#pragma once

#include <vector>
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <cstdint>
#include <cstddef>

namespace talkpaste {

enum class CaptureStatus {
    Ok,
    TooShort,           // Below the minimum duration; not a device fault
    DeviceUnavailable,
    NotRecording
};

const char* capture_status_name(CaptureStatus status);

// Result of stop_recording(). wav is only filled when status == Ok.
struct CapturedAudio {
    CaptureStatus status = CaptureStatus::NotRecording;
    std::vector<uint8_t> wav;
    size_t sample_count = 0;
    double duration_sec = 0.0;  // Elapsed capture time
};

// In-memory push-to-talk recorder. Buffers 16-bit mono PCM delivered by a
// device backend and turns it into a finished WAV payload on stop.
// Subclasses provide the device stream (see PortAudioCapture).
class AudioCapture {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;
    using ReadyCallback = std::function<void()>;

    AudioCapture(int sample_rate = 16000, double min_duration_sec = 0.5,
                 int warmup_ms = 250, Clock clock = nullptr);
    virtual ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    // Open the device and start buffering
    CaptureStatus start_recording();

    // Stop the device, hand the buffer to the WAV encoder, apply the minimum duration
    CapturedAudio stop_recording();

    bool is_recording() const { return recording_.load(); }
    int sample_rate() const { return sample_rate_; }
    double min_duration_sec() const { return min_duration_sec_; }

    // Samples buffered so far in the current recording
    size_t buffered_samples() const;

    // Fired once per recording, from the device thread, once warm-up audio has arrived
    void set_ready_callback(ReadyCallback callback) { ready_callback_ = callback; }

protected:
    // Device hooks. open_stream() must start delivering samples through
    // append_samples(); close_stream() must not return until delivery has stopped.
    virtual bool open_stream() = 0;
    virtual void close_stream() = 0;

    // Called by the device backend with captured samples
    void append_samples(const int16_t* samples, size_t count);

private:
    int sample_rate_;
    double min_duration_sec_;
    size_t warmup_samples_;
    Clock clock_;

    std::atomic<bool> recording_{false};
    std::chrono::steady_clock::time_point started_at_;

    std::vector<int16_t> audio_buffer_;
    mutable std::mutex buffer_mutex_;
    bool ready_fired_ = false;

    ReadyCallback ready_callback_;
};

} // namespace talkpaste
