#include "audio_capture.hpp"
#include "wav_encoder.hpp"
#include <iostream>
#include <utility>

namespace talkpaste {

const char* capture_status_name(CaptureStatus status) {
    switch (status) {
        case CaptureStatus::Ok: return "ok";
        case CaptureStatus::TooShort: return "too short";
        case CaptureStatus::DeviceUnavailable: return "device unavailable";
        case CaptureStatus::NotRecording: return "not recording";
    }
    return "unknown";
}

AudioCapture::AudioCapture(int sample_rate, double min_duration_sec, int warmup_ms, Clock clock)
    : sample_rate_(sample_rate)
    , min_duration_sec_(min_duration_sec)
    , warmup_samples_(static_cast<size_t>(sample_rate) * static_cast<size_t>(warmup_ms) / 1000)
    , clock_(clock ? std::move(clock) : Clock(std::chrono::steady_clock::now)) {
}

AudioCapture::~AudioCapture() = default;

CaptureStatus AudioCapture::start_recording() {
    if (recording_.load()) return CaptureStatus::Ok;

    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        audio_buffer_.clear();
        audio_buffer_.reserve(static_cast<size_t>(sample_rate_) * 30);  // Reserve for 30 seconds
        ready_fired_ = false;
    }

    // Must be set before the stream starts so the first callback is kept
    recording_.store(true);
    started_at_ = clock_();

    if (!open_stream()) {
        recording_.store(false);
        std::cerr << "No usable audio input device" << std::endl;
        return CaptureStatus::DeviceUnavailable;
    }

    return CaptureStatus::Ok;
}

CapturedAudio AudioCapture::stop_recording() {
    CapturedAudio result;
    if (!recording_.load()) return result;

    close_stream();
    recording_.store(false);

    auto elapsed = clock_() - started_at_;
    result.duration_sec = std::chrono::duration<double>(elapsed).count();

    // The stream is closed, so nothing appends any more: take the buffer
    std::vector<int16_t> samples;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        samples = std::move(audio_buffer_);
        audio_buffer_ = std::vector<int16_t>();
    }
    result.sample_count = samples.size();

    if (result.duration_sec < min_duration_sec_ || samples.empty()) {
        result.status = CaptureStatus::TooShort;
        return result;
    }

    result.wav = encode_wav(samples, sample_rate_);
    result.status = CaptureStatus::Ok;
    return result;
}

size_t AudioCapture::buffered_samples() const {
    std::lock_guard<std::mutex> lock(buffer_mutex_);
    return audio_buffer_.size();
}

void AudioCapture::append_samples(const int16_t* samples, size_t count) {
    if (!recording_.load() || samples == nullptr || count == 0) return;

    bool fire_ready = false;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        audio_buffer_.insert(audio_buffer_.end(), samples, samples + count);
        if (!ready_fired_ && audio_buffer_.size() >= warmup_samples_) {
            ready_fired_ = true;
            fire_ready = true;
        }
    }

    if (fire_ready && ready_callback_) {
        ready_callback_();
    }
}

} // namespace talkpaste
