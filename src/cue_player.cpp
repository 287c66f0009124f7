#include "cue_player.hpp"
#include <portaudio.h>
#include <iostream>
#include <algorithm>
#include <cmath>

namespace talkpaste {

CuePlayer::CuePlayer(int frequency_hz, int duration_ms, int sample_rate)
    : sample_rate_(sample_rate)
    , tone_(make_tone(frequency_hz, duration_ms, sample_rate)) {
}

CuePlayer::~CuePlayer() {
    shutdown();
}

bool CuePlayer::initialize() {
    if (initialized_.load()) return true;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "PortAudio init failed (cue): " << Pa_GetErrorText(err) << std::endl;
        return false;
    }

    quit_ = false;
    worker_ = std::thread([this]() { run_loop(); });
    initialized_.store(true);
    return true;
}

void CuePlayer::shutdown() {
    if (!initialized_.load()) return;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        quit_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }

    Pa_Terminate();
    initialized_.store(false);
}

void CuePlayer::play() {
    if (!initialized_.load()) return;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = true;
    }
    cv_.notify_one();
}

std::vector<int16_t> CuePlayer::make_tone(int frequency_hz, int duration_ms,
                                          int sample_rate, float amplitude) {
    const size_t n = static_cast<size_t>(sample_rate) * static_cast<size_t>(duration_ms) / 1000;
    std::vector<int16_t> tone(n);

    // 5ms fade in/out to avoid clicks
    const size_t fade = std::min(n / 2, static_cast<size_t>(sample_rate / 200));
    const double step = 2.0 * M_PI * frequency_hz / sample_rate;

    for (size_t i = 0; i < n; ++i) {
        double gain = amplitude;
        if (fade > 0 && i < fade) {
            gain *= static_cast<double>(i) / fade;
        } else if (fade > 0 && i >= n - fade) {
            gain *= static_cast<double>(n - 1 - i) / fade;
        }
        tone[i] = static_cast<int16_t>(std::lround(32767.0 * gain * std::sin(step * i)));
    }
    return tone;
}

void CuePlayer::run_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return pending_ || quit_; });
            if (quit_) return;
            pending_ = false;
        }
        play_blocking();
    }
}

void CuePlayer::play_blocking() {
    PaStream* stream = nullptr;
    PaError err = Pa_OpenDefaultStream(&stream,
                                       0,          // No input
                                       1,          // Mono output
                                       paInt16,
                                       sample_rate_,
                                       paFramesPerBufferUnspecified,
                                       nullptr,    // Blocking API
                                       nullptr);
    if (err != paNoError) {
        // No output device: the cue is best-effort, capture continues
        std::cerr << "Cue tone unavailable: " << Pa_GetErrorText(err) << std::endl;
        return;
    }

    err = Pa_StartStream(stream);
    if (err == paNoError) {
        err = Pa_WriteStream(stream, tone_.data(), static_cast<unsigned long>(tone_.size()));
        if (err != paNoError && err != paOutputUnderflowed) {
            std::cerr << "Cue tone write failed: " << Pa_GetErrorText(err) << std::endl;
        }
        Pa_StopStream(stream);
    } else {
        std::cerr << "Cue tone start failed: " << Pa_GetErrorText(err) << std::endl;
    }
    Pa_CloseStream(stream);
}

} // namespace talkpaste
