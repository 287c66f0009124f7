#pragma once

#include <vector>
#include <atomic>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <cstdint>

namespace talkpaste {

// Plays the "capture is live" tone on the default output device.
// play() only signals the worker thread, so it is safe to call from the
// audio input callback.
class CuePlayer {
public:
    CuePlayer(int frequency_hz = 1000, int duration_ms = 200, int sample_rate = 16000);
    ~CuePlayer();

    bool initialize();
    void shutdown();

    void play();

    // Sine tone with short fades, exposed for testing
    static std::vector<int16_t> make_tone(int frequency_hz, int duration_ms,
                                          int sample_rate, float amplitude = 0.3f);

private:
    void run_loop();
    void play_blocking();

    int sample_rate_;
    std::vector<int16_t> tone_;

    std::thread worker_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool pending_ = false;
    bool quit_ = false;
    std::atomic<bool> initialized_{false};
};

} // namespace talkpaste
