#pragma once

#include "audio_capture.hpp"
#include <portaudio.h>

namespace talkpaste {

// AudioCapture backed by the default PortAudio input device.
// The stream is opened per recording so a device that disappears between
// sessions is reported as DeviceUnavailable on the next start.
class PortAudioCapture : public AudioCapture {
public:
    PortAudioCapture(int sample_rate = 16000, int frames_per_buffer = 512,
                     double min_duration_sec = 0.5, int warmup_ms = 250);
    ~PortAudioCapture() override;

    bool initialize();
    void shutdown();

protected:
    bool open_stream() override;
    void close_stream() override;

private:
    static int pa_callback(const void* input, void* output,
                          unsigned long frame_count,
                          const PaStreamCallbackTimeInfo* time_info,
                          PaStreamCallbackFlags status_flags,
                          void* user_data);

    int frames_per_buffer_;
    PaStream* stream_ = nullptr;
    bool initialized_ = false;
};

} // namespace talkpaste
