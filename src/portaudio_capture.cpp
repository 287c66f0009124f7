#include "portaudio_capture.hpp"
#include <iostream>

namespace talkpaste {

PortAudioCapture::PortAudioCapture(int sample_rate, int frames_per_buffer,
                                   double min_duration_sec, int warmup_ms)
    : AudioCapture(sample_rate, min_duration_sec, warmup_ms)
    , frames_per_buffer_(frames_per_buffer) {
}

PortAudioCapture::~PortAudioCapture() {
    shutdown();
}

bool PortAudioCapture::initialize() {
    if (initialized_) return true;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "PortAudio init failed: " << Pa_GetErrorText(err) << std::endl;
        return false;
    }

    initialized_ = true;
    return true;
}

void PortAudioCapture::shutdown() {
    if (!initialized_) return;

    if (is_recording()) {
        stop_recording();
    }
    close_stream();

    Pa_Terminate();
    initialized_ = false;
}

bool PortAudioCapture::open_stream() {
    if (!initialized_) return false;

    PaStreamParameters input_params;
    input_params.device = Pa_GetDefaultInputDevice();
    if (input_params.device == paNoDevice) {
        std::cerr << "No default input device" << std::endl;
        return false;
    }

    const PaDeviceInfo* device_info = Pa_GetDeviceInfo(input_params.device);
    if (!device_info) {
        std::cerr << "Input device info unavailable" << std::endl;
        return false;
    }

    input_params.channelCount = 1;
    input_params.sampleFormat = paInt16;
    input_params.suggestedLatency = device_info->defaultLowInputLatency;
    input_params.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_OpenStream(&stream_,
                                &input_params,
                                nullptr,  // No output
                                sample_rate(),
                                static_cast<unsigned long>(frames_per_buffer_),
                                paClipOff,
                                pa_callback,
                                this);
    if (err != paNoError) {
        std::cerr << "Failed to open stream: " << Pa_GetErrorText(err) << std::endl;
        stream_ = nullptr;
        return false;
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        std::cerr << "Failed to start stream: " << Pa_GetErrorText(err) << std::endl;
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        return false;
    }

    return true;
}

void PortAudioCapture::close_stream() {
    if (!stream_) return;

    // Pa_StopStream waits for pending callbacks to finish
    PaError err = Pa_StopStream(stream_);
    if (err != paNoError) {
        std::cerr << "Failed to stop stream: " << Pa_GetErrorText(err) << std::endl;
    }

    err = Pa_CloseStream(stream_);
    if (err != paNoError) {
        std::cerr << "Failed to close stream: " << Pa_GetErrorText(err) << std::endl;
    }
    stream_ = nullptr;
}

int PortAudioCapture::pa_callback(const void* input, void* output,
                                  unsigned long frame_count,
                                  const PaStreamCallbackTimeInfo* time_info,
                                  PaStreamCallbackFlags status_flags,
                                  void* user_data) {
    (void)output;
    (void)time_info;
    (void)status_flags;

    auto* capture = static_cast<PortAudioCapture*>(user_data);
    capture->append_samples(static_cast<const int16_t*>(input), frame_count);

    return paContinue;
}

} // namespace talkpaste
