#pragma once

#include <vector>
#include <string>
#include <cstdint>

namespace talkpaste {

// Size of the canonical 44-byte PCM header written by encode_wav()
constexpr size_t WAV_HEADER_SIZE = 44;

// Parsed view of a PCM WAV payload
struct WavInfo {
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    uint32_t riff_size = 0;     // RIFF chunk size as declared in the header
    uint32_t data_size = 0;     // data chunk size as declared in the header
    std::vector<int16_t> samples;
};

// Serialize finished mono 16-bit PCM samples into a RIFF/WAVE payload.
// The header carries the exact data size; there is no streaming form.
std::vector<uint8_t> encode_wav(const std::vector<int16_t>& samples, int sample_rate);

// Parse a 16-bit PCM WAV payload. Returns false (with error set) on a malformed
// header or a data chunk that does not match the declared size.
bool decode_wav(const std::vector<uint8_t>& payload, WavInfo& info, std::string& error);

// Duration in seconds of a sample count at a given rate
inline double samples_to_seconds(size_t samples, int sample_rate) {
    return sample_rate > 0 ? static_cast<double>(samples) / sample_rate : 0.0;
}

} // namespace talkpaste
