#include "wav_encoder.hpp"
#include <cstring>

namespace talkpaste {

namespace {

void put_u16_le(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void put_u32_le(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

void put_tag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

uint16_t get_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t get_u32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

} // namespace

std::vector<uint8_t> encode_wav(const std::vector<int16_t>& samples, int sample_rate) {
    constexpr uint16_t kChannels = 1;
    constexpr uint16_t kBitsPerSample = 16;
    const uint16_t block_align = kChannels * (kBitsPerSample / 8);
    const uint32_t byte_rate = static_cast<uint32_t>(sample_rate) * block_align;
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out;
    out.reserve(WAV_HEADER_SIZE + data_size);

    put_tag(out, "RIFF");
    put_u32_le(out, 36 + data_size);
    put_tag(out, "WAVE");

    put_tag(out, "fmt ");
    put_u32_le(out, 16);            // PCM fmt chunk size
    put_u16_le(out, 1);             // PCM
    put_u16_le(out, kChannels);
    put_u32_le(out, static_cast<uint32_t>(sample_rate));
    put_u32_le(out, byte_rate);
    put_u16_le(out, block_align);
    put_u16_le(out, kBitsPerSample);

    put_tag(out, "data");
    put_u32_le(out, data_size);

    // Samples are written little-endian regardless of host order
    for (int16_t s : samples) {
        put_u16_le(out, static_cast<uint16_t>(s));
    }

    return out;
}

bool decode_wav(const std::vector<uint8_t>& payload, WavInfo& info, std::string& error) {
    info = WavInfo{};

    if (payload.size() < 12 ||
        std::memcmp(payload.data(), "RIFF", 4) != 0 ||
        std::memcmp(payload.data() + 8, "WAVE", 4) != 0) {
        error = "not a RIFF/WAVE payload";
        return false;
    }

    info.riff_size = get_u32_le(payload.data() + 4);
    if (static_cast<size_t>(info.riff_size) + 8 != payload.size()) {
        error = "RIFF size does not match payload size";
        return false;
    }

    bool have_fmt = false;
    size_t pos = 12;
    while (pos + 8 <= payload.size()) {
        const uint8_t* chunk = payload.data() + pos;
        uint32_t chunk_size = get_u32_le(chunk + 4);
        size_t body = pos + 8;

        if (body + chunk_size > payload.size()) {
            error = "chunk extends past end of payload";
            return false;
        }

        if (std::memcmp(chunk, "fmt ", 4) == 0) {
            if (chunk_size < 16) {
                error = "fmt chunk too small";
                return false;
            }
            uint16_t format = get_u16_le(payload.data() + body);
            info.channels = get_u16_le(payload.data() + body + 2);
            info.sample_rate = get_u32_le(payload.data() + body + 4);
            info.bits_per_sample = get_u16_le(payload.data() + body + 14);
            if (format != 1 || info.bits_per_sample != 16) {
                error = "only 16-bit PCM is supported";
                return false;
            }
            have_fmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            if (!have_fmt) {
                error = "data chunk before fmt chunk";
                return false;
            }
            info.data_size = chunk_size;
            size_t count = chunk_size / sizeof(int16_t);
            info.samples.resize(count);
            for (size_t i = 0; i < count; ++i) {
                info.samples[i] = static_cast<int16_t>(get_u16_le(payload.data() + body + i * 2));
            }
            return true;
        }

        // Chunks are padded to even sizes
        pos = body + chunk_size + (chunk_size & 1);
    }

    error = "no data chunk";
    return false;
}

} // namespace talkpaste
