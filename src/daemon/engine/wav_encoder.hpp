#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <span>
#include <vector>

// Encodes mono float samples in [-1, 1] into a 16-bit PCM WAV file in memory.
namespace wav {

inline int16_t to_pcm16(float sample) {
    float clamped = std::clamp(sample, -1.0f, 1.0f);
    return static_cast<int16_t>(std::lround(clamped * 32767.0f));
}

inline std::vector<uint8_t> encode(std::span<const float> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    constexpr size_t header_size = 44;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    std::vector<uint8_t> out(header_size + data_size);
    size_t pos = 0;
    auto put = [&out, &pos](const void* data, size_t len) {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto put16 = [&put](uint16_t v) { put(&v, 2); };
    auto put32 = [&put](uint32_t v) { put(&v, 4); };

    put("RIFF", 4);
    put32(36 + data_size);
    put("WAVE", 4);
    put("fmt ", 4);
    put32(16);
    put16(1); // PCM
    put16(channels);
    put32(sample_rate);
    put32(byte_rate);
    put16(block_align);
    put16(bits_per_sample);
    put("data", 4);
    put32(data_size);

    for (float s : samples) {
        put16(static_cast<uint16_t>(to_pcm16(s)));
    }
    return out;
}

} // namespace wav
