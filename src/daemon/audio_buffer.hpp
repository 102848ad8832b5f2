#pragma once

#include "protocol/messages.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

// Per-session accumulator of interleaved float samples.
// Sample rate and channel count follow the most recently appended chunk.
class AudioBuffer {
public:
    using Clock = std::chrono::system_clock;

    AudioBuffer();

    void append(const AudioChunk& chunk);

    // sample_count / (sample_rate * channels), 0 if either is zero.
    float duration_seconds() const;

    // True when more than `timeout` has passed since the last chunk.
    bool is_idle(std::chrono::duration<double> timeout) const;
    bool is_idle(std::chrono::duration<double> timeout, Clock::time_point now) const;

    // Moves the accumulated samples out, leaving the buffer empty.
    std::vector<float> drain();

    bool empty() const { return data_.empty(); }
    size_t sample_count() const { return data_.size(); }
    uint32_t sample_rate() const { return sample_rate_; }
    uint16_t channels() const { return channels_; }
    Clock::time_point last_chunk_time() const { return last_chunk_time_; }

private:
    std::vector<float> data_;
    uint32_t sample_rate_ = 16000;
    uint16_t channels_ = 1;
    Clock::time_point last_chunk_time_;
};

// Averages interleaved frames into a single channel.
std::vector<float> downmix_to_mono(std::span<const float> samples, uint16_t channels);
