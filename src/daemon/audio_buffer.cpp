#include "audio_buffer.hpp"

AudioBuffer::AudioBuffer() : last_chunk_time_(Clock::now()) {}

void AudioBuffer::append(const AudioChunk& chunk) {
    data_.insert(data_.end(), chunk.data.begin(), chunk.data.end());
    sample_rate_ = chunk.sample_rate;
    channels_ = chunk.channels;
    last_chunk_time_ = chunk.timestamp;
}

float AudioBuffer::duration_seconds() const {
    if (sample_rate_ == 0 || channels_ == 0) return 0.0f;
    return static_cast<float>(data_.size()) /
           static_cast<float>(static_cast<uint64_t>(sample_rate_) * channels_);
}

bool AudioBuffer::is_idle(std::chrono::duration<double> timeout) const {
    return is_idle(timeout, Clock::now());
}

bool AudioBuffer::is_idle(std::chrono::duration<double> timeout, Clock::time_point now) const {
    // A chunk stamped in the future counts as fresh.
    if (now <= last_chunk_time_) return false;
    return std::chrono::duration<double>(now - last_chunk_time_) > timeout;
}

std::vector<float> AudioBuffer::drain() {
    std::vector<float> out = std::move(data_);
    data_.clear();
    return out;
}

std::vector<float> downmix_to_mono(std::span<const float> samples, uint16_t channels) {
    if (channels <= 1) return {samples.begin(), samples.end()};

    size_t frames = samples.size() / channels;
    std::vector<float> mono(frames);
    for (size_t f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (uint16_t c = 0; c < channels; ++c) {
            sum += samples[f * channels + c];
        }
        mono[f] = sum / static_cast<float>(channels);
    }
    return mono;
}
