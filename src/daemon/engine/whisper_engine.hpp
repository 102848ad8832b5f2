#pragma once

#include "engine/speech_engine.hpp"

#include <vector>

// In-process inference through whisper.cpp.
class WhisperEngine : public SpeechEngine {
public:
    explicit WhisperEngine(int threads = 4);

    std::expected<std::unique_ptr<SpeechModel>, std::string>
        load(const std::string& model_path) override;

private:
    int threads_;
};

// Linear-interpolation resampler for feeding the model at its native rate.
std::vector<float> resample_linear(std::span<const float> samples, uint32_t from_rate,
                                   uint32_t to_rate);
