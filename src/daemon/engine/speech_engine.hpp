#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>

struct Transcript {
    std::string text;
    std::optional<float> confidence;
    double processing_s = 0.0;
};

// A loaded model. Implementations are not safe for concurrent transcribe()
// calls; ModelManager serializes access. Destroying it unloads the model.
class SpeechModel {
public:
    virtual ~SpeechModel() = default;
    virtual std::expected<Transcript, std::string>
        transcribe(std::span<const float> samples, uint32_t sample_rate,
                   const std::string& language) = 0;
};

class SpeechEngine {
public:
    virtual ~SpeechEngine() = default;
    virtual std::expected<std::unique_ptr<SpeechModel>, std::string>
        load(const std::string& model_path) = 0;

    // False when `model_path` names a file on another host.
    virtual bool needs_local_model() const { return true; }
};
