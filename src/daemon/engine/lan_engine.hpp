#pragma once

#include "engine/speech_engine.hpp"

#include <string>

// Delegates inference to a whisper.cpp server or an OpenAI-compatible
// transcription endpoint over HTTP.
class LanEngine : public SpeechEngine {
public:
    // api_format: "whisper.cpp" or "openai"
    explicit LanEngine(std::string url, std::string api_format = "whisper.cpp");
    ~LanEngine() override;

    // whisper.cpp servers are asked to switch to `model_path` via /load.
    // OpenAI-compatible servers manage their own models; nothing is sent.
    std::expected<std::unique_ptr<SpeechModel>, std::string>
        load(const std::string& model_path) override;

    bool needs_local_model() const override { return false; }

private:
    std::string url_;
    std::string api_format_;
};
