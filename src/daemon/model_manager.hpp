#pragma once

#include "engine/speech_engine.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>

inline constexpr std::string_view no_speech_detected = "[No speech detected]";

enum class ModelErrorKind { FileNotFound, LoadFailed, NotLoaded, TranscriptionFailed };

struct ModelError {
    ModelErrorKind kind;
    std::string message;
};

// Owns the single speech model: loads it on first use, releases it after an
// idle period, and runs one transcription at a time.
class ModelManager {
public:
    using Clock = std::chrono::steady_clock;

    ModelManager(std::unique_ptr<SpeechEngine> engine, std::string model_path,
                 std::string language);

    ModelManager(const ModelManager&) = delete;
    ModelManager& operator=(const ModelManager&) = delete;

    // Loads the model unless already loaded; either way stamps last-used.
    // Concurrent callers wait for a single in-progress load.
    std::expected<void, ModelError> ensure_loaded();

    // Trimmed transcript; empty output becomes `no_speech_detected`.
    std::expected<Transcript, ModelError>
        transcribe(std::span<const float> samples, uint32_t sample_rate);

    // Releases the model if it has not been used for longer than `timeout`.
    // Returns false without waiting when a load or transcription is running.
    bool unload_if_idle(std::chrono::duration<double> timeout);

    // Never waits on a load in progress.
    bool is_loaded() const;
    std::optional<Clock::time_point> last_used() const;

    const std::string& model_path() const { return model_path_; }

private:
    void touch();

    std::unique_ptr<SpeechEngine> engine_;
    std::string model_path_;
    std::string language_;

    std::mutex load_mutex_;
    std::mutex inference_mutex_;

    mutable std::shared_mutex state_mutex_; // guards model_ and last_used_
    std::shared_ptr<SpeechModel> model_;
    std::optional<Clock::time_point> last_used_;
};
