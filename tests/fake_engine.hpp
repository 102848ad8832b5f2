#pragma once

#include "engine/speech_engine.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

// Shared view of what the fake engine was asked to do.
struct FakeEngineState {
    std::atomic<int> loads_started{0};
    std::atomic<int> loads{0};
    std::atomic<int> transcriptions{0};
    std::atomic<int> live_models{0};
    std::atomic<int> concurrent{0};
    std::atomic<int> max_concurrent{0};

    std::chrono::milliseconds load_delay{0};
    std::chrono::milliseconds transcribe_delay{0};
    bool fail_load = false;
    bool fail_transcribe = false;
    bool remote = false; // model path lives on another host
    std::string text = "  hello world \n";
    std::optional<float> confidence = 0.9f;

    std::mutex mutex;
    std::vector<size_t> sample_counts;
    std::vector<uint32_t> sample_rates;
};

class FakeModel : public SpeechModel {
public:
    explicit FakeModel(std::shared_ptr<FakeEngineState> state) : state_(std::move(state)) {
        state_->live_models++;
    }
    ~FakeModel() override { state_->live_models--; }

    std::expected<Transcript, std::string>
    transcribe(std::span<const float> samples, uint32_t sample_rate,
               const std::string& /*language*/) override {
        int now = ++state_->concurrent;
        int prev = state_->max_concurrent.load();
        while (now > prev && !state_->max_concurrent.compare_exchange_weak(prev, now)) {}

        std::this_thread::sleep_for(state_->transcribe_delay);
        {
            std::lock_guard lock(state_->mutex);
            state_->sample_counts.push_back(samples.size());
            state_->sample_rates.push_back(sample_rate);
        }
        state_->transcriptions++;
        state_->concurrent--;

        if (state_->fail_transcribe) {
            return std::unexpected("decoder exploded");
        }
        return Transcript{.text = state_->text, .confidence = state_->confidence, .processing_s = 0.0};
    }

private:
    std::shared_ptr<FakeEngineState> state_;
};

class FakeEngine : public SpeechEngine {
public:
    explicit FakeEngine(std::shared_ptr<FakeEngineState> state) : state_(std::move(state)) {}

    std::expected<std::unique_ptr<SpeechModel>, std::string>
    load(const std::string& /*model_path*/) override {
        state_->loads_started++;
        std::this_thread::sleep_for(state_->load_delay);
        state_->loads++;
        if (state_->fail_load) {
            return std::unexpected("corrupt model");
        }
        return std::make_unique<FakeModel>(state_);
    }

    bool needs_local_model() const override { return !state_->remote; }

private:
    std::shared_ptr<FakeEngineState> state_;
};

// Temporary file standing in for a model on disk.
struct TmpModelFile {
    std::string path;

    TmpModelFile() {
        path = std::filesystem::temp_directory_path() / "dictation_test_model_XXXXXX";
        std::vector<char> tmpl(path.begin(), path.end());
        tmpl.push_back('\0');
        int fd = mkstemp(tmpl.data());
        path.assign(tmpl.data());
        if (fd >= 0) ::close(fd);
    }

    ~TmpModelFile() {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};
