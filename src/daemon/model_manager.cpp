#include "model_manager.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return s.substr(start, end - start + 1);
}

} // namespace

ModelManager::ModelManager(std::unique_ptr<SpeechEngine> engine, std::string model_path,
                           std::string language)
    : engine_(std::move(engine)), model_path_(std::move(model_path)),
      language_(std::move(language)) {}

std::expected<void, ModelError> ModelManager::ensure_loaded() {
    std::lock_guard load_lock(load_mutex_);

    {
        std::unique_lock lock(state_mutex_);
        if (model_) {
            last_used_ = Clock::now();
            return {};
        }
    }

    std::error_code ec;
    if (engine_->needs_local_model() && !fs::exists(model_path_, ec)) {
        return std::unexpected(ModelError{ModelErrorKind::FileNotFound,
                                          "model file not found: " + model_path_});
    }

    auto loaded = engine_->load(model_path_);
    if (!loaded) {
        return std::unexpected(ModelError{ModelErrorKind::LoadFailed,
                                          "failed to load model: " + loaded.error()});
    }

    std::unique_lock lock(state_mutex_);
    model_ = std::move(*loaded);
    last_used_ = Clock::now();
    return {};
}

std::expected<Transcript, ModelError>
ModelManager::transcribe(std::span<const float> samples, uint32_t sample_rate) {
    std::lock_guard inference_lock(inference_mutex_);

    std::shared_ptr<SpeechModel> model;
    {
        std::shared_lock lock(state_mutex_);
        model = model_;
    }
    if (!model) {
        return std::unexpected(ModelError{ModelErrorKind::NotLoaded, "model not loaded"});
    }

    auto result = model->transcribe(samples, sample_rate, language_);
    touch();
    if (!result) {
        return std::unexpected(ModelError{ModelErrorKind::TranscriptionFailed,
                                          "transcription failed: " + result.error()});
    }

    result->text = trim(result->text);
    if (result->text.empty()) {
        result->text = std::string(no_speech_detected);
    }
    return std::move(*result);
}

bool ModelManager::unload_if_idle(std::chrono::duration<double> timeout) {
    std::unique_lock load_lock(load_mutex_, std::try_to_lock);
    if (!load_lock.owns_lock()) return false;
    std::unique_lock inference_lock(inference_mutex_, std::try_to_lock);
    if (!inference_lock.owns_lock()) return false;

    std::shared_ptr<SpeechModel> released;
    {
        std::unique_lock lock(state_mutex_);
        if (!model_ || !last_used_) return false;
        if (Clock::now() - *last_used_ <= timeout) return false;
        released = std::move(model_);
        last_used_.reset();
    }
    // `released` frees the model here, outside the state lock.
    return true;
}

bool ModelManager::is_loaded() const {
    std::shared_lock lock(state_mutex_);
    return model_ != nullptr;
}

std::optional<ModelManager::Clock::time_point> ModelManager::last_used() const {
    std::shared_lock lock(state_mutex_);
    return last_used_;
}

void ModelManager::touch() {
    std::unique_lock lock(state_mutex_);
    if (model_) last_used_ = Clock::now();
}
