#include "engine/whisper_engine.hpp"

#include <chrono>
#include <cmath>
#include <vector>
#include <whisper.h>

namespace {

class WhisperModel : public SpeechModel {
public:
    WhisperModel(whisper_context* ctx, int threads) : ctx_(ctx), threads_(threads) {}
    ~WhisperModel() override { whisper_free(ctx_); }

    WhisperModel(const WhisperModel&) = delete;
    WhisperModel& operator=(const WhisperModel&) = delete;

    std::expected<Transcript, std::string>
    transcribe(std::span<const float> samples, uint32_t sample_rate,
               const std::string& language) override {
        if (samples.empty()) {
            return std::unexpected("empty audio");
        }

        std::vector<float> pcm;
        if (sample_rate == WHISPER_SAMPLE_RATE) {
            pcm.assign(samples.begin(), samples.end());
        } else {
            pcm = resample_linear(samples, sample_rate, WHISPER_SAMPLE_RATE);
        }

        whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        wparams.print_progress = false;
        wparams.print_special = false;
        wparams.print_realtime = false;
        wparams.print_timestamps = false;
        wparams.translate = false;
        wparams.no_context = true;
        wparams.no_timestamps = true;
        wparams.n_threads = threads_;
        wparams.language = language.empty() ? "auto" : language.c_str();

        auto start = std::chrono::steady_clock::now();
        if (whisper_full(ctx_, wparams, pcm.data(), static_cast<int>(pcm.size())) != 0) {
            return std::unexpected("whisper_full failed");
        }
        auto end = std::chrono::steady_clock::now();

        std::string text;
        double prob_sum = 0.0;
        int prob_count = 0;
        whisper_token eot = whisper_token_eot(ctx_);

        int n_segments = whisper_full_n_segments(ctx_);
        for (int i = 0; i < n_segments; ++i) {
            if (const char* seg = whisper_full_get_segment_text(ctx_, i)) {
                text += seg;
            }
            int n_tokens = whisper_full_n_tokens(ctx_, i);
            for (int t = 0; t < n_tokens; ++t) {
                // Special tokens (timestamps, markers) sort after end-of-text.
                if (whisper_full_get_token_id(ctx_, i, t) >= eot) continue;
                prob_sum += whisper_full_get_token_p(ctx_, i, t);
                ++prob_count;
            }
        }

        Transcript result;
        result.text = std::move(text);
        if (prob_count > 0) {
            result.confidence = static_cast<float>(prob_sum / prob_count);
        }
        result.processing_s = std::chrono::duration<double>(end - start).count();
        return result;
    }

private:
    whisper_context* ctx_;
    int threads_;
};

} // namespace

std::vector<float> resample_linear(std::span<const float> samples, uint32_t from_rate,
                                   uint32_t to_rate) {
    if (samples.empty() || from_rate == 0 || from_rate == to_rate) {
        return {samples.begin(), samples.end()};
    }

    double ratio = static_cast<double>(from_rate) / to_rate;
    auto out_len = static_cast<size_t>(std::floor(samples.size() / ratio));
    std::vector<float> out(out_len);
    for (size_t i = 0; i < out_len; ++i) {
        double pos = i * ratio;
        auto idx = static_cast<size_t>(pos);
        double frac = pos - idx;
        float a = samples[idx];
        float b = idx + 1 < samples.size() ? samples[idx + 1] : a;
        out[i] = static_cast<float>(a + (b - a) * frac);
    }
    return out;
}

WhisperEngine::WhisperEngine(int threads) : threads_(threads) {}

std::expected<std::unique_ptr<SpeechModel>, std::string>
WhisperEngine::load(const std::string& model_path) {
    whisper_context_params cparams = whisper_context_default_params();
    whisper_context* ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);
    if (!ctx) {
        return std::unexpected("whisper_init_from_file_with_params failed for " + model_path);
    }
    return std::make_unique<WhisperModel>(ctx, threads_);
}
