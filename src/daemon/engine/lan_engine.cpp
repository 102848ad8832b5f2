#include "engine/lan_engine.hpp"
#include "engine/wav_encoder.hpp"

#include <chrono>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* resp = static_cast<std::string*>(userdata);
    resp->append(ptr, size * nmemb);
    return size * nmemb;
}

void add_field(curl_mime* mime, const char* name, const std::string& value) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

void add_wav(curl_mime* mime, const std::vector<uint8_t>& wav_data) {
    curl_mimepart* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");
}

struct HttpResponse {
    long status = 0;
    std::string body;
};

// Posts a multipart form built by `build` and collects the response.
template <typename Build>
std::expected<HttpResponse, std::string>
post_form(const std::string& endpoint, long timeout_s, Build&& build) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    curl_mime* mime = curl_mime_init(curl);
    build(mime);

    HttpResponse response;
    curl_easy_setopt(curl, CURLOPT_URL, endpoint.c_str());
    curl_easy_setopt(curl, CURLOPT_MIMEPOST, mime);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 10L);

    CURLcode res = curl_easy_perform(curl);
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

    curl_mime_free(mime);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        return std::unexpected(std::string("curl error: ") + curl_easy_strerror(res));
    }
    return response;
}

class LanModel : public SpeechModel {
public:
    LanModel(std::string url, std::string api_format)
        : url_(std::move(url)), api_format_(std::move(api_format)) {}

    std::expected<Transcript, std::string>
    transcribe(std::span<const float> samples, uint32_t sample_rate,
               const std::string& language) override {
        if (samples.empty()) {
            return std::unexpected("empty audio");
        }

        auto wav_data = wav::encode(samples, sample_rate);
        bool openai = api_format_ == "openai";
        std::string endpoint = url_ + (openai ? "/v1/audio/transcriptions" : "/inference");

        auto start = std::chrono::steady_clock::now();
        auto response = post_form(endpoint, 120L, [&](curl_mime* mime) {
            add_wav(mime, wav_data);
            if (openai) {
                add_field(mime, "model", "whisper-1");
            } else {
                add_field(mime, "temperature", "0.0");
            }
            add_field(mime, "response_format", "json");
            if (!language.empty()) {
                add_field(mime, "language", language);
            }
        });
        auto end = std::chrono::steady_clock::now();

        if (!response) {
            return std::unexpected(response.error());
        }

        try {
            auto j = json::parse(response->body);
            if (j.contains("text")) {
                return Transcript{
                    .text = j["text"].get<std::string>(),
                    .confidence = std::nullopt,
                    .processing_s = std::chrono::duration<double>(end - start).count(),
                };
            }
            if (j.contains("error")) {
                return std::unexpected("server error: " + j["error"].dump());
            }
            return std::unexpected("unexpected response: " + response->body);
        } catch (const json::exception& e) {
            return std::unexpected(std::string("JSON parse error: ") + e.what());
        }
    }

private:
    std::string url_;
    std::string api_format_;
};

} // namespace

LanEngine::LanEngine(std::string url, std::string api_format)
    : url_(std::move(url)), api_format_(std::move(api_format)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

LanEngine::~LanEngine() {
    curl_global_cleanup();
}

std::expected<std::unique_ptr<SpeechModel>, std::string>
LanEngine::load(const std::string& model_path) {
    if (api_format_ != "openai") {
        auto response = post_form(url_ + "/load", 300L, [&](curl_mime* mime) {
            add_field(mime, "model", model_path);
        });
        if (!response) {
            return std::unexpected(response.error());
        }
        if (response->status != 200) {
            return std::unexpected("server rejected model (HTTP " +
                                   std::to_string(response->status) + "): " + response->body);
        }
    }
    return std::make_unique<LanModel>(url_, api_format_);
}
