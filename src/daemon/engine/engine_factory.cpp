#include "engine/engine_factory.hpp"

#include "engine/lan_engine.hpp"

#ifdef DICTATION_HAVE_WHISPER
#include "engine/whisper_engine.hpp"
#endif

std::unique_ptr<SpeechEngine> make_speech_engine(const Config::Model& model) {
    if (model.engine == "lan") {
        return std::make_unique<LanEngine>(model.url, model.api_format);
    }
#ifdef DICTATION_HAVE_WHISPER
    if (model.engine == "whisper") {
        return std::make_unique<WhisperEngine>(static_cast<int>(model.threads));
    }
#endif
    return nullptr;
}
