#pragma once

#include "config.hpp"
#include "engine/speech_engine.hpp"

#include <memory>

// Returns nullptr if `model.engine` names an engine that is unknown or was
// not compiled in.
std::unique_ptr<SpeechEngine> make_speech_engine(const Config::Model& model);
