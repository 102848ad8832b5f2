#pragma once

#include "protocol/wire_codec.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

struct Config {
    struct Model {
        std::string engine = "whisper"; // "whisper" (local) or "lan"
        std::string path = "models/ggml-base.en.bin";
        uint32_t timeout_seconds = 300;
        std::string language = "en";
        uint32_t threads = 4;
        std::string url = "http://localhost:8080";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
    } model;

    struct Audio {
        std::string device; // empty: default source
        uint32_t sample_rate = 16000;
        uint16_t channels = 1;
        uint32_t buffer_size = 1024;
        float vad_threshold = 0.5f; // initial VAD sensitivity
        uint32_t chunk_ms = 100;

        // Two seconds of interleaved samples.
        size_t ring_capacity() const {
            return static_cast<size_t>(sample_rate) * channels * 2;
        }
    } audio;

    struct Ipc {
        std::string socket_path; // empty: platform default
        size_t max_frame_bytes = wire::default_max_frame_bytes;
        uint32_t timeout_seconds = 30;

        std::string endpoint() const;
    } ipc;

    struct Daemon {
        uint32_t workers = 2;
        uint32_t idle_check_seconds = 30;
        uint32_t session_timeout_seconds = 600; // 0 disables expiry
    } daemon;

    static Config load(const std::string& path);
    static Config load_default();
};
