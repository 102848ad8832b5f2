#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string Config::Ipc::endpoint() const {
    if (!socket_path.empty()) return socket_path;
    return platform::ipc_endpoint();
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("model")) {
            auto& m = j["model"];
            if (m.contains("engine")) cfg.model.engine = m["engine"].get<std::string>();
            if (m.contains("path")) cfg.model.path = m["path"].get<std::string>();
            if (m.contains("timeout_seconds")) cfg.model.timeout_seconds = m["timeout_seconds"].get<uint32_t>();
            if (m.contains("language")) cfg.model.language = m["language"].get<std::string>();
            if (m.contains("threads")) cfg.model.threads = m["threads"].get<uint32_t>();
            if (m.contains("url")) cfg.model.url = m["url"].get<std::string>();
            if (m.contains("api_format")) cfg.model.api_format = m["api_format"].get<std::string>();
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            if (a.contains("device")) cfg.audio.device = a["device"].get<std::string>();
            if (a.contains("sample_rate")) cfg.audio.sample_rate = a["sample_rate"].get<uint32_t>();
            if (a.contains("channels")) cfg.audio.channels = a["channels"].get<uint16_t>();
            if (a.contains("buffer_size")) cfg.audio.buffer_size = a["buffer_size"].get<uint32_t>();
            if (a.contains("vad_threshold")) cfg.audio.vad_threshold = a["vad_threshold"].get<float>();
            if (a.contains("chunk_ms")) cfg.audio.chunk_ms = a["chunk_ms"].get<uint32_t>();
        }

        if (j.contains("ipc")) {
            auto& i = j["ipc"];
            if (i.contains("socket_path")) cfg.ipc.socket_path = i["socket_path"].get<std::string>();
            if (i.contains("max_frame_bytes")) cfg.ipc.max_frame_bytes = i["max_frame_bytes"].get<size_t>();
            if (i.contains("timeout_seconds")) cfg.ipc.timeout_seconds = i["timeout_seconds"].get<uint32_t>();
        }

        if (j.contains("daemon")) {
            auto& d = j["daemon"];
            if (d.contains("workers")) cfg.daemon.workers = d["workers"].get<uint32_t>();
            if (d.contains("idle_check_seconds")) cfg.daemon.idle_check_seconds = d["idle_check_seconds"].get<uint32_t>();
            if (d.contains("session_timeout_seconds")) cfg.daemon.session_timeout_seconds = d["session_timeout_seconds"].get<uint32_t>();
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (cfg.audio.sample_rate == 0 || cfg.audio.channels == 0) {
        std::println(stderr, "config: audio.sample_rate and audio.channels must be non-zero, "
                             "using {} Hz x {}", Config::Audio{}.sample_rate, Config::Audio{}.channels);
        cfg.audio.sample_rate = Config::Audio{}.sample_rate;
        cfg.audio.channels = Config::Audio{}.channels;
    }

    return cfg;
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
