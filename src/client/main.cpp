#include "config.hpp"
#include "platform/linux/pipewire_capture.hpp"
#include "platform/linux/unix_socket_client.hpp"
#include "sample_ring.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <print>
#include <string>
#include <thread>

namespace {

// Transcription can take far longer than an ordinary request.
constexpr int stop_timeout_ms = 300'000;

std::atomic<bool> g_interrupted{false};

void on_signal(int) {
    g_interrupted.store(true);
}

void usage(const char* prog) {
    std::println(stderr, "Usage: {} [-c PATH] <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  status                  Show daemon status");
    std::println(stderr, "  record [--seconds N]    Record from the microphone until Ctrl-C or N seconds");
    std::println(stderr, "  stop                    Stop all recordings and transcribe");
    std::println(stderr, "  clear                   Discard all sessions without transcribing");
    std::println(stderr, "  sensitivity <0..1>      Set voice activity sensitivity");
    std::println(stderr, "  shutdown                Stop the daemon");
}

void print_status(const DaemonStatus& s) {
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(s.uptime);
    std::println("Model: {}", s.model_loaded ? "loaded" : "not loaded");
    std::println("Active sessions: {}", s.active_sessions.size());
    for (const auto& id : s.active_sessions) {
        std::println("  {}", id.to_string());
    }
    std::println("Uptime: {}s", uptime.count());
    std::println("Audio device: {} (buffer {})", s.audio_device, s.buffer_size);
    std::println("VAD sensitivity: {:.2f}", s.vad_sensitivity);
}

// Prints a reply to a one-shot command. Returns the exit code.
int report(const std::expected<DaemonMessage, wire::Error>& reply) {
    if (!reply) {
        std::println(stderr, "No response from daemon: {}", reply.error().message);
        return 1;
    }

    return std::visit(overloaded{
        [](const msg::Error& m) {
            std::println(stderr, "Error: {}", m.message);
            return 1;
        },
        [](const msg::Status& m) {
            print_status(m.status);
            return 0;
        },
        [](const msg::TranscriptionComplete& m) {
            if (m.session.status.state == SessionState::Failed) {
                std::println(stderr, "Transcription failed: {}", m.session.status.reason);
                return 1;
            }
            std::println("{}", m.session.text);
            return 0;
        },
        [](const auto& m) {
            std::println("{}", message_name(DaemonMessage(m)));
            return 0;
        },
    }, *reply);
}

int record(UnixSocketClient& client, const Config& config, int seconds, int timeout_ms) {
    auto started = client.request(msg::StartRecording{}, timeout_ms);
    if (!started || !std::holds_alternative<msg::RecordingStarted>(*started)) {
        return report(started);
    }
    SessionId session_id = std::get<msg::RecordingStarted>(*started).session_id;

    SampleRing ring(config.audio.ring_capacity());
    PipeWireCapture capture(ring, {
        .sample_rate = config.audio.sample_rate,
        .channels = config.audio.channels,
        .device = config.audio.device,
    });
    if (!capture.start()) {
        client.request(msg::ClearSession{}, timeout_ms);
        return 1;
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::println(stderr, "Recording {} (Ctrl-C to stop)", session_id.to_string());

    // Sends whatever has been captured; false once the daemon stops accepting audio.
    auto flush = [&]() {
        auto samples = ring.pop_all();
        if (samples.empty()) return true;

        AudioChunk chunk{
            .session_id = session_id,
            .data = std::move(samples),
            .sample_rate = capture.sample_rate(),
            .channels = capture.channels(),
            .timestamp = std::chrono::system_clock::now(),
        };
        auto ack = client.request(msg::StreamAudio{std::move(chunk)}, timeout_ms);
        if (!ack) {
            std::println(stderr, "Lost connection to daemon: {}", ack.error().message);
            return false;
        }
        if (auto* err = std::get_if<msg::Error>(&*ack)) {
            std::println(stderr, "Recording ended: {}", err->message);
            return false;
        }
        return true;
    };

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    auto interval = std::chrono::milliseconds(std::max<uint32_t>(config.audio.chunk_ms, 10));
    bool accepted = true;

    while (!g_interrupted.load() && accepted) {
        if (seconds > 0 && std::chrono::steady_clock::now() >= deadline) break;
        std::this_thread::sleep_for(interval);
        accepted = flush();
    }

    capture.stop();
    if (!accepted || !flush()) {
        return 1;
    }

    if (capture.dropped_frames() > 0) {
        std::println(stderr, "Warning: {} of {} audio frames dropped", capture.dropped_frames(),
                     capture.captured_frames() + capture.dropped_frames());
    }

    std::println(stderr, "Transcribing...");
    return report(client.request(msg::StopRecording{}, std::max(timeout_ms, stop_timeout_ms)));
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_path;
    int argi = 1;
    if (argi + 1 < argc && (std::string(argv[argi]) == "-c" || std::string(argv[argi]) == "--config")) {
        config_path = argv[argi + 1];
        argi += 2;
    }

    if (argi >= argc) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[argi++];
    int seconds = 0;
    float sensitivity = -1.0f;

    for (int i = argi; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--seconds" && i + 1 < argc) {
            seconds = std::atoi(argv[++i]);
        } else if (command == "sensitivity") {
            char* end = nullptr;
            sensitivity = std::strtof(arg.c_str(), &end);
            if (end == arg.c_str() || *end != '\0') sensitivity = -1.0f;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    int timeout_ms = static_cast<int>(config.ipc.timeout_seconds) * 1000;

    ClientMessage message;
    if (command == "status") {
        message = msg::GetStatus{};
    } else if (command == "stop") {
        message = msg::StopRecording{};
    } else if (command == "clear") {
        message = msg::ClearSession{};
    } else if (command == "shutdown") {
        message = msg::Shutdown{};
    } else if (command == "sensitivity") {
        if (sensitivity < 0.0f || sensitivity > 1.0f) {
            std::println(stderr, "sensitivity expects a value between 0 and 1");
            return 1;
        }
        message = msg::SetSensitivity{sensitivity};
    } else if (command != "record") {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client(config.ipc.max_frame_bytes);
    auto sock_path = config.ipc.endpoint();
    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is dictation-daemon running?");
        return 1;
    }

    if (command == "record") {
        return record(client, config, seconds, timeout_ms);
    }

    if (command == "shutdown") {
        // The daemon exits without replying.
        if (!client.send(message)) {
            std::println(stderr, "Failed to send command");
            return 1;
        }
        std::println("Shutdown requested");
        return 0;
    }

    if (command == "stop") {
        timeout_ms = std::max(timeout_ms, stop_timeout_ms);
    }
    return report(client.request(message, timeout_ms));
}
