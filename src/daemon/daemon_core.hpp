#pragma once

#include "config.hpp"
#include "model_manager.hpp"
#include "protocol/messages.hpp"
#include "session_registry.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>

// Routes client messages to the session registry and model manager.
// Safe to call from the reactor thread and worker threads at once.
class DaemonCore {
public:
    using ShutdownCallback = std::function<void()>;

    DaemonCore(const Config& config, bool verbose,
               SessionRegistry& registry, ModelManager& model,
               ShutdownCallback on_shutdown);

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    // Returns the response, or std::nullopt for Shutdown (no reply is sent).
    std::optional<DaemonMessage> handle_message(const ClientMessage& message);

    // Messages that may load the model or run inference.
    static bool is_blocking(const ClientMessage& message);

    DaemonStatus status() const;

    // Unloads an idle model and drops abandoned sessions.
    void on_idle_tick();

private:
    DaemonMessage handle(const msg::StartRecording& m);
    DaemonMessage handle(const msg::StopRecording& m);
    DaemonMessage handle(const msg::StreamAudio& m);
    DaemonMessage handle(const msg::GetStatus& m);
    DaemonMessage handle(const msg::ClearSession& m);
    DaemonMessage handle(const msg::SetSensitivity& m);

    std::optional<TranscriptionSession> finalize(PendingAudio pending);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    SessionRegistry& registry_;
    ModelManager& model_;
    ShutdownCallback on_shutdown_;

    std::chrono::steady_clock::time_point start_time_;
    std::atomic<float> vad_sensitivity_;
};
