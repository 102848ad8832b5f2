#include "daemon_core.hpp"

#include "audio_buffer.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <print>

DaemonCore::DaemonCore(const Config& config, bool verbose,
                       SessionRegistry& registry, ModelManager& model,
                       ShutdownCallback on_shutdown)
    : config_(config), verbose_(verbose),
      registry_(registry), model_(model),
      on_shutdown_(std::move(on_shutdown)),
      start_time_(std::chrono::steady_clock::now()),
      vad_sensitivity_(std::clamp(config.audio.vad_threshold, 0.0f, 1.0f)) {}

std::optional<DaemonMessage> DaemonCore::handle_message(const ClientMessage& message) {
    return std::visit(overloaded{
        [this](const msg::Shutdown&) -> std::optional<DaemonMessage> {
            log("Shutdown requested");
            if (on_shutdown_) on_shutdown_();
            return std::nullopt;
        },
        [this](const auto& m) -> std::optional<DaemonMessage> { return handle(m); },
    }, message);
}

bool DaemonCore::is_blocking(const ClientMessage& message) {
    return std::holds_alternative<msg::StartRecording>(message) ||
           std::holds_alternative<msg::StopRecording>(message);
}

DaemonMessage DaemonCore::handle(const msg::StartRecording&) {
    // The session only becomes visible once the model is ready, so a
    // concurrent StopRecording cannot finalize it mid-load.
    bool was_loaded = model_.is_loaded();
    if (auto loaded = model_.ensure_loaded(); !loaded) {
        std::println(stderr, "model: {}", loaded.error().message);
        return msg::Error{loaded.error().message};
    }
    if (!was_loaded) {
        log("Model loaded from " + model_.model_path());
    }

    auto id = registry_.create();
    log("Recording started: " + id.to_string());
    return msg::RecordingStarted{id};
}

DaemonMessage DaemonCore::handle(const msg::StopRecording&) {
    auto pending = registry_.take_pending();
    if (pending.empty()) {
        log("Stop requested with no active sessions");
        return msg::RecordingStopped{};
    }

    std::vector<TranscriptionSession> results;
    for (auto& p : pending) {
        if (auto session = finalize(std::move(p))) {
            results.push_back(std::move(*session));
        }
    }

    if (results.size() == 1) {
        return msg::TranscriptionComplete{std::move(results.front())};
    }
    return msg::RecordingStopped{};
}

std::optional<TranscriptionSession> DaemonCore::finalize(PendingAudio pending) {
    auto id = pending.id;
    if (pending.samples.empty()) {
        log("Session " + id.to_string() + " ended without audio");
        registry_.remove(id);
        return std::nullopt;
    }

    log(std::format("Transcribing {:.1f}s of audio for {}", pending.duration_s, id.to_string()));

    auto mono = downmix_to_mono(pending.samples, pending.channels);
    std::expected<Transcript, ModelError> result = model_.ensure_loaded().and_then([&] {
        return model_.transcribe(mono, pending.sample_rate);
    });

    if (result) {
        log(std::format("Transcription complete: {:.1f}s processing, {} chars",
                        result->processing_s, result->text.size()));
    } else {
        std::println(stderr, "model: {}", result.error().message);
    }

    registry_.update(id, [&result](TranscriptionSession& s) {
        if (result) {
            s.status = {SessionState::Completed, {}};
            s.text = result->text;
            s.confidence = result->confidence;
        } else {
            s.status = SessionStatus::failed(result.error().message);
        }
    });

    // Gone if the session was cleared while transcribing.
    auto session = registry_.get(id);
    registry_.remove(id);
    return session;
}

DaemonMessage DaemonCore::handle(const msg::StreamAudio& m) {
    const auto& chunk = m.chunk;
    std::optional<std::string> rejection;

    bool found = registry_.with_buffer(chunk.session_id,
        [&](const TranscriptionSession& session, AudioBuffer& buffer) {
            if (session.status.state != SessionState::Recording) {
                rejection = "session is not recording";
            } else if (chunk.sample_rate == 0 || chunk.channels == 0) {
                rejection = "invalid audio format";
            } else if (!buffer.empty() && (buffer.sample_rate() != chunk.sample_rate ||
                                           buffer.channels() != chunk.channels)) {
                rejection = "audio format mismatch";
            } else {
                buffer.append(chunk);
            }
        });

    if (!found) return msg::Error{"session not found"};
    if (rejection) return msg::Error{*rejection};

    return msg::TranscriptionUpdate{
        .session_id = chunk.session_id,
        .partial_text = {},
        .is_final = false,
    };
}

DaemonMessage DaemonCore::handle(const msg::GetStatus&) {
    return msg::Status{status()};
}

DaemonMessage DaemonCore::handle(const msg::ClearSession&) {
    size_t n = registry_.clear();
    log(std::format("Cleared {} session(s)", n));
    return msg::SessionCleared{};
}

DaemonMessage DaemonCore::handle(const msg::SetSensitivity& m) {
    if (!std::isfinite(m.value)) {
        return msg::Error{"invalid sensitivity"};
    }
    float value = std::clamp(m.value, 0.0f, 1.0f);
    vad_sensitivity_.store(value);
    log(std::format("VAD sensitivity set to {:.2f}", value));
    return msg::Status{status()};
}

DaemonStatus DaemonCore::status() const {
    return DaemonStatus{
        .model_loaded = model_.is_loaded(),
        .active_sessions = registry_.list_ids(),
        .uptime = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - start_time_),
        .audio_device = config_.audio.device.empty() ? "default" : config_.audio.device,
        .buffer_size = config_.audio.buffer_size,
        .vad_sensitivity = vad_sensitivity_.load(),
    };
}

void DaemonCore::on_idle_tick() {
    if (model_.unload_if_idle(std::chrono::seconds(config_.model.timeout_seconds))) {
        log("Model unloaded after idle timeout");
    }

    if (config_.daemon.session_timeout_seconds > 0) {
        auto expired = registry_.expire_idle(
            std::chrono::seconds(config_.daemon.session_timeout_seconds));
        for (const auto& id : expired) {
            log("Session " + id.to_string() + " expired");
        }
    }
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[dictation] {}", msg);
    }
}
