#pragma once

#include "protocol/session_id.hpp"

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

enum class SessionState { Recording, Processing, Completed, Failed };

struct SessionStatus {
    SessionState state = SessionState::Recording;
    std::string reason; // set when state == Failed

    static SessionStatus failed(std::string reason) {
        return {SessionState::Failed, std::move(reason)};
    }

    bool operator==(const SessionStatus&) const = default;
};

struct TranscriptionSession {
    SessionId id;
    SessionStatus status;
    std::string text;
    std::optional<float> confidence;
    std::chrono::system_clock::time_point created_at;

    // Fresh session in Recording state with a new random id.
    static TranscriptionSession create();

    bool operator==(const TranscriptionSession&) const = default;
};

struct AudioChunk {
    SessionId session_id;
    std::vector<float> data; // interleaved
    uint32_t sample_rate = 16000;
    uint16_t channels = 1;
    std::chrono::system_clock::time_point timestamp;

    bool operator==(const AudioChunk&) const = default;
};

struct DaemonStatus {
    bool model_loaded = false;
    std::vector<SessionId> active_sessions;
    std::chrono::nanoseconds uptime{0};
    std::string audio_device;
    uint64_t buffer_size = 0;
    float vad_sensitivity = 0.5f;

    bool operator==(const DaemonStatus&) const = default;
};

// Each alternative carries its wire tag in `name`.
namespace msg {

// Client -> daemon

struct StartRecording {
    static constexpr std::string_view name = "StartRecording";
    bool operator==(const StartRecording&) const = default;
};

struct StopRecording {
    static constexpr std::string_view name = "StopRecording";
    bool operator==(const StopRecording&) const = default;
};

struct StreamAudio {
    static constexpr std::string_view name = "StreamAudio";
    AudioChunk chunk;
    bool operator==(const StreamAudio&) const = default;
};

struct GetStatus {
    static constexpr std::string_view name = "GetStatus";
    bool operator==(const GetStatus&) const = default;
};

struct ClearSession {
    static constexpr std::string_view name = "ClearSession";
    bool operator==(const ClearSession&) const = default;
};

struct SetSensitivity {
    static constexpr std::string_view name = "SetSensitivity";
    float value = 0.5f;
    bool operator==(const SetSensitivity&) const = default;
};

struct Shutdown {
    static constexpr std::string_view name = "Shutdown";
    bool operator==(const Shutdown&) const = default;
};

// Daemon -> client

struct RecordingStarted {
    static constexpr std::string_view name = "RecordingStarted";
    SessionId session_id;
    bool operator==(const RecordingStarted&) const = default;
};

struct RecordingStopped {
    static constexpr std::string_view name = "RecordingStopped";
    bool operator==(const RecordingStopped&) const = default;
};

struct TranscriptionUpdate {
    static constexpr std::string_view name = "TranscriptionUpdate";
    SessionId session_id;
    std::string partial_text;
    bool is_final = false;
    bool operator==(const TranscriptionUpdate&) const = default;
};

struct TranscriptionComplete {
    static constexpr std::string_view name = "TranscriptionComplete";
    TranscriptionSession session;
    bool operator==(const TranscriptionComplete&) const = default;
};

struct AudioLevel {
    static constexpr std::string_view name = "AudioLevel";
    float level = 0.0f;
    bool operator==(const AudioLevel&) const = default;
};

struct VoiceActivityDetected {
    static constexpr std::string_view name = "VoiceActivityDetected";
    bool operator==(const VoiceActivityDetected&) const = default;
};

struct VoiceActivityEnded {
    static constexpr std::string_view name = "VoiceActivityEnded";
    bool operator==(const VoiceActivityEnded&) const = default;
};

struct ProcessingStarted {
    static constexpr std::string_view name = "ProcessingStarted";
    bool operator==(const ProcessingStarted&) const = default;
};

struct ProcessingComplete {
    static constexpr std::string_view name = "ProcessingComplete";
    bool operator==(const ProcessingComplete&) const = default;
};

struct Error {
    static constexpr std::string_view name = "Error";
    std::string message;
    bool operator==(const Error&) const = default;
};

struct Status {
    static constexpr std::string_view name = "Status";
    DaemonStatus status;
    bool operator==(const Status&) const = default;
};

struct SessionCleared {
    static constexpr std::string_view name = "SessionCleared";
    bool operator==(const SessionCleared&) const = default;
};

} // namespace msg

using ClientMessage = std::variant<
    msg::StartRecording,
    msg::StopRecording,
    msg::StreamAudio,
    msg::GetStatus,
    msg::ClearSession,
    msg::SetSensitivity,
    msg::Shutdown>;

using DaemonMessage = std::variant<
    msg::RecordingStarted,
    msg::RecordingStopped,
    msg::TranscriptionUpdate,
    msg::TranscriptionComplete,
    msg::AudioLevel,
    msg::VoiceActivityDetected,
    msg::VoiceActivityEnded,
    msg::ProcessingStarted,
    msg::ProcessingComplete,
    msg::Error,
    msg::Status,
    msg::SessionCleared>;

template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

std::string_view message_name(const ClientMessage& message);
std::string_view message_name(const DaemonMessage& message);

std::string_view to_string(SessionState state);

// Structural value mapping shared by the wire codec. Unit variants map to a
// bare tag string, data variants to a single-key object {tag: payload}.
namespace wire {

// Thrown when a value has the right syntax but not the expected shape.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

nlohmann::json to_value(const ClientMessage& message);
nlohmann::json to_value(const DaemonMessage& message);

ClientMessage client_message_from_value(const nlohmann::json& value);
DaemonMessage daemon_message_from_value(const nlohmann::json& value);

} // namespace wire
