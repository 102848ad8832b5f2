#include "protocol/messages.hpp"

#include <bit>
#include <cstring>

using json = nlohmann::json;

TranscriptionSession TranscriptionSession::create() {
    return TranscriptionSession{
        .id = SessionId::generate(),
        .status = {},
        .text = {},
        .confidence = std::nullopt,
        .created_at = std::chrono::system_clock::now(),
    };
}

std::string_view message_name(const ClientMessage& message) {
    return std::visit([](const auto& m) { return std::decay_t<decltype(m)>::name; }, message);
}

std::string_view message_name(const DaemonMessage& message) {
    return std::visit([](const auto& m) { return std::decay_t<decltype(m)>::name; }, message);
}

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Recording: return "Recording";
        case SessionState::Processing: return "Processing";
        case SessionState::Completed: return "Completed";
        case SessionState::Failed: return "Failed";
    }
    return "Unknown";
}

namespace wire {

namespace {

json tagged(std::string_view tag, json payload) {
    json obj = json::object();
    obj[std::string(tag)] = std::move(payload);
    return obj;
}

struct Tagged {
    std::string tag;
    const json* payload;
};

// Accepts "Tag", {"Tag": payload} and {"Tag": null}.
Tagged split_tag(const json& value) {
    static const json null_payload;
    if (value.is_string()) {
        return {value.get<std::string>(), &null_payload};
    }
    if (value.is_object() && value.size() == 1) {
        auto it = value.begin();
        return {it.key(), &it.value()};
    }
    throw ProtocolError("expected a tagged message value");
}

// --- SessionId ---

json id_to_json(const SessionId& id) {
    const auto& b = id.bytes();
    return json::binary(std::vector<uint8_t>(b.begin(), b.end()));
}

SessionId id_from_json(const json& j) {
    if (j.is_binary()) {
        const auto& bin = j.get_binary();
        if (bin.size() != SessionId::size) {
            throw ProtocolError("session id must be 16 bytes");
        }
        std::array<uint8_t, SessionId::size> bytes{};
        std::memcpy(bytes.data(), bin.data(), bytes.size());
        return SessionId(bytes);
    }
    if (j.is_string()) {
        auto parsed = SessionId::parse(j.get<std::string>());
        if (!parsed) throw ProtocolError("invalid session id string");
        return *parsed;
    }
    throw ProtocolError("session id must be binary or string");
}

// --- time ---

json time_to_json(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto ns = duration_cast<nanoseconds>(tp.time_since_epoch());
    auto secs = floor<seconds>(ns);
    return {
        {"secs_since_epoch", secs.count()},
        {"nanos_since_epoch", (ns - secs).count()},
    };
}

std::chrono::system_clock::time_point time_from_json(const json& j) {
    using namespace std::chrono;
    auto secs = seconds(j.at("secs_since_epoch").get<int64_t>());
    auto nanos = nanoseconds(j.value("nanos_since_epoch", int64_t{0}));
    return system_clock::time_point(duration_cast<system_clock::duration>(secs + nanos));
}

json duration_to_json(std::chrono::nanoseconds d) {
    using namespace std::chrono;
    auto secs = floor<seconds>(d);
    return {{"secs", secs.count()}, {"nanos", (d - secs).count()}};
}

std::chrono::nanoseconds duration_from_json(const json& j) {
    using namespace std::chrono;
    return seconds(j.at("secs").get<int64_t>()) + nanoseconds(j.value("nanos", int64_t{0}));
}

// --- samples: little-endian float32 blob ---

json samples_to_json(const std::vector<float>& samples) {
    std::vector<uint8_t> out(samples.size() * 4);
    for (size_t i = 0; i < samples.size(); ++i) {
        auto bits = std::bit_cast<uint32_t>(samples[i]);
        out[i * 4 + 0] = static_cast<uint8_t>(bits);
        out[i * 4 + 1] = static_cast<uint8_t>(bits >> 8);
        out[i * 4 + 2] = static_cast<uint8_t>(bits >> 16);
        out[i * 4 + 3] = static_cast<uint8_t>(bits >> 24);
    }
    return json::binary(std::move(out));
}

std::vector<float> samples_from_json(const json& j) {
    if (j.is_array()) {
        return j.get<std::vector<float>>();
    }
    if (!j.is_binary()) {
        throw ProtocolError("audio data must be binary or an array");
    }

    const auto& bin = j.get_binary();
    if (bin.size() % 4 != 0) {
        throw ProtocolError("audio data length is not a multiple of 4");
    }

    std::vector<float> samples(bin.size() / 4);
    for (size_t i = 0; i < samples.size(); ++i) {
        uint32_t bits = uint32_t(bin[i * 4 + 0]) |
                        uint32_t(bin[i * 4 + 1]) << 8 |
                        uint32_t(bin[i * 4 + 2]) << 16 |
                        uint32_t(bin[i * 4 + 3]) << 24;
        samples[i] = std::bit_cast<float>(bits);
    }
    return samples;
}

// --- structs ---

json status_to_json(const SessionStatus& status) {
    if (status.state == SessionState::Failed) {
        return tagged("Failed", status.reason);
    }
    return std::string(to_string(status.state));
}

SessionStatus status_from_json(const json& j) {
    auto [tag, payload] = split_tag(j);
    if (tag == "Recording") return {SessionState::Recording, {}};
    if (tag == "Processing") return {SessionState::Processing, {}};
    if (tag == "Completed") return {SessionState::Completed, {}};
    if (tag == "Failed") {
        return SessionStatus::failed(payload->is_string() ? payload->get<std::string>() : "");
    }
    throw ProtocolError("unknown session status: " + tag);
}

json session_to_json(const TranscriptionSession& s) {
    return {
        {"id", id_to_json(s.id)},
        {"status", status_to_json(s.status)},
        {"text", s.text},
        {"confidence", s.confidence ? json(*s.confidence) : json(nullptr)},
        {"created_at", time_to_json(s.created_at)},
    };
}

TranscriptionSession session_from_json(const json& j) {
    TranscriptionSession s;
    s.id = id_from_json(j.at("id"));
    s.status = status_from_json(j.at("status"));
    s.text = j.value("text", "");
    if (j.contains("confidence") && !j["confidence"].is_null()) {
        s.confidence = j["confidence"].get<float>();
    }
    s.created_at = time_from_json(j.at("created_at"));
    return s;
}

json chunk_to_json(const AudioChunk& c) {
    return {
        {"session_id", id_to_json(c.session_id)},
        {"data", samples_to_json(c.data)},
        {"sample_rate", c.sample_rate},
        {"channels", c.channels},
        {"timestamp", time_to_json(c.timestamp)},
    };
}

AudioChunk chunk_from_json(const json& j) {
    AudioChunk c;
    c.session_id = id_from_json(j.at("session_id"));
    c.data = samples_from_json(j.at("data"));
    c.sample_rate = j.at("sample_rate").get<uint32_t>();
    c.channels = j.at("channels").get<uint16_t>();
    c.timestamp = time_from_json(j.at("timestamp"));
    return c;
}

json daemon_status_to_json(const DaemonStatus& s) {
    json ids = json::array();
    for (const auto& id : s.active_sessions) ids.push_back(id_to_json(id));
    return {
        {"model_loaded", s.model_loaded},
        {"active_sessions", std::move(ids)},
        {"uptime", duration_to_json(s.uptime)},
        {"audio_device", s.audio_device},
        {"buffer_size", s.buffer_size},
        {"vad_sensitivity", s.vad_sensitivity},
    };
}

DaemonStatus daemon_status_from_json(const json& j) {
    DaemonStatus s;
    s.model_loaded = j.at("model_loaded").get<bool>();
    for (const auto& id : j.at("active_sessions")) {
        s.active_sessions.push_back(id_from_json(id));
    }
    s.uptime = duration_from_json(j.at("uptime"));
    s.audio_device = j.value("audio_device", "");
    s.buffer_size = j.value("buffer_size", uint64_t{0});
    s.vad_sensitivity = j.value("vad_sensitivity", 0.5f);
    return s;
}

} // namespace

json to_value(const ClientMessage& message) {
    return std::visit(overloaded{
        [](const msg::StreamAudio& m) { return tagged(m.name, chunk_to_json(m.chunk)); },
        [](const msg::SetSensitivity& m) { return tagged(m.name, m.value); },
        [](const auto& m) { return json(std::string(m.name)); },
    }, message);
}

json to_value(const DaemonMessage& message) {
    return std::visit(overloaded{
        [](const msg::RecordingStarted& m) { return tagged(m.name, id_to_json(m.session_id)); },
        [](const msg::TranscriptionUpdate& m) {
            return tagged(m.name, {
                {"session_id", id_to_json(m.session_id)},
                {"partial_text", m.partial_text},
                {"is_final", m.is_final},
            });
        },
        [](const msg::TranscriptionComplete& m) { return tagged(m.name, session_to_json(m.session)); },
        [](const msg::AudioLevel& m) { return tagged(m.name, m.level); },
        [](const msg::Error& m) { return tagged(m.name, m.message); },
        [](const msg::Status& m) { return tagged(m.name, daemon_status_to_json(m.status)); },
        [](const auto& m) { return json(std::string(m.name)); },
    }, message);
}

ClientMessage client_message_from_value(const json& value) {
    auto [tag, payload] = split_tag(value);

    if (tag == msg::StartRecording::name) return msg::StartRecording{};
    if (tag == msg::StopRecording::name) return msg::StopRecording{};
    if (tag == msg::StreamAudio::name) return msg::StreamAudio{chunk_from_json(*payload)};
    if (tag == msg::GetStatus::name) return msg::GetStatus{};
    if (tag == msg::ClearSession::name) return msg::ClearSession{};
    if (tag == msg::SetSensitivity::name) return msg::SetSensitivity{payload->get<float>()};
    if (tag == msg::Shutdown::name) return msg::Shutdown{};

    throw ProtocolError("unknown client message: " + tag);
}

DaemonMessage daemon_message_from_value(const json& value) {
    auto [tag, payload] = split_tag(value);
    const json& p = *payload;

    if (tag == msg::RecordingStarted::name) return msg::RecordingStarted{id_from_json(p)};
    if (tag == msg::RecordingStopped::name) return msg::RecordingStopped{};
    if (tag == msg::TranscriptionUpdate::name) {
        return msg::TranscriptionUpdate{
            .session_id = id_from_json(p.at("session_id")),
            .partial_text = p.value("partial_text", ""),
            .is_final = p.value("is_final", false),
        };
    }
    if (tag == msg::TranscriptionComplete::name) return msg::TranscriptionComplete{session_from_json(p)};
    if (tag == msg::AudioLevel::name) return msg::AudioLevel{p.get<float>()};
    if (tag == msg::VoiceActivityDetected::name) return msg::VoiceActivityDetected{};
    if (tag == msg::VoiceActivityEnded::name) return msg::VoiceActivityEnded{};
    if (tag == msg::ProcessingStarted::name) return msg::ProcessingStarted{};
    if (tag == msg::ProcessingComplete::name) return msg::ProcessingComplete{};
    if (tag == msg::Error::name) return msg::Error{p.get<std::string>()};
    if (tag == msg::Status::name) return msg::Status{daemon_status_from_json(p)};
    if (tag == msg::SessionCleared::name) return msg::SessionCleared{};

    throw ProtocolError("unknown daemon message: " + tag);
}

} // namespace wire
