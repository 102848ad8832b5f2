#pragma once

#include "audio_buffer.hpp"
#include "protocol/messages.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <vector>

// Audio moved out of a session for final transcription.
struct PendingAudio {
    SessionId id;
    std::vector<float> samples;
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
    float duration_s = 0.0f;
};

// Owns every live session together with its audio buffer.
// Reads take a shared lock, mutations an exclusive one, each for the
// duration of the single call only.
class SessionRegistry {
public:
    using SessionFn = std::function<void(TranscriptionSession&)>;
    using BufferFn = std::function<void(const TranscriptionSession&, AudioBuffer&)>;

    SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Inserts a new session in Recording state with an empty buffer.
    SessionId create();

    bool exists(const SessionId& id) const;
    std::optional<TranscriptionSession> get(const SessionId& id) const;

    // Return false if the session does not exist.
    bool update(const SessionId& id, const SessionFn& fn);
    bool with_buffer(const SessionId& id, const BufferFn& fn);
    bool remove(const SessionId& id);

    std::vector<SessionId> list_ids() const;
    size_t size() const;
    size_t clear();

    // Marks every Recording session Processing and drains its buffer.
    // Sessions without audio are returned with no samples.
    std::vector<PendingAudio> take_pending();

    // Drops Recording sessions whose last chunk is older than `timeout`.
    std::vector<SessionId> expire_idle(std::chrono::duration<double> timeout);

private:
    struct Entry {
        TranscriptionSession session;
        AudioBuffer buffer;
    };

    mutable std::shared_mutex mutex_;
    std::map<SessionId, Entry> entries_;
};
