#pragma once

#include "platform/audio_capture.hpp"
#include "sample_ring.hpp"

#include <atomic>
#include <cstdint>
#include <pipewire/pipewire.h>
#include <string>

// Microphone input through a PipeWire stream running on its own thread loop.
// Each period is queued whole, so the ring never holds a partial frame.
class PipeWireCapture : public AudioCapture {
public:
    struct Format {
        uint32_t sample_rate = 16000;
        uint16_t channels = 1;
        std::string device; // target node; empty: default source
    };

    PipeWireCapture(SampleRing& ring, Format format);
    ~PipeWireCapture() override;

    PipeWireCapture(const PipeWireCapture&) = delete;
    PipeWireCapture& operator=(const PipeWireCapture&) = delete;

    bool start() override;
    void stop() override;
    bool is_capturing() const override { return running_.load(std::memory_order_acquire); }
    uint32_t sample_rate() const override { return format_.sample_rate; }
    uint16_t channels() const override { return format_.channels; }

    uint64_t captured_frames() const { return captured_.load(std::memory_order_relaxed); }
    uint64_t dropped_frames() const { return dropped_.load(std::memory_order_relaxed); }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, pw_stream_state old,
                                 pw_stream_state state, const char* error);

    bool connect_stream();
    void release();

    SampleRing& ring_;
    Format format_;

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> captured_{0};
    std::atomic<uint64_t> dropped_{0};

    static constexpr pw_stream_events events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
