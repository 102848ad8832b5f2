#include "platform/linux/pipewire_capture.hpp"

#include <print>
#include <span>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

namespace {

pw_properties* capture_properties(const std::string& device) {
    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_APP_NAME, "dictation",
        PW_KEY_NODE_NAME, "dictation-capture",
        nullptr);
    if (!device.empty()) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, device.c_str());
    }
    return props;
}

} // namespace

PipeWireCapture::PipeWireCapture(SampleRing& ring, Format format)
    : ring_(ring), format_(std::move(format)) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    stop();
    pw_deinit();
}

bool PipeWireCapture::start() {
    if (running_.load(std::memory_order_acquire)) return true;
    if (format_.sample_rate == 0 || format_.channels == 0) {
        std::println(stderr, "audio: invalid format {} Hz x {} channels",
                     format_.sample_rate, format_.channels);
        return false;
    }

    loop_ = pw_thread_loop_new("dictation-audio", nullptr);
    if (!loop_) {
        std::println(stderr, "audio: cannot create PipeWire thread loop");
        return false;
    }

    ring_.clear();
    captured_.store(0, std::memory_order_relaxed);
    dropped_.store(0, std::memory_order_relaxed);

    if (int ret = pw_thread_loop_start(loop_); ret < 0) {
        std::println(stderr, "audio: thread loop start failed: {}", spa_strerror(ret));
        release();
        return false;
    }

    pw_thread_loop_lock(loop_);
    bool connected = connect_stream();
    pw_thread_loop_unlock(loop_);

    if (!connected) {
        release();
        return false;
    }
    running_.store(true, std::memory_order_release);
    return true;
}

// Called with the thread loop locked.
bool PipeWireCapture::connect_stream() {
    stream_ = pw_stream_new_simple(pw_thread_loop_get_loop(loop_), "dictation-capture",
                                   capture_properties(format_.device), &events_, this);
    if (!stream_) {
        std::println(stderr, "audio: cannot create capture stream");
        return false;
    }

    uint8_t pod_buf[1024];
    spa_pod_builder builder = SPA_POD_BUILDER_INIT(pod_buf, sizeof(pod_buf));
    spa_audio_info_raw raw = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_F32_LE,
        .rate = format_.sample_rate,
        .channels = format_.channels);
    const spa_pod* params[] = {
        spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &raw),
    };

    auto flags = static_cast<pw_stream_flags>(
        PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS);
    if (int ret = pw_stream_connect(stream_, PW_DIRECTION_INPUT, PW_ID_ANY, flags, params, 1);
        ret < 0) {
        std::println(stderr, "audio: cannot connect to {}: {}",
                     format_.device.empty() ? "default source" : format_.device,
                     spa_strerror(ret));
        return false;
    }
    return true;
}

void PipeWireCapture::stop() {
    running_.store(false, std::memory_order_release);
    release();
}

void PipeWireCapture::release() {
    if (loop_) pw_thread_loop_stop(loop_);
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    pw_buffer* pwb = pw_stream_dequeue_buffer(self->stream_);
    if (!pwb) return;

    const spa_data& d = pwb->buffer->datas[0];
    if (d.data && d.chunk && self->running_.load(std::memory_order_relaxed)) {
        size_t frame_bytes = sizeof(float) * self->format_.channels;
        size_t frames = d.chunk->size / frame_bytes;
        std::span<const float> period(
            reinterpret_cast<const float*>(static_cast<const uint8_t*>(d.data) + d.chunk->offset),
            frames * self->format_.channels);

        if (self->ring_.push(period)) {
            self->captured_.fetch_add(frames, std::memory_order_relaxed);
        } else {
            self->dropped_.fetch_add(frames, std::memory_order_relaxed);
        }
    }

    pw_stream_queue_buffer(self->stream_, pwb);
}

void PipeWireCapture::on_state_changed(void* /*userdata*/, pw_stream_state old,
                                       pw_stream_state state, const char* error) {
    if (state == PW_STREAM_STATE_ERROR) {
        std::println(stderr, "audio: stream {} -> {}: {}", pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state), error ? error : "unknown error");
    }
}
