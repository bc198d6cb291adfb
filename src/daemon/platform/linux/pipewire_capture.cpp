#include "platform/linux/pipewire_capture.hpp"

#include <print>
#include <spa/utils/result.h>

PipeWireCapture::PipeWireCapture(RingBuffer& ring_buf, uint32_t sample_rate)
    : ring_buf_(ring_buf), sample_rate_(sample_rate) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    stop();
    pw_deinit();
}

bool PipeWireCapture::start() {
    if (capturing_.load(std::memory_order_relaxed)) return true;

    loop_ = pw_thread_loop_new("whisper-control-audio", nullptr);
    if (!loop_) return fail("thread loop", 0);

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "whisper-control",
        PW_KEY_APP_NAME, "whisper-control",
        nullptr
    );
    stream_ = pw_stream_new_simple(pw_thread_loop_get_loop(loop_), "whisper-control-capture",
                                   props, &stream_events_, this);
    if (!stream_) return fail("stream", 0);

    uint8_t pod_buf[1024];
    spa_pod_builder builder = SPA_POD_BUILDER_INIT(pod_buf, sizeof(pod_buf));
    auto format = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[] = {
        spa_format_audio_raw_build(&builder, SPA_PARAM_EnumFormat, &format),
    };

    auto flags = static_cast<pw_stream_flags>(PW_STREAM_FLAG_AUTOCONNECT |
                                              PW_STREAM_FLAG_MAP_BUFFERS |
                                              PW_STREAM_FLAG_RT_PROCESS);
    if (int ret = pw_stream_connect(stream_, PW_DIRECTION_INPUT, PW_ID_ANY, flags, params, 1);
        ret < 0) {
        return fail("stream connect", ret);
    }

    // Set before the loop runs so the first buffers are kept.
    capturing_.store(true, std::memory_order_release);
    if (int ret = pw_thread_loop_start(loop_); ret < 0) {
        capturing_.store(false, std::memory_order_release);
        return fail("thread loop start", ret);
    }
    return true;
}

void PipeWireCapture::stop() {
    if (!capturing_.exchange(false, std::memory_order_acq_rel)) return;
    teardown();
}

bool PipeWireCapture::fail(const char* what, int err) {
    if (err < 0) {
        std::println(stderr, "audio: {} failed: {}", what, spa_strerror(err));
    } else {
        std::println(stderr, "audio: failed to create {}", what);
    }
    teardown();
    return false;
}

void PipeWireCapture::teardown() {
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

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto& d = buf->buffer->datas[0];
    if (d.data && self->capturing_.load(std::memory_order_relaxed)) {
        // Overflow is counted by the ring buffer; nothing may block here.
        self->ring_buf_.write(static_cast<const uint8_t*>(d.data) + d.chunk->offset,
                              d.chunk->size);
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* /*userdata*/, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    if (state == PW_STREAM_STATE_ERROR || error) {
        std::println(stderr, "audio: stream {} -> {}: {}", pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state), error ? error : "unknown error");
    }
}
