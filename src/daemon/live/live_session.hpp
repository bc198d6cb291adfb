#pragma once

#include "jobs/backend_selector.hpp"
#include "jobs/capture_status.hpp"
#include "live/streaming_engine.hpp"
#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"
#include "storage/model_catalog.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

class JobOrchestrator;

enum class LiveState { Idle, Streaming, Stopping };

std::string_view to_string(LiveState s);

// Misuse of the live session API, such as switching engines mid-stream.
class LiveSessionError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

struct LiveOptions {
    std::string recordings_dir;
    std::chrono::milliseconds save_interval{1500};
    // Captured audio kept for saving; older audio is dropped beyond this.
    double max_audio_seconds = 3600.0;
    std::chrono::milliseconds pump_interval{50};
};

struct LiveSaveResult {
    std::string text_path;
    std::optional<std::string> audio_path;
    std::optional<std::string> job_id;
};

class LiveSession {
public:
    using EngineFactory = std::function<std::unique_ptr<StreamingEngine>(LiveBackend)>;

    LiveSession(AudioCapture& capture, RingBuffer& ring_buf, CaptureStatus& status,
                const ModelCatalog& catalog, EngineFactory factory, LiveOptions options,
                JobOrchestrator* jobs = nullptr, bool verbose = false);
    ~LiveSession();

    LiveSession(const LiveSession&) = delete;
    LiveSession& operator=(const LiveSession&) = delete;

    // Starts streaming with the selected backend, or the next usable one. Returns the
    // backend actually in use.
    std::expected<LiveBackend, std::string> start();
    // Commits outstanding partial text, releases the audio capture and returns to idle.
    void stop();

    // Throws LiveSessionError unless idle.
    void switch_backend(LiveBackend backend);

    // Writes the transcript (and the captured audio, if any) to the recordings
    // directory. At most one save per save_interval.
    std::expected<LiveSaveResult, std::string> save();

    LiveState state() const;
    LiveBackend backend() const;
    std::optional<LiveBackend> active_backend() const;

    std::string final_text() const;
    std::string partial_text() const;
    // Final text followed by the current partial.
    std::string combined_text() const;
    std::optional<std::string> last_error() const;
    double captured_seconds() const;

private:
    void pump(std::stop_token stop);
    void drain_ring();
    void on_partial(const std::string& text);
    void on_final(const std::string& text);
    void on_error(const std::string& message);
    void log(const std::string& msg);

    AudioCapture& capture_;
    RingBuffer& ring_buf_;
    CaptureStatus& status_;
    const ModelCatalog& catalog_;
    EngineFactory factory_;
    LiveOptions options_;
    JobOrchestrator* jobs_;
    bool verbose_;

    mutable std::mutex mtx_;
    LiveState state_ = LiveState::Idle;
    LiveBackend backend_ = LiveBackend::Server;
    std::optional<LiveBackend> active_;
    std::string final_;
    std::string partial_;
    std::optional<std::string> last_error_;
    std::vector<int16_t> audio_;
    std::optional<std::chrono::steady_clock::time_point> last_save_;

    std::unique_ptr<StreamingEngine> engine_;
    std::jthread pump_;
};
