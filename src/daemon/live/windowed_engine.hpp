#pragma once

#include "live/streaming_engine.hpp"
#include "whisper/backend.hpp"

#include <expected>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

struct WindowOptions {
    double window_seconds = 12.0;
    double hop_seconds = 3.0;
    // Less audio than this is not worth a request.
    double min_seconds = 1.0;
    uint32_t sample_rate = 16000;
};

using WindowTranscriber = std::function<std::expected<TranscriptionResult, BackendFailure>(
    std::span<const int16_t>, uint32_t, std::stop_token)>;

// Streaming on top of a batch recognizer. Every hop the audio collected since the last
// final is transcribed and reported as a partial; once it spans a whole window it is
// transcribed one last time, reported as final and dropped. A window that fails to
// transcribe is dropped too, so a backend outage never builds a backlog.
class WindowedEngine : public StreamingEngine {
public:
    WindowedEngine(std::string name, WindowTranscriber transcriber, WindowOptions options = {});
    ~WindowedEngine() override;

    std::string_view name() const override { return name_; }
    bool start(StreamingCallbacks callbacks) override;
    void feed(std::span<const int16_t> samples) override;
    void stop() override;

    // Samples waiting to be transcribed. Never more than one window plus one hop.
    size_t buffered_samples() const;

private:
    void run(std::stop_token stop);
    void drop_front(size_t count);

    std::string name_;
    WindowTranscriber transcriber_;
    WindowOptions options_;
    StreamingCallbacks callbacks_;

    mutable std::mutex mtx_;
    std::vector<int16_t> pending_;
    std::jthread worker_;
};
