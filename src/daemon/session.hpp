#pragma once

#include "platform/audio_capture.hpp"
#include "ring_buffer.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>

enum class SessionState { Idle, Recording };

struct Recording {
    std::string path;
    std::string filename;
    size_t samples = 0;
    double duration_s = 0.0;
};

// A file recording: captures into the ring buffer and writes a WAV file on stop.
class Session {
public:
    Session(RingBuffer& ring_buf, AudioCapture& capture, std::string recordings_dir);

    // Starts capture and returns the path the recording will be written to.
    std::expected<std::string, std::string> start_recording();
    // Stops capture and writes the WAV file. Fails if nothing was captured.
    std::expected<Recording, std::string> stop_recording();
    // Stops capture and discards the audio.
    void abort();

    SessionState state() const { return state_; }
    double recording_duration() const;
    const std::string& current_path() const { return path_; }

    void set_job_id(std::string id) { job_id_ = std::move(id); }
    const std::string& job_id() const { return job_id_; }

private:
    RingBuffer& ring_buf_;
    AudioCapture& capture_;
    std::string recordings_dir_;
    SessionState state_ = SessionState::Idle;
    std::chrono::steady_clock::time_point record_start_;
    std::string path_;
    std::string filename_;
    std::string job_id_;
};
