#include "session.hpp"
#include "jobs/job.hpp"
#include "storage/atomic_file.hpp"
#include "wav_encoder.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

Session::Session(RingBuffer& ring_buf, AudioCapture& capture, std::string recordings_dir)
    : ring_buf_(ring_buf), capture_(capture), recordings_dir_(std::move(recordings_dir)) {}

std::expected<std::string, std::string> Session::start_recording() {
    if (state_ != SessionState::Idle) {
        return std::unexpected("already recording");
    }

    std::error_code ec;
    fs::create_directories(recordings_dir_, ec);
    if (ec) {
        return std::unexpected("cannot create " + recordings_dir_ + ": " + ec.message());
    }

    ring_buf_.reset();
    if (!capture_.start()) {
        std::println(stderr, "session: failed to start audio capture");
        return std::unexpected("failed to start audio capture");
    }

    filename_ = "Recording-" + file_timestamp() + ".wav";
    path_ = (fs::path(recordings_dir_) / filename_).string();
    job_id_.clear();
    record_start_ = std::chrono::steady_clock::now();
    state_ = SessionState::Recording;
    return path_;
}

std::expected<Recording, std::string> Session::stop_recording() {
    if (state_ != SessionState::Recording) {
        return std::unexpected("not recording");
    }

    capture_.stop();
    auto samples = ring_buf_.drain_all();
    state_ = SessionState::Idle;

    if (ring_buf_.dropped() > 0) {
        std::println(stderr, "session: ring buffer full, {} bytes dropped", ring_buf_.dropped());
    }
    if (samples.empty()) {
        return std::unexpected("no audio captured");
    }

    auto wav_data = wav::encode(samples, capture_.sample_rate());
    if (auto r = atomic_write(path_, std::span<const uint8_t>(wav_data)); !r) {
        std::println(stderr, "session: {}", r.error());
        return std::unexpected(r.error());
    }

    return Recording{
        .path = path_,
        .filename = filename_,
        .samples = samples.size(),
        .duration_s = static_cast<double>(samples.size()) / capture_.sample_rate(),
    };
}

void Session::abort() {
    if (state_ != SessionState::Recording) return;
    capture_.stop();
    ring_buf_.reset();
    state_ = SessionState::Idle;
}

double Session::recording_duration() const {
    if (state_ != SessionState::Recording) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - record_start_).count();
}
