#include <catch2/catch_test_macros.hpp>

#include "ring_buffer.hpp"
#include "session.hpp"
#include "test_helpers.hpp"

#include <filesystem>

using test::MockAudioCapture;
using test::TmpDir;

namespace {

void capture_samples(RingBuffer& ring, size_t n) {
    auto pcm = test::tone(n);
    ring.write(pcm.data(), pcm.size() * sizeof(int16_t));
}

} // namespace

TEST_CASE("Session recording", "[session]") {
    TmpDir dir;
    RingBuffer ring(64 * 1024);
    MockAudioCapture capture;
    Session session(ring, capture, dir.file("recordings"));

    SECTION("InitialStateIdle") {
        REQUIRE(session.state() == SessionState::Idle);
        REQUIRE(session.recording_duration() == 0.0);
    }

    SECTION("StartNamesTheFile") {
        auto path = session.start_recording();
        REQUIRE(path);
        REQUIRE(session.state() == SessionState::Recording);
        REQUIRE(capture.is_capturing());
        auto name = std::filesystem::path(*path).filename().string();
        REQUIRE(name.starts_with("Recording-"));
        REQUIRE(name.ends_with(".wav"));
        REQUIRE(std::filesystem::is_directory(dir.file("recordings")));
        REQUIRE(session.current_path() == *path);
    }

    SECTION("StartTwiceRejected") {
        REQUIRE(session.start_recording());
        auto again = session.start_recording();
        REQUIRE_FALSE(again);
        REQUIRE(again.error() == "already recording");
    }

    SECTION("CaptureFailure") {
        capture.fail_start = true;
        auto r = session.start_recording();
        REQUIRE_FALSE(r);
        REQUIRE(r.error() == "failed to start audio capture");
        REQUIRE(session.state() == SessionState::Idle);
    }

    SECTION("StopWritesWav") {
        auto path = session.start_recording();
        REQUIRE(path);
        capture_samples(ring, 8000);

        auto rec = session.stop_recording();
        REQUIRE(rec);
        REQUIRE(rec->path == *path);
        REQUIRE(rec->samples == 8000);
        REQUIRE(rec->duration_s == 0.5);
        REQUIRE_FALSE(capture.is_capturing());
        REQUIRE(session.state() == SessionState::Idle);

        auto info = wav::read_info(rec->path);
        REQUIRE(info);
        REQUIRE(info->sample_rate == 16000);
        REQUIRE(info->duration_s() == 0.5);
    }

    SECTION("StopWhenIdle") {
        auto r = session.stop_recording();
        REQUIRE_FALSE(r);
        REQUIRE(r.error() == "not recording");
    }

    SECTION("SilenceIsAnError") {
        auto path = session.start_recording();
        REQUIRE(path);
        auto r = session.stop_recording();
        REQUIRE_FALSE(r);
        REQUIRE(r.error() == "no audio captured");
        REQUIRE_FALSE(std::filesystem::exists(*path));
        REQUIRE(session.state() == SessionState::Idle);
    }

    SECTION("AbortDiscardsAudio") {
        auto path = session.start_recording();
        REQUIRE(path);
        capture_samples(ring, 1000);
        session.abort();
        REQUIRE(session.state() == SessionState::Idle);
        REQUIRE_FALSE(capture.is_capturing());
        REQUIRE(ring.available() == 0);
        REQUIRE_FALSE(std::filesystem::exists(*path));
    }

    SECTION("JobIdResetOnStart") {
        REQUIRE(session.start_recording());
        session.set_job_id("job-1");
        REQUIRE(session.job_id() == "job-1");
        session.abort();
        REQUIRE(session.start_recording());
        REQUIRE(session.job_id().empty());
    }
}
