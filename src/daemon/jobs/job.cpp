#include "job.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <mutex>
#include <random>

InvalidTransition::InvalidTransition(JobStatus from, JobStatus to)
    : std::logic_error(std::format("invalid job transition {} -> {}",
                                   to_string(from), to_string(to))) {}

bool can_transition(JobStatus from, JobStatus to) {
    switch (from) {
        case JobStatus::Queued:
            return to == JobStatus::Recording || to == JobStatus::Transcribing ||
                   to == JobStatus::Failed || to == JobStatus::Cancelled;
        case JobStatus::Recording:
            return to == JobStatus::Transcribing || to == JobStatus::Completed ||
                   to == JobStatus::Failed || to == JobStatus::Cancelled;
        case JobStatus::Transcribing:
            return to == JobStatus::Completed || to == JobStatus::Failed ||
                   to == JobStatus::Cancelled;
        case JobStatus::Failed:
            return to == JobStatus::Queued;
        case JobStatus::Completed:
        case JobStatus::Cancelled:
            return false;
    }
    return false;
}

void Job::transition(JobStatus to) {
    if (!can_transition(status, to)) {
        throw InvalidTransition(status, to);
    }
    status = to;
    if (to == JobStatus::Queued) {
        error.reset();
        progress = 0.0;
        stage = "queued";
    }
}

void Job::fail(std::string message) {
    transition(JobStatus::Failed);
    error = std::move(message);
    result.reset();
    stage = "error";
    capture_pending = false;
}

void Job::complete(TranscriptionResult r) {
    transition(JobStatus::Completed);
    if (!duration && r.duration > 0.0) duration = r.duration;
    result = std::move(r);
    error.reset();
    progress = 1.0;
    stage = "completed";
    capture_pending = false;
}

void Job::cancel() {
    transition(JobStatus::Cancelled);
    error = "Cancelled by user";
    result.reset();
    stage = "cancelled";
    capture_pending = false;
}

void Job::advance_progress(double value) {
    if (!is_active()) return;
    value = std::clamp(value, 0.0, 1.0);
    progress = std::max(progress, value);
}

std::string_view to_string(JobStatus s) {
    switch (s) {
        case JobStatus::Queued: return "queued";
        case JobStatus::Recording: return "recording";
        case JobStatus::Transcribing: return "transcribing";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        case JobStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<JobStatus> parse_status(std::string_view s) {
    for (auto st : {JobStatus::Queued, JobStatus::Recording, JobStatus::Transcribing,
                    JobStatus::Completed, JobStatus::Failed, JobStatus::Cancelled}) {
        if (to_string(st) == s) return st;
    }
    return std::nullopt;
}

JobId generate_job_id() {
    static std::mutex mtx;
    static std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi, lo;
    {
        std::lock_guard lock(mtx);
        hi = rng();
        lo = rng();
    }

    // RFC 4122 version 4, variant 1
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       hi >> 32, (hi >> 16) & 0xFFFF, hi & 0xFFFF,
                       lo >> 48, lo & 0xFFFFFFFFFFFFULL);
}

std::string utc_timestamp() {
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return std::format("{:%Y-%m-%dT%H:%M:%S}Z", now);
}

std::string file_timestamp() {
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return std::format("{:%Y%m%d-%H%M%S}", now);
}

Job make_job(std::string audio_path, std::string filename) {
    Job job;
    job.id = generate_job_id();
    job.created_at = utc_timestamp();
    job.audio_path = std::move(audio_path);
    job.filename = std::move(filename);
    job.status = JobStatus::Queued;
    job.stage = "queued";
    return job;
}
