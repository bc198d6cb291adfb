#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using JobId = std::string;

enum class JobStatus { Queued, Recording, Transcribing, Completed, Failed, Cancelled };

struct TranscriptSegment {
    double start = 0.0;
    double end = 0.0;
    std::string text;

    bool operator==(const TranscriptSegment&) const = default;
};

struct TranscriptionResult {
    std::string text;
    std::vector<TranscriptSegment> segments;
    std::optional<std::string> language;
    double duration = 0.0;

    bool operator==(const TranscriptionResult&) const = default;
};

// Thrown for a status change the state machine does not allow. Seeing one means two
// execution contexts raced on the same job.
class InvalidTransition : public std::logic_error {
public:
    InvalidTransition(JobStatus from, JobStatus to);
};

struct Job {
    JobId id;
    std::string created_at;
    std::string filename;
    std::string audio_path;
    std::optional<std::string> source_path;
    JobStatus status = JobStatus::Queued;
    std::string stage;
    double progress = 0.0;
    std::optional<std::string> error;
    std::optional<TranscriptionResult> result;
    std::optional<double> duration;
    bool capture_pending = false;

    bool operator==(const Job&) const = default;

    bool is_active() const {
        return status == JobStatus::Recording || status == JobStatus::Transcribing;
    }
    bool is_terminal() const {
        return status == JobStatus::Completed || status == JobStatus::Failed ||
               status == JobStatus::Cancelled;
    }

    // Applies a status change, throwing InvalidTransition if it is not allowed.
    // Entering Queued (retry) clears error and progress; entering Failed or Completed
    // keeps exactly one of error/result populated.
    void transition(JobStatus to);

    void fail(std::string message);
    void complete(TranscriptionResult r);
    void cancel();

    // Progress is clamped to [0,1] and never decreases while active.
    void advance_progress(double value);
};

bool can_transition(JobStatus from, JobStatus to);

std::string_view to_string(JobStatus s);
std::optional<JobStatus> parse_status(std::string_view s);

JobId generate_job_id();
std::string utc_timestamp();
// UTC as YYYYmmdd-HHMMSS, for generated file names.
std::string file_timestamp();

Job make_job(std::string audio_path, std::string filename);
