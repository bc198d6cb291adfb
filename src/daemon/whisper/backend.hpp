#pragma once

#include "jobs/job.hpp"

#include <expected>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

enum class FailureKind {
    Input,       // missing or unreadable audio; no other backend will do better
    Backend,     // this attempt failed; the next candidate may succeed
    Persistence, // ledger or disk write failure; logged only
    Cancelled,   // stop was requested while the attempt was running
};

std::string_view to_string(FailureKind k);

struct BackendFailure {
    FailureKind kind = FailureKind::Backend;
    std::string message;
};

struct TranscribeRequest {
    std::string audio_path;
    std::optional<std::string> language; // unset: let the backend detect it
    bool translate = false;
    double temperature = 0.0;
    bool preserve_timestamps = false;
    std::optional<double> duration_estimate;
};

using ProgressCallback = std::function<void(double)>;

// Executes one transcription attempt. Implementations report progress in [0,1] from the
// calling thread, poll `stop` and return FailureKind::Cancelled once it is requested.
class TranscriptionBackend {
public:
    virtual ~TranscriptionBackend() = default;
    virtual std::string_view name() const = 0;
    virtual std::expected<TranscriptionResult, BackendFailure>
        transcribe(const TranscribeRequest& request, const ProgressCallback& progress,
                   std::stop_token stop) = 0;
};
