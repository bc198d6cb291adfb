#pragma once

#include "jobs/job.hpp"

#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

// What the daemon is capturing right now. One instance per process, created at startup.
// Anyone may read or subscribe; only the orchestrator (file recordings) and the live
// session controller (streaming) change it. The daemon core resets it on shutdown.
class CaptureStatus {
public:
    struct Snapshot {
        bool live_streaming = false;
        std::optional<std::string> live_backend;
        std::optional<JobId> recording_job;

        bool recording() const { return recording_job.has_value(); }
        bool idle() const { return !live_streaming && !recording_job; }
        bool operator==(const Snapshot&) const = default;
    };

    using Listener = std::function<void(const Snapshot&)>;

    Snapshot snapshot() const;
    bool is_live_streaming() const;
    bool is_recording() const;

    // Listeners run synchronously on the thread that made the change.
    int subscribe(Listener listener);
    void unsubscribe(int token);

private:
    friend class JobOrchestrator;
    friend class LiveSession;
    friend class DaemonCore;

    void set_recording(std::optional<JobId> job);
    void set_live(std::optional<std::string> backend);
    void reset();
    void publish(std::unique_lock<std::mutex>& lock);

    mutable std::mutex mtx_;
    Snapshot state_;
    std::map<int, Listener> listeners_;
    int next_token_ = 1;
};
