#pragma once

#include "jobs/backend_selector.hpp"
#include "jobs/capture_status.hpp"
#include "jobs/job.hpp"
#include "jobs/job_events.hpp"
#include "platform/connectivity.hpp"
#include "storage/attempt_db.hpp"
#include "storage/job_ledger.hpp"
#include "storage/model_catalog.hpp"
#include "whisper/backend.hpp"
#include "whisper/backend_factory.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <expected>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

struct OrchestratorOptions {
    // Jobs started by the drain loop at the same time. Explicit run() ignores the limit.
    int max_concurrent = 1;
    // How long a cancelled attempt may take to acknowledge before the job is marked
    // cancelled anyway.
    std::chrono::milliseconds cancel_grace{2000};
    // Start queued jobs automatically, oldest first.
    bool auto_run = true;

    std::optional<std::string> language;
    bool translate = false;
    double temperature = 0.0;
    bool preserve_timestamps = false;
};

// Drives every job through its state machine. All ledger access and all bookkeeping
// happens on one owner thread that executes posted closures in order; public methods
// post and return (or post and wait for a reply). Backend attempts run on worker
// threads and report back through the same mailbox, tagged with the job's epoch so
// that results from cancelled or removed attempts are dropped.
class JobOrchestrator {
public:
    using SelectorSource = std::function<SelectorConfig()>;

    JobOrchestrator(JobLedger& ledger, BackendFactory& factory,
                    const Connectivity& connectivity, const ModelCatalog& catalog,
                    CaptureStatus& capture, SelectorSource selector_config,
                    OrchestratorOptions options = {}, AttemptDb* attempts = nullptr,
                    bool verbose = false);
    ~JobOrchestrator();

    JobOrchestrator(const JobOrchestrator&) = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    // Drops jobs whose audio no longer exists and fails jobs a previous process left
    // active. Call once after the ledger is opened.
    void recover();

    // Creates a queued job and returns its id without waiting for any work.
    JobId enqueue(std::string audio_path, std::string filename,
                  std::optional<std::string> source_path = std::nullopt);

    // Creates a job in `recording` for audio that is still being captured to `audio_path`.
    JobId begin_capture(std::string audio_path, std::string filename);
    // The capture finished and `audio_path` is complete: start transcribing.
    void complete_capture(const JobId& id);
    void fail_capture(const JobId& id, std::string message);

    // Registers an already transcribed recording (live saves).
    JobId add_completed(std::string audio_path, std::string filename,
                        TranscriptionResult result);

    void run(const JobId& id);
    // Re-queues and runs a failed job. Any other status is left untouched.
    void retry(const JobId& id);
    void cancel(const JobId& id);
    void remove_job(const JobId& id);

    std::optional<Job> job(const JobId& id);
    std::vector<Job> jobs();

    int subscribe(JobObserver observer);
    void unsubscribe(int token);

    // Waits until no attempt is running or being cancelled, nothing runnable is queued
    // and every event has been delivered. Returns false on timeout.
    bool wait_idle(std::chrono::milliseconds timeout = std::chrono::seconds(10));

    // Stops all attempts and the owner thread. Active jobs are left as they are on disk
    // so the next start can recover them.
    void shutdown();

private:
    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    struct Execution {
        uint64_t epoch = 0;
        SelectorConfig config;
        std::vector<Strategy> candidates;
        size_t next = 0;
        std::string last_error;
        std::optional<Worker> worker;
    };

    struct PendingCancel {
        uint64_t epoch = 0;
        Worker worker;
        std::chrono::steady_clock::time_point deadline;
    };

    using Outcome = std::expected<TranscriptionResult, BackendFailure>;

    bool post(std::function<void()> fn);

    template <typename F>
    auto call(F&& fn) -> decltype(fn());

    void owner_loop(std::stop_token stop);
    void expire_cancels();
    void reap_retired();

    // Owner-thread only.
    void start_execution(const JobId& id);
    void launch_next(const JobId& id);
    void on_progress(const JobId& id, uint64_t epoch, double value);
    void on_attempt_done(const JobId& id, uint64_t epoch, Strategy strategy, Outcome outcome,
                         double elapsed_s);
    void finish_cancel(const JobId& id, bool acknowledged);
    void record_attempt(const JobId& id, Strategy strategy, std::string_view outcome,
                        const std::string& error, double elapsed_s);
    void drain();
    void store(const Job& job);
    void emit(JobEvent::Kind kind, const Job& job);
    void fail_job(Job& job, const std::string& message);
    uint64_t bump_epoch(const JobId& id);
    std::optional<std::string> validate_audio(const Job& job) const;
    void log(const std::string& msg);

    JobLedger& ledger_;
    BackendFactory& factory_;
    const Connectivity& connectivity_;
    const ModelCatalog& catalog_;
    CaptureStatus& capture_;
    SelectorSource selector_config_;
    OrchestratorOptions options_;
    AttemptDb* attempts_;
    bool verbose_;

    JobEventDispatcher events_;

    std::mutex mailbox_mtx_;
    std::condition_variable_any mailbox_cv_;
    std::deque<std::function<void()>> mailbox_;
    bool accepting_ = true;

    // Owned by the owner thread.
    std::map<JobId, Execution> running_;
    std::map<JobId, PendingCancel> cancelling_;
    std::map<JobId, uint64_t> epochs_;
    std::vector<Worker> retired_;
    bool stopping_ = false;

    std::jthread owner_;
};

template <typename F>
auto JobOrchestrator::call(F&& fn) -> decltype(fn()) {
    using R = decltype(fn());
    auto promise = std::make_shared<std::promise<R>>();
    auto future = promise->get_future();
    bool posted = post([promise, fn = std::forward<F>(fn)]() mutable {
        if constexpr (std::is_void_v<R>) {
            fn();
            promise->set_value();
        } else {
            promise->set_value(fn());
        }
    });
    if (!posted) return R();
    return future.get();
}
