#include "job_orchestrator.hpp"
#include "wav_encoder.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;
using Clock = std::chrono::steady_clock;

JobOrchestrator::JobOrchestrator(JobLedger& ledger, BackendFactory& factory,
                                 const Connectivity& connectivity, const ModelCatalog& catalog,
                                 CaptureStatus& capture, SelectorSource selector_config,
                                 OrchestratorOptions options, AttemptDb* attempts, bool verbose)
    : ledger_(ledger), factory_(factory), connectivity_(connectivity), catalog_(catalog),
      capture_(capture), selector_config_(std::move(selector_config)),
      options_(std::move(options)), attempts_(attempts), verbose_(verbose),
      owner_([this](std::stop_token st) { owner_loop(st); }) {}

JobOrchestrator::~JobOrchestrator() {
    shutdown();
}

// --- mailbox ---

bool JobOrchestrator::post(std::function<void()> fn) {
    {
        std::lock_guard lock(mailbox_mtx_);
        if (!accepting_) return false;
        mailbox_.push_back(std::move(fn));
    }
    mailbox_cv_.notify_one();
    return true;
}

void JobOrchestrator::owner_loop(std::stop_token stop) {
    while (true) {
        std::function<void()> fn;
        {
            std::unique_lock lock(mailbox_mtx_);
            auto has_work = [this] { return !mailbox_.empty(); };
            if (cancelling_.empty()) {
                mailbox_cv_.wait(lock, stop, has_work);
            } else {
                auto next = std::min_element(
                    cancelling_.begin(), cancelling_.end(),
                    [](auto& a, auto& b) { return a.second.deadline < b.second.deadline; });
                mailbox_cv_.wait_until(lock, stop, next->second.deadline, has_work);
            }

            if (!mailbox_.empty()) {
                fn = std::move(mailbox_.front());
                mailbox_.pop_front();
            } else if (stop.stop_requested()) {
                return;
            }
        }

        if (fn) {
            try {
                fn();
            } catch (const std::exception& e) {
                std::println(stderr, "orchestrator: {}", e.what());
            }
        }
        expire_cancels();
        reap_retired();
    }
}

void JobOrchestrator::expire_cancels() {
    auto now = Clock::now();
    std::vector<JobId> expired;
    for (auto& [id, pending] : cancelling_) {
        if (pending.deadline <= now) expired.push_back(id);
    }
    for (auto& id : expired) {
        log(std::format("job {}: cancel not acknowledged within grace period", id));
        finish_cancel(id, false);
    }
}

void JobOrchestrator::reap_retired() {
    std::erase_if(retired_, [](const Worker& w) { return w.done->load(); });
}

// --- public API ---

void JobOrchestrator::recover() {
    call([this] {
        size_t purged = 0;
        size_t interrupted = 0;
        for (auto& job : ledger_.list()) {
            std::error_code ec;
            if (!fs::exists(job.audio_path, ec)) {
                ledger_.remove(job.id);
                emit(JobEvent::Kind::Removed, job);
                ++purged;
                continue;
            }
            if (job.is_active()) {
                fail_job(job, "Interrupted before completion");
                ++interrupted;
            }
        }
        if (purged) log(std::format("purged {} orphaned jobs", purged));
        if (interrupted) log(std::format("marked {} interrupted jobs failed", interrupted));
        drain();
    });
}

JobId JobOrchestrator::enqueue(std::string audio_path, std::string filename,
                               std::optional<std::string> source_path) {
    auto job = make_job(std::move(audio_path), std::move(filename));
    job.source_path = std::move(source_path);
    if (auto info = wav::read_info(job.audio_path)) job.duration = info->duration_s();

    auto id = job.id;
    post([this, job = std::move(job)] {
        if (auto r = ledger_.add(job); !r) {
            std::println(stderr, "orchestrator: cannot add job {}: {}", job.id,
                         to_string(r.error()));
            return;
        }
        log(std::format("job {}: queued {}", job.id, job.filename));
        emit(JobEvent::Kind::Added, job);
        drain();
    });
    return id;
}

JobId JobOrchestrator::begin_capture(std::string audio_path, std::string filename) {
    auto job = make_job(std::move(audio_path), std::move(filename));
    job.capture_pending = true;
    job.transition(JobStatus::Recording);
    job.stage = "recording";

    auto id = job.id;
    post([this, job = std::move(job)] {
        if (auto r = ledger_.add(job); !r) {
            std::println(stderr, "orchestrator: cannot add job {}: {}", job.id,
                         to_string(r.error()));
            return;
        }
        capture_.set_recording(job.id);
        emit(JobEvent::Kind::Added, job);
    });
    return id;
}

void JobOrchestrator::complete_capture(const JobId& id) {
    post([this, id] {
        auto job = ledger_.find(id);
        if (!job || job->status != JobStatus::Recording || !job->capture_pending) return;

        if (capture_.snapshot().recording_job == id) capture_.set_recording(std::nullopt);
        job->capture_pending = false;
        if (auto info = wav::read_info(job->audio_path)) job->duration = info->duration_s();
        store(*job);
        emit(JobEvent::Kind::Updated, *job);
        start_execution(id);
    });
}

void JobOrchestrator::fail_capture(const JobId& id, std::string message) {
    post([this, id, message = std::move(message)] {
        auto job = ledger_.find(id);
        if (!job || job->status != JobStatus::Recording) return;
        fail_job(*job, message);
    });
}

JobId JobOrchestrator::add_completed(std::string audio_path, std::string filename,
                                     TranscriptionResult result) {
    auto job = make_job(std::move(audio_path), std::move(filename));
    job.transition(JobStatus::Transcribing);
    job.complete(std::move(result));

    auto id = job.id;
    post([this, job = std::move(job)] {
        if (auto r = ledger_.add(job); !r) {
            std::println(stderr, "orchestrator: cannot add job {}: {}", job.id,
                         to_string(r.error()));
            return;
        }
        emit(JobEvent::Kind::Added, job);
    });
    return id;
}

void JobOrchestrator::run(const JobId& id) {
    post([this, id] { start_execution(id); });
}

void JobOrchestrator::retry(const JobId& id) {
    post([this, id] {
        auto job = ledger_.find(id);
        if (!job || job->status != JobStatus::Failed) return;
        if (running_.contains(id) || cancelling_.contains(id)) return;

        std::error_code ec;
        if (!fs::exists(job->audio_path, ec)) {
            job->error = "Original recording missing";
            store(*job);
            emit(JobEvent::Kind::Updated, *job);
            log(std::format("job {}: retry aborted, {} is gone", id, job->audio_path));
            return;
        }

        job->transition(JobStatus::Queued);
        store(*job);
        emit(JobEvent::Kind::Updated, *job);
        start_execution(id);
    });
}

void JobOrchestrator::cancel(const JobId& id) {
    post([this, id] {
        auto job = ledger_.find(id);
        if (!job || job->is_terminal() || cancelling_.contains(id)) return;

        auto it = running_.find(id);
        if (it != running_.end() && it->second.worker) {
            uint64_t epoch = it->second.epoch;
            bump_epoch(id);
            auto worker = std::move(*it->second.worker);
            running_.erase(it);
            worker.thread.request_stop();
            cancelling_.emplace(id, PendingCancel{
                .epoch = epoch,
                .worker = std::move(worker),
                .deadline = Clock::now() + options_.cancel_grace,
            });
            log(std::format("job {}: cancel requested", id));
            return;
        }

        if (it != running_.end()) running_.erase(it);
        bump_epoch(id);
        if (capture_.snapshot().recording_job == id) capture_.set_recording(std::nullopt);
        job->cancel();
        store(*job);
        emit(JobEvent::Kind::Updated, *job);
        log(std::format("job {}: cancelled", id));
        drain();
    });
}

void JobOrchestrator::remove_job(const JobId& id) {
    post([this, id] {
        auto job = ledger_.find(id);
        if (!job) return;

        if (auto it = running_.find(id); it != running_.end()) {
            if (it->second.worker) {
                it->second.worker->thread.request_stop();
                retired_.push_back(std::move(*it->second.worker));
            }
            running_.erase(it);
        }
        if (auto it = cancelling_.find(id); it != cancelling_.end()) {
            retired_.push_back(std::move(it->second.worker));
            cancelling_.erase(it);
        }
        epochs_.erase(id);
        if (capture_.snapshot().recording_job == id) capture_.set_recording(std::nullopt);

        ledger_.remove(id);
        emit(JobEvent::Kind::Removed, *job);
        log(std::format("job {}: removed", id));
        drain();
    });
}

std::optional<Job> JobOrchestrator::job(const JobId& id) {
    return call([this, id] { return ledger_.find(id); });
}

std::vector<Job> JobOrchestrator::jobs() {
    return call([this] { return ledger_.list(); });
}

int JobOrchestrator::subscribe(JobObserver observer) {
    return events_.subscribe(std::move(observer));
}

void JobOrchestrator::unsubscribe(int token) {
    events_.unsubscribe(token);
}

bool JobOrchestrator::wait_idle(std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    while (Clock::now() < deadline) {
        bool idle = call([this] {
            if (!running_.empty() || !cancelling_.empty()) return false;
            return !options_.auto_run || ledger_.queued().empty();
        });
        if (idle) {
            events_.flush();
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
}

void JobOrchestrator::shutdown() {
    if (!owner_.joinable()) return;

    auto workers = call([this] {
        stopping_ = true;
        std::vector<Worker> out;
        for (auto& [_, exec] : running_) {
            if (exec.worker) out.push_back(std::move(*exec.worker));
        }
        running_.clear();
        for (auto& [_, pending] : cancelling_) out.push_back(std::move(pending.worker));
        cancelling_.clear();
        for (auto& w : retired_) out.push_back(std::move(w));
        retired_.clear();
        return out;
    });

    for (auto& w : workers) w.thread.request_stop();
    workers.clear();

    {
        std::lock_guard lock(mailbox_mtx_);
        accepting_ = false;
    }
    owner_.request_stop();
    owner_.join();
    events_.flush();
}

// --- owner thread ---

std::optional<std::string> JobOrchestrator::validate_audio(const Job& job) const {
    std::error_code ec;
    if (!fs::is_regular_file(job.audio_path, ec)) {
        return "Audio file missing: " + job.audio_path;
    }
    if (fs::file_size(job.audio_path, ec) == 0 || ec) {
        return "Audio file is empty: " + job.audio_path;
    }
    return std::nullopt;
}

void JobOrchestrator::start_execution(const JobId& id) {
    if (stopping_ || running_.contains(id) || cancelling_.contains(id)) return;

    auto job = ledger_.find(id);
    if (!job) return;
    bool startable = job->status == JobStatus::Queued ||
                     (job->status == JobStatus::Recording && !job->capture_pending);
    if (!startable) return;

    if (auto err = validate_audio(*job)) {
        bump_epoch(id);
        fail_job(*job, *err);
        return;
    }

    Execution exec;
    exec.epoch = bump_epoch(id);
    exec.config = selector_config_();
    exec.candidates = select_strategies(exec.config, connectivity_, catalog_);

    if (exec.candidates.empty()) {
        fail_job(*job, "No available transcription backend");
        return;
    }

    std::string order;
    for (auto s : exec.candidates) {
        if (!order.empty()) order += " -> ";
        order += stage_name(s);
    }
    log(std::format("job {}: candidates {}", id, order));

    running_.emplace(id, std::move(exec));
    launch_next(id);
}

void JobOrchestrator::launch_next(const JobId& id) {
    auto it = running_.find(id);
    if (it == running_.end()) return;
    auto& exec = it->second;

    auto job = ledger_.find(id);
    if (!job) {
        running_.erase(it);
        return;
    }

    while (exec.next < exec.candidates.size()) {
        auto strategy = exec.candidates[exec.next];
        std::shared_ptr<TranscriptionBackend> backend = factory_.create(strategy, exec.config);
        if (!backend) {
            exec.last_error = std::format("{}: backend unavailable", stage_name(strategy));
            ++exec.next;
            continue;
        }

        if (job->status != JobStatus::Transcribing) job->transition(JobStatus::Transcribing);
        job->stage = stage_name(strategy);
        store(*job);
        emit(JobEvent::Kind::Updated, *job);

        TranscribeRequest request{
            .audio_path = job->audio_path,
            .language = options_.language,
            .translate = options_.translate,
            .temperature = options_.temperature,
            .preserve_timestamps = options_.preserve_timestamps,
            .duration_estimate = job->duration,
        };

        uint64_t epoch = exec.epoch;
        auto done = std::make_shared<std::atomic<bool>>(false);
        auto latest = std::make_shared<std::atomic<double>>(0.0);
        auto progress_posted = std::make_shared<std::atomic<bool>>(false);

        log(std::format("job {}: trying {}", id, stage_name(strategy)));

        std::jthread thread([this, id, epoch, strategy, backend, request, done, latest,
                             progress_posted](std::stop_token st) {
            // Progress is coalesced: at most one update per job waits in the mailbox.
            ProgressCallback progress = [this, id, epoch, latest, progress_posted](double v) {
                latest->store(v);
                if (progress_posted->exchange(true)) return;
                post([this, id, epoch, latest, progress_posted] {
                    progress_posted->store(false);
                    on_progress(id, epoch, latest->load());
                });
            };

            auto start = Clock::now();
            auto outcome = backend->transcribe(request, progress, st);
            double elapsed = std::chrono::duration<double>(Clock::now() - start).count();

            post([this, id, epoch, strategy, outcome = std::move(outcome), elapsed]() mutable {
                on_attempt_done(id, epoch, strategy, std::move(outcome), elapsed);
            });
            done->store(true);
        });
        exec.worker = Worker{std::move(thread), std::move(done)};
        return;
    }

    std::string message =
        exec.last_error.empty() ? "No available transcription backend" : exec.last_error;
    running_.erase(it);
    fail_job(*job, message);
    drain();
}

void JobOrchestrator::on_progress(const JobId& id, uint64_t epoch, double value) {
    if (stopping_) return;
    auto it = running_.find(id);
    if (it == running_.end() || it->second.epoch != epoch) return;

    auto job = ledger_.find(id);
    if (!job) return;
    double before = job->progress;
    job->advance_progress(value);
    if (job->progress == before) return;
    store(*job);
    emit(JobEvent::Kind::Updated, *job);
}

void JobOrchestrator::on_attempt_done(const JobId& id, uint64_t epoch, Strategy strategy,
                                      Outcome outcome, double elapsed_s) {
    if (stopping_) return;

    auto it = running_.find(id);
    if (it == running_.end() || it->second.epoch != epoch) {
        auto pending = cancelling_.find(id);
        if (pending != cancelling_.end() && pending->second.epoch == epoch) {
            record_attempt(id, strategy, "cancelled", "", elapsed_s);
            finish_cancel(id, true);
        } else {
            log(std::format("job {}: dropping stale result from {}", id, stage_name(strategy)));
        }
        return;
    }

    auto& exec = it->second;
    if (exec.worker) {
        exec.worker->thread.join();
        exec.worker.reset();
    }

    auto job = ledger_.find(id);
    if (!job) {
        running_.erase(it);
        return;
    }

    if (outcome) {
        record_attempt(id, strategy, "completed", "", elapsed_s);
        running_.erase(it);
        job->complete(std::move(*outcome));
        store(*job);
        emit(JobEvent::Kind::Updated, *job);
        log(std::format("job {}: completed by {} in {:.2f}s", id, stage_name(strategy),
                        elapsed_s));
        drain();
        return;
    }

    const auto& failure = outcome.error();
    record_attempt(id, strategy, "failed", failure.message, elapsed_s);
    log(std::format("job {}: {} failed ({}): {}", id, stage_name(strategy),
                    to_string(failure.kind), failure.message));

    if (failure.kind == FailureKind::Input) {
        running_.erase(it);
        fail_job(*job, failure.message);
        drain();
        return;
    }

    exec.last_error = failure.message;
    ++exec.next;
    launch_next(id);
}

void JobOrchestrator::finish_cancel(const JobId& id, bool acknowledged) {
    auto it = cancelling_.find(id);
    if (it == cancelling_.end()) return;

    auto worker = std::move(it->second.worker);
    cancelling_.erase(it);
    if (acknowledged) {
        worker.thread.join();
    } else {
        retired_.push_back(std::move(worker));
    }

    auto job = ledger_.find(id);
    if (job && !job->is_terminal()) {
        job->cancel();
        store(*job);
        emit(JobEvent::Kind::Updated, *job);
        log(std::format("job {}: cancelled", id));
    }
    drain();
}

void JobOrchestrator::drain() {
    if (!options_.auto_run || stopping_) return;
    size_t limit = static_cast<size_t>(std::max(options_.max_concurrent, 1));

    for (auto& job : ledger_.queued()) {
        if (running_.size() + cancelling_.size() >= limit) break;
        start_execution(job.id);
    }
}

void JobOrchestrator::record_attempt(const JobId& id, Strategy strategy,
                                     std::string_view outcome, const std::string& error,
                                     double elapsed_s) {
    if (!attempts_ || !attempts_->is_open()) return;
    if (!attempts_->insert(id, std::string(stage_name(strategy)), std::string(outcome), error,
                           elapsed_s)) {
        std::println(stderr, "orchestrator: failed to record attempt for {}", id);
    }
}

void JobOrchestrator::store(const Job& job) {
    if (auto r = ledger_.update(job); !r) {
        std::println(stderr, "orchestrator: ledger update for {} failed: {}", job.id,
                     to_string(r.error()));
    }
}

void JobOrchestrator::emit(JobEvent::Kind kind, const Job& job) {
    events_.publish(JobEvent{kind, job});
}

void JobOrchestrator::fail_job(Job& job, const std::string& message) {
    if (capture_.snapshot().recording_job == job.id) capture_.set_recording(std::nullopt);
    job.fail(message);
    store(job);
    emit(JobEvent::Kind::Updated, job);
    log(std::format("job {}: failed: {}", job.id, message));
}

uint64_t JobOrchestrator::bump_epoch(const JobId& id) {
    return ++epochs_[id];
}

void JobOrchestrator::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisper-control] {}", msg);
    }
}
