#include <catch2/catch_test_macros.hpp>

#include "jobs/job_orchestrator.hpp"
#include "test_helpers.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <mutex>
#include <set>
#include <thread>
#include <utility>

using namespace std::chrono_literals;
using test::TmpDir;
using test::wait_for;

namespace {

using Outcome = std::expected<TranscriptionResult, BackendFailure>;
using Behaviour =
    std::function<Outcome(const TranscribeRequest&, const ProgressCallback&, std::stop_token)>;

class ScriptedBackend : public TranscriptionBackend {
public:
    ScriptedBackend(std::string name, Behaviour behaviour)
        : name_(std::move(name)), behaviour_(std::move(behaviour)) {}

    std::string_view name() const override { return name_; }

    Outcome transcribe(const TranscribeRequest& request, const ProgressCallback& progress,
                       std::stop_token stop) override {
        return behaviour_(request, progress, stop);
    }

private:
    std::string name_;
    Behaviour behaviour_;
};

// Hands out backends whose behaviour the test scripts per strategy.
class ScriptedFactory : public BackendFactory {
public:
    std::unique_ptr<TranscriptionBackend> create(Strategy strategy,
                                                 const SelectorConfig&) override {
        std::lock_guard lock(mtx_);
        created_.push_back(strategy);
        auto it = behaviours_.find(strategy);
        if (it == behaviours_.end()) return nullptr;
        return std::make_unique<ScriptedBackend>(std::string(stage_name(strategy)), it->second);
    }

    void script(Strategy s, Behaviour b) {
        std::lock_guard lock(mtx_);
        behaviours_[s] = std::move(b);
    }

    std::vector<Strategy> created() {
        std::lock_guard lock(mtx_);
        return created_;
    }

private:
    std::mutex mtx_;
    std::map<Strategy, Behaviour> behaviours_;
    std::vector<Strategy> created_;
};

Behaviour succeed(std::string text) {
    return [text](const TranscribeRequest&, const ProgressCallback& progress, std::stop_token) {
        progress(0.5);
        return Outcome(TranscriptionResult{
            .text = text,
            .segments = {{0.0, 1.0, text}},
            .language = "en",
            .duration = 1.0,
        });
    };
}

Behaviour fail_with(FailureKind kind, std::string message) {
    return [kind, message](const TranscribeRequest&, const ProgressCallback&, std::stop_token) {
        return Outcome(std::unexpected(BackendFailure{kind, message}));
    };
}

// Runs until stop is requested, then acknowledges.
Behaviour block_until_stopped(std::atomic<int>* started = nullptr) {
    return [started](const TranscribeRequest&, const ProgressCallback&, std::stop_token stop) {
        if (started) ++*started;
        while (!stop.stop_requested()) std::this_thread::sleep_for(1ms);
        return Outcome(std::unexpected(BackendFailure{FailureKind::Cancelled, "stopped"}));
    };
}

struct Recorder {
    std::mutex mtx;
    std::vector<JobEvent> events;

    JobObserver observer() {
        return [this](const JobEvent& e) {
            std::lock_guard lock(mtx);
            events.push_back(e);
        };
    }

    std::vector<JobEvent> snapshot() {
        std::lock_guard lock(mtx);
        return events;
    }
};

struct Fixture {
    TmpDir dir;
    JobLedger ledger;
    ScriptedFactory factory;
    test::FakeConnectivity net;
    test::FakeCatalog catalog;
    CaptureStatus capture;
    SelectorConfig selector;
    OrchestratorOptions options;
    std::unique_ptr<JobOrchestrator> orch;

    Fixture() {
        ledger.open(dir.file("jobs.json"));
        selector.selected_model = "ggml-base.en";
        selector.fallback_model = "ggml-tiny.en";
        catalog.models = {"ggml-base.en"};
        options.cancel_grace = 2s;
    }

    JobOrchestrator& start(AttemptDb* attempts = nullptr) {
        orch = std::make_unique<JobOrchestrator>(
            ledger, factory, net, catalog, capture, [this] { return selector; }, options,
            attempts);
        return *orch;
    }

    std::string audio(const std::string& name, double seconds = 1.0) {
        auto path = dir.file(name);
        test::write_wav(path, seconds);
        return path;
    }

    std::optional<Job> job(const JobId& id) { return orch->job(id); }

    bool status_is(const JobId& id, JobStatus s) {
        auto j = orch->job(id);
        return j && j->status == s;
    }
};

} // namespace

TEST_CASE("JobOrchestrator runs jobs", "[orchestrator]") {
    Fixture f;

    SECTION("EnqueueReturnsImmediatelyAndCompletes") {
        f.factory.script(Strategy::Local, succeed("hello world"));
        auto& orch = f.start();

        auto id = orch.enqueue(f.audio("a.wav"), "a.wav");
        REQUIRE_FALSE(id.empty());
        REQUIRE(orch.wait_idle());

        auto job = f.job(id);
        REQUIRE(job);
        REQUIRE(job->status == JobStatus::Completed);
        REQUIRE(job->stage == "completed");
        REQUIRE(job->result->text == "hello world");
        REQUIRE_FALSE(job->error);
        REQUIRE(job->progress == 1.0);
        REQUIRE(job->duration);
        REQUIRE(f.ledger.find(id)->status == JobStatus::Completed);
    }

    SECTION("NoBackendFailsWithoutAttempt") {
        f.selector.offline_mode = true;
        f.catalog.models.clear();
        auto& orch = f.start();

        auto id = orch.enqueue(f.audio("a.wav"), "a.wav");
        REQUIRE(orch.wait_idle());

        auto job = f.job(id);
        REQUIRE(job->status == JobStatus::Failed);
        REQUIRE(job->error == "No available transcription backend");
        REQUIRE(f.factory.created().empty());
    }

    SECTION("CloudFailureFallsBackSilently") {
        f.selector.cloud_enabled = true;
        f.selector.openai_api_key = "sk-test";
        f.selector.enable_cloud_fallback = true;
        f.catalog.models = {"ggml-tiny.en"};

        // Each backend holds its attempt until the observer has seen its stage, so no
        // stage update can be replaced by a later one before delivery.
        Recorder rec;
        auto seen_stage = [&rec](const std::string& stage) {
            return wait_for([&] {
                auto events = rec.snapshot();
                return std::ranges::any_of(events, [&](const JobEvent& e) {
                    return e.job.status == JobStatus::Transcribing && e.job.stage == stage;
                });
            });
        };
        f.factory.script(Strategy::CloudOpenAI,
                         [&](const TranscribeRequest& r, const ProgressCallback& p,
                             std::stop_token st) {
                             seen_stage("cloud-openai");
                             return fail_with(FailureKind::Backend, "HTTP 500")(r, p, st);
                         });
        f.factory.script(Strategy::Fallback,
                         [&](const TranscribeRequest& r, const ProgressCallback& p,
                             std::stop_token st) {
                             seen_stage("fallback");
                             return succeed("from fallback")(r, p, st);
                         });

        TmpDir db_dir;
        AttemptDb attempts;
        REQUIRE(attempts.open(db_dir.file("attempts.db")));

        auto& orch = f.start(&attempts);
        orch.subscribe(rec.observer());

        auto id = orch.enqueue(f.audio("a.wav"), "a.wav");
        REQUIRE(orch.wait_idle());

        auto job = f.job(id);
        REQUIRE(job->status == JobStatus::Completed);
        REQUIRE(job->result->text == "from fallback");
        REQUIRE_FALSE(job->error);
        REQUIRE(f.factory.created() ==
                std::vector<Strategy>{Strategy::CloudOpenAI, Strategy::Fallback});

        // Distinct (status, stage) pairs in delivery order.
        using Step = std::pair<JobStatus, std::string>;
        std::vector<Step> steps;
        for (auto& e : rec.snapshot()) {
            REQUIRE(e.job.id == id);
            REQUIRE(e.job.status != JobStatus::Failed);
            Step step{e.job.status, e.job.stage};
            if (steps.empty() || steps.back() != step) steps.push_back(step);
        }
        REQUIRE(steps == std::vector<Step>{
                             {JobStatus::Queued, "queued"},
                             {JobStatus::Transcribing, "cloud-openai"},
                             {JobStatus::Transcribing, "fallback"},
                             {JobStatus::Completed, "completed"},
                         });

        auto log = attempts.for_job(id);
        REQUIRE(log.size() == 2);
        REQUIRE(log[0].strategy == "cloud-openai");
        REQUIRE(log[0].outcome == "failed");
        REQUIRE(log[0].error == "HTTP 500");
        REQUIRE(log[1].strategy == "fallback");
        REQUIRE(log[1].outcome == "completed");
    }

    SECTION("ExhaustionReportsLastError") {
        f.catalog.models = {"ggml-base.en", "ggml-tiny.en"};
        f.factory.script(Strategy::Local, fail_with(FailureKind::Backend, "local broke"));
        f.factory.script(Strategy::Fallback, fail_with(FailureKind::Backend, "fallback broke"));
        auto& orch = f.start();

        auto id = orch.enqueue(f.audio("a.wav"), "a.wav");
        REQUIRE(orch.wait_idle());

        auto job = f.job(id);
        REQUIRE(job->status == JobStatus::Failed);
        REQUIRE(job->error == "fallback broke");
        REQUIRE_FALSE(job->result);
    }

    SECTION("InputFailureDoesNotAdvance") {
        f.catalog.models = {"ggml-base.en", "ggml-tiny.en"};
        f.factory.script(Strategy::Local, fail_with(FailureKind::Input, "unreadable audio"));
        f.factory.script(Strategy::Fallback, succeed("never"));
        auto& orch = f.start();

        auto id = orch.enqueue(f.audio("a.wav"), "a.wav");
        REQUIRE(orch.wait_idle());

        REQUIRE(f.job(id)->error == "unreadable audio");
        REQUIRE(f.factory.created() == std::vector<Strategy>{Strategy::Local});
    }

    SECTION("MissingAudioIsInputError") {
        f.factory.script(Strategy::Local, succeed("never"));
        auto& orch = f.start();

        auto path = f.dir.file("nope.wav");
        auto id = orch.enqueue(path, "nope.wav");
        REQUIRE(orch.wait_idle());

        REQUIRE(f.job(id)->status == JobStatus::Failed);
        REQUIRE(f.job(id)->error == "Audio file missing: " + path);
        REQUIRE(f.factory.created().empty());
    }

    SECTION("EmptyAudioIsInputError") {
        f.factory.script(Strategy::Local, succeed("never"));
        auto& orch = f.start();

        auto path = f.dir.file("empty.wav");
        test::write_file(path, "");
        auto id = orch.enqueue(path, "empty.wav");
        REQUIRE(orch.wait_idle());

        REQUIRE(f.job(id)->error == "Audio file is empty: " + path);
    }

    SECTION("ProgressIsMonotonicAndClamped") {
        f.factory.script(Strategy::Local, [](const TranscribeRequest&,
                                             const ProgressCallback& progress, std::stop_token) {
            for (double v : {0.2, 0.5, 0.3, 0.9, 0.1, 1.7}) {
                progress(v);
                std::this_thread::sleep_for(2ms);
            }
            return Outcome(TranscriptionResult{.text = "ok"});
        });

        Recorder rec;
        auto& orch = f.start();
        orch.subscribe(rec.observer());

        auto id = orch.enqueue(f.audio("a.wav"), "a.wav");
        REQUIRE(orch.wait_idle());

        double last = 0.0;
        for (auto& e : rec.snapshot()) {
            if (e.job.id != id) continue;
            REQUIRE(e.job.progress >= last);
            REQUIRE(e.job.progress <= 1.0);
            last = e.job.progress;
        }
        REQUIRE(last == 1.0);
    }

    SECTION("AutoRunRespectsConcurrencyLimit") {
        std::atomic<int> started{0};
        f.factory.script(Strategy::Local, block_until_stopped(&started));
        f.options.max_concurrent = 1;
        auto& orch = f.start();

        auto first = orch.enqueue(f.audio("a.wav"), "a.wav");
        auto second = orch.enqueue(f.audio("b.wav"), "b.wav");

        REQUIRE(wait_for([&] { return f.status_is(first, JobStatus::Transcribing); }));
        std::this_thread::sleep_for(20ms);
        REQUIRE(f.status_is(second, JobStatus::Queued));
        REQUIRE(started == 1);

        // Explicit run ignores the limit.
        orch.run(second);
        REQUIRE(wait_for([&] { return f.status_is(second, JobStatus::Transcribing); }));
        REQUIRE(started == 2);

        orch.cancel(first);
        orch.cancel(second);
        REQUIRE(orch.wait_idle());
    }

    SECTION("AutoRunDisabledLeavesJobsQueued") {
        f.options.auto_run = false;
        f.factory.script(Strategy::Local, succeed("manual"));
        auto& orch = f.start();

        auto id = orch.enqueue(f.audio("a.wav"), "a.wav");
        REQUIRE(orch.wait_idle());
        REQUIRE(f.status_is(id, JobStatus::Queued));

        orch.run(id);
        REQUIRE(wait_for([&] { return f.status_is(id, JobStatus::Completed); }));
    }

    SECTION("ConcurrentEnqueueYieldsDistinctIds") {
        f.options.auto_run = false;
        auto& orch = f.start();
        auto path = f.audio("shared.wav");

        std::mutex mtx;
        std::set<JobId> ids;
        std::vector<std::jthread> threads;
        for (int t = 0; t < 8; ++t) {
            threads.emplace_back([&] {
                for (int i = 0; i < 25; ++i) {
                    auto id = orch.enqueue(path, "shared.wav");
                    std::lock_guard lock(mtx);
                    ids.insert(id);
                }
            });
        }
        threads.clear();

        REQUIRE(orch.wait_idle());
        REQUIRE(ids.size() == 200);
        REQUIRE(f.ledger.size() == 200);
    }

    SECTION("EventsAreAddedUpdatedRemoved") {
        f.factory.script(Strategy::Local, succeed("text"));
        Recorder rec;
        auto& orch = f.start();
        orch.subscribe(rec.observer());

        auto id = orch.enqueue(f.audio("a.wav"), "a.wav");
        REQUIRE(orch.wait_idle());
        orch.remove_job(id);
        REQUIRE(orch.wait_idle());

        auto events = rec.snapshot();
        REQUIRE(events.size() >= 3);
        REQUIRE(events.front().kind == JobEvent::Kind::Added);
        REQUIRE(events.back().kind == JobEvent::Kind::Removed);

        auto terminal = std::ranges::find_if(events, [](const JobEvent& e) {
            return e.kind == JobEvent::Kind::Updated && e.job.is_terminal();
        });
        REQUIRE(terminal != events.end());
        REQUIRE(terminal->job.status == JobStatus::Completed);
        REQUIRE_FALSE(f.job(id));
    }
}

TEST_CASE("JobOrchestrator retry", "[orchestrator]") {
    Fixture f;

    SECTION("RetryFailedJobRunsAgain") {
        std::atomic<int> calls{0};
        f.factory.script(Strategy::Local, [&calls](const TranscribeRequest&,
                                                   const ProgressCallback& progress,
                                                   std::stop_token) {
            progress(0.7);
            if (++calls == 1) {
                return Outcome(std::unexpected(BackendFailure{FailureKind::Backend, "flaky"}));
            }
            return Outcome(TranscriptionResult{.text = "second time"});
        });
        auto& orch = f.start();

        auto id = orch.enqueue(f.audio("a.wav"), "a.wav");
        REQUIRE(orch.wait_idle());
        REQUIRE(f.job(id)->status == JobStatus::Failed);
        REQUIRE(f.job(id)->error == "flaky");

        orch.retry(id);
        REQUIRE(orch.wait_idle());
        auto job = f.job(id);
        REQUIRE(job->status == JobStatus::Completed);
        REQUIRE(job->result->text == "second time");
        REQUIRE_FALSE(job->error);
        REQUIRE(calls == 2);
    }

    SECTION("RetryIsNoOpUnlessFailed") {
        f.factory.script(Strategy::Local, succeed("done"));
        auto& orch = f.start();

        auto id = orch.enqueue(f.audio("a.wav"), "a.wav");
        REQUIRE(orch.wait_idle());
        auto before = f.job(id);
        REQUIRE(before->status == JobStatus::Completed);

        REQUIRE_NOTHROW(orch.retry(id));
        REQUIRE(orch.wait_idle());
        REQUIRE(f.job(id) == before);
        REQUIRE(f.factory.created().size() == 1);

        REQUIRE_NOTHROW(orch.retry("no-such-job"));
        REQUIRE(orch.wait_idle());
    }

    SECTION("RetryWithoutAudioStaysFailed") {
        f.factory.script(Strategy::Local, fail_with(FailureKind::Backend, "server down"));
        auto& orch = f.start();

        auto path = f.audio("a.wav");
        auto id = orch.enqueue(path, "a.wav");
        REQUIRE(orch.wait_idle());
        std::filesystem::remove(path);

        orch.retry(id);
        REQUIRE(orch.wait_idle());
        auto job = f.job(id);
        REQUIRE(job->status == JobStatus::Failed);
        REQUIRE(job->error == "Original recording missing");
        REQUIRE(f.factory.created().size() == 1);
    }
}

TEST_CASE("JobOrchestrator cancellation", "[orchestrator]") {
    Fixture f;

    SECTION("CancelRunningJob") {
        TmpDir db_dir;
        AttemptDb attempts;
        REQUIRE(attempts.open(db_dir.file("attempts.db")));

        f.factory.script(Strategy::Local, block_until_stopped());
        auto& orch = f.start(&attempts);

        auto id = orch.enqueue(f.audio("a.wav"), "a.wav");
        REQUIRE(wait_for([&] { return f.status_is(id, JobStatus::Transcribing); }));

        orch.cancel(id);
        REQUIRE(orch.wait_idle());

        auto job = f.job(id);
        REQUIRE(job->status == JobStatus::Cancelled);
        REQUIRE(job->error == "Cancelled by user");
        REQUIRE_FALSE(job->result);

        auto log = attempts.for_job(id);
        REQUIRE(log.size() == 1);
        REQUIRE(log[0].outcome == "cancelled");
    }

    SECTION("CancelQueuedJob") {
        f.options.auto_run = false;
        auto& orch = f.start();

        auto id = orch.enqueue(f.audio("a.wav"), "a.wav");
        orch.cancel(id);
        REQUIRE(orch.wait_idle());
        REQUIRE(f.job(id)->status == JobStatus::Cancelled);

        // Terminal jobs ignore further cancels.
        REQUIRE_NOTHROW(orch.cancel(id));
        REQUIRE(orch.wait_idle());
        REQUIRE(f.job(id)->status == JobStatus::Cancelled);
    }

    SECTION("LateResultAfterGraceIsDropped") {
        std::atomic<bool> release{false};
        f.options.cancel_grace = 30ms;
        f.factory.script(Strategy::Local, [&release](const TranscribeRequest&,
                                                     const ProgressCallback&, std::stop_token) {
            // Ignores stop requests until released.
            while (!release) std::this_thread::sleep_for(1ms);
            return Outcome(TranscriptionResult{.text = "too late"});
        });
        auto& orch = f.start();

        auto id = orch.enqueue(f.audio("a.wav"), "a.wav");
        REQUIRE(wait_for([&] { return f.status_is(id, JobStatus::Transcribing); }));

        orch.cancel(id);
        REQUIRE(wait_for([&] { return f.status_is(id, JobStatus::Cancelled); }));

        release = true;
        std::this_thread::sleep_for(20ms);
        REQUIRE(orch.wait_idle());

        auto job = f.job(id);
        REQUIRE(job->status == JobStatus::Cancelled);
        REQUIRE_FALSE(job->result);
    }

    SECTION("RemoveRunningJob") {
        f.factory.script(Strategy::Local, block_until_stopped());
        auto& orch = f.start();

        auto id = orch.enqueue(f.audio("a.wav"), "a.wav");
        REQUIRE(wait_for([&] { return f.status_is(id, JobStatus::Transcribing); }));

        orch.remove_job(id);
        REQUIRE(orch.wait_idle());
        std::this_thread::sleep_for(20ms);
        REQUIRE(orch.wait_idle());

        REQUIRE_FALSE(f.job(id));
        REQUIRE_FALSE(f.ledger.contains(id));
    }
}

TEST_CASE("JobOrchestrator recordings", "[orchestrator]") {
    Fixture f;
    f.factory.script(Strategy::Local, succeed("dictated"));

    SECTION("CaptureThenTranscribe") {
        auto& orch = f.start();
        auto path = f.dir.file("Recording-1.wav");

        auto id = orch.begin_capture(path, "Recording-1.wav");
        REQUIRE(orch.wait_idle());

        auto job = f.job(id);
        REQUIRE(job->status == JobStatus::Recording);
        REQUIRE(job->capture_pending);
        REQUIRE(f.capture.snapshot().recording_job == id);
        REQUIRE(f.factory.created().empty());

        test::write_wav(path, 2.0);
        orch.complete_capture(id);
        REQUIRE(orch.wait_idle());

        job = f.job(id);
        REQUIRE(job->status == JobStatus::Completed);
        REQUIRE_FALSE(job->capture_pending);
        REQUIRE(job->duration == 2.0);
        REQUIRE(f.capture.snapshot().idle());
    }

    SECTION("FailedCaptureReleasesStatus") {
        auto& orch = f.start();
        auto id = orch.begin_capture(f.dir.file("Recording-2.wav"), "Recording-2.wav");
        orch.fail_capture(id, "no audio captured");
        REQUIRE(orch.wait_idle());

        REQUIRE(f.job(id)->status == JobStatus::Failed);
        REQUIRE(f.job(id)->error == "no audio captured");
        REQUIRE_FALSE(f.capture.is_recording());
    }

    SECTION("CaptureStatusListenersSeeChanges") {
        std::mutex mtx;
        std::vector<CaptureStatus::Snapshot> seen;
        f.capture.subscribe([&](const CaptureStatus::Snapshot& s) {
            std::lock_guard lock(mtx);
            seen.push_back(s);
        });

        auto& orch = f.start();
        auto id = orch.begin_capture(f.dir.file("Recording-3.wav"), "Recording-3.wav");
        orch.cancel(id);
        REQUIRE(orch.wait_idle());

        std::lock_guard lock(mtx);
        REQUIRE(seen.size() == 2);
        REQUIRE(seen[0].recording_job == id);
        REQUIRE(seen[1].idle());
    }

    SECTION("AddCompletedRegistersFinishedJob") {
        auto& orch = f.start();
        auto id = orch.add_completed(f.audio("Live-1.wav"), "Live-1.wav",
                                     {.text = "live words", .duration = 1.0});
        REQUIRE(orch.wait_idle());

        auto job = f.job(id);
        REQUIRE(job->status == JobStatus::Completed);
        REQUIRE(job->result->text == "live words");
        REQUIRE(f.factory.created().empty());
    }
}

TEST_CASE("JobOrchestrator recovery", "[orchestrator]") {
    Fixture f;
    f.options.auto_run = false;

    auto interrupted = make_job(f.audio("a.wav"), "a.wav");
    interrupted.transition(JobStatus::Transcribing);
    interrupted.stage = "local";
    interrupted.progress = 0.4;

    auto orphan = make_job(f.dir.file("gone.wav"), "gone.wav");

    auto done = make_job(f.audio("c.wav"), "c.wav");
    done.transition(JobStatus::Transcribing);
    done.complete({.text = "kept"});

    for (auto& j : {interrupted, orphan, done}) REQUIRE(f.ledger.add(j));

    auto& orch = f.start();
    orch.recover();
    REQUIRE(orch.wait_idle());

    auto a = f.job(interrupted.id);
    REQUIRE(a->status == JobStatus::Failed);
    REQUIRE(a->error == "Interrupted before completion");
    REQUIRE_FALSE(f.job(orphan.id));
    REQUIRE(f.job(done.id) == done);
    REQUIRE(f.ledger.size() == 2);

    // The interrupted job can be retried.
    f.factory.script(Strategy::Local, succeed("recovered"));
    orch.retry(interrupted.id);
    REQUIRE(wait_for([&] { return f.status_is(interrupted.id, JobStatus::Completed); }));
}
