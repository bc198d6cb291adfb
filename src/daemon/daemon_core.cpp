#include "daemon_core.hpp"

#include "export/transcript_export.hpp"
#include "jobs/job_json.hpp"
#include "live/windowed_engine.hpp"
#include "whisper/whisper_server_backend.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

namespace {

CloudOptions cloud_options(const Config& config) {
    CloudOptions opts;
    opts.openai_url = config.cloud.openai_url;
    opts.gemini_url = config.cloud.gemini_url;
    opts.retry_attempts = config.cloud.retry_attempts;
    opts.retry_delay = std::chrono::milliseconds(config.cloud.retry_delay_ms);
    opts.timeout_s = config.cloud.timeout;
    return opts;
}

OrchestratorOptions orchestrator_options(const Config& config) {
    OrchestratorOptions opts;
    opts.max_concurrent = config.jobs.max_concurrent;
    opts.cancel_grace = std::chrono::milliseconds(config.jobs.cancel_grace_ms);
    opts.auto_run = config.jobs.auto_run;
    if (!config.transcription.language.empty()) opts.language = config.transcription.language;
    opts.translate = config.transcription.translate;
    opts.temperature = config.transcription.temperature;
    opts.preserve_timestamps = config.transcription.preserve_timestamps;
    return opts;
}

nlohmann::json error_response(const std::string& message) {
    return {{"status", "error"}, {"message", message}};
}

nlohmann::json summary(const Job& job) {
    nlohmann::json j = {
        {"id", job.id},
        {"created_at", job.created_at},
        {"filename", job.filename},
        {"status", std::string(to_string(job.status))},
        {"stage", job.stage},
        {"progress", job.progress},
    };
    if (job.error) j["error"] = *job.error;
    if (job.duration) j["duration"] = *job.duration;
    return j;
}

} // namespace

DaemonCore::DaemonCore(Config config, bool verbose,
                       RingBuffer& ring_buf, AudioCapture& audio,
                       IpcServer& ipc, const Connectivity& connectivity,
                       NotifyCallback notify)
    : config_(std::move(config)), verbose_(verbose),
      ring_buf_(ring_buf), audio_(audio),
      ipc_(ipc), connectivity_(connectivity),
      notify_(std::move(notify)),
      catalog_(config_.paths.models_dir),
      backend_factory_(ServerEndpoints{
                           .local_url = config_.local_server.url,
                           .fallback_url = config_.local_server.fallback_url,
                           .api_format = config_.local_server.api_format,
                           .timeout_s = config_.local_server.timeout,
                       },
                       cloud_options(config_)),
      session_(ring_buf_, audio_, config_.paths.recordings_dir) {}

DaemonCore::~DaemonCore() = default;

bool DaemonCore::init() {
    std::error_code ec;
    for (const auto& dir : {config_.paths.data_dir, config_.paths.recordings_dir,
                            config_.paths.models_dir}) {
        fs::create_directories(dir, ec);
        if (ec) {
            std::println(stderr, "daemon: cannot create {}: {}", dir, ec.message());
            return false;
        }
    }

    auto data = fs::path(config_.paths.data_dir);
    if (!ledger_.open((data / "jobs.json").string())) {
        std::println(stderr, "Warning: job ledger was unreadable, starting empty");
    }
    if (!attempt_db_.open((data / "attempts.db").string())) {
        std::println(stderr, "Warning: attempt DB failed to open, diagnostics disabled");
    }
    catalog_.load();

    jobs_ = std::make_unique<JobOrchestrator>(
        ledger_, backend_factory_, connectivity_, catalog_, capture_status_,
        [this] { return config_.selector(); }, orchestrator_options(config_),
        &attempt_db_, verbose_);

    observer_token_ = jobs_->subscribe([this](const JobEvent& event) {
        if (event.kind != JobEvent::Kind::Removed && !event.job.is_terminal()) return;
        {
            std::lock_guard lock(finished_mtx_);
            finished_.push_back(event.job);
        }
        notify_();
    });

    jobs_->recover();

    auto live_backend = parse_live_backend(config_.live.backend);
    live_ = std::make_unique<LiveSession>(
        audio_, ring_buf_, capture_status_, catalog_,
        [this](LiveBackend b) { return make_engine(b); },
        LiveOptions{
            .recordings_dir = config_.paths.recordings_dir,
            .save_interval = std::chrono::milliseconds(config_.live.save_interval_ms),
        },
        jobs_.get(), verbose_);
    if (live_backend) live_->switch_backend(*live_backend);

    log(std::format("{} jobs in ledger, {} models installed", ledger_.size(),
                    catalog_.entries().size()));
    return true;
}

nlohmann::json DaemonCore::handle_command(const std::string& cmd_str,
                                          const nlohmann::json& cmd) {
    if (cmd_str == "import") return handle_import(cmd);
    if (cmd_str == "list") return handle_list(cmd);
    if (cmd_str == "show") return handle_show(cmd);
    if (cmd_str == "run" || cmd_str == "retry") return handle_retry(cmd);
    if (cmd_str == "cancel") return handle_cancel(cmd);
    if (cmd_str == "remove") return handle_remove(cmd);
    if (cmd_str == "record") return handle_record(cmd);
    if (cmd_str == "live") return handle_live(cmd);
    if (cmd_str == "export") return handle_export(cmd);
    if (cmd_str == "attempts") return handle_attempts(cmd);
    if (cmd_str == "status") return handle_status(cmd);
    return error_response("unknown command");
}

nlohmann::json DaemonCore::handle_import(const nlohmann::json& cmd) {
    std::string path = cmd.value("path", "");
    if (path.empty()) return error_response("missing path");

    std::error_code ec;
    auto source = fs::absolute(path, ec);
    if (ec || !fs::is_regular_file(source, ec)) return error_response("no such file: " + path);

    // The job keeps its own copy so the original may be moved or deleted.
    auto filename = source.filename().string();
    auto dest = fs::path(config_.paths.recordings_dir) / filename;
    if (fs::exists(dest, ec)) {
        dest = fs::path(config_.paths.recordings_dir) / (file_timestamp() + "-" + filename);
    }
    fs::copy_file(source, dest, ec);
    if (ec) return error_response(std::format("cannot copy {}: {}", path, ec.message()));

    auto id = jobs_->enqueue(dest.string(), filename, source.string());
    log(std::format("Imported {} as job {}", filename, id));

    if (cmd.value("wait", false)) return {{"status", "waiting"}, {"id", id}};
    return {{"status", "ok"}, {"id", id}};
}

nlohmann::json DaemonCore::handle_list(const nlohmann::json& cmd) {
    std::string filter = cmd.value("filter", "all");
    std::optional<JobStatus> wanted;
    if (filter != "all") {
        wanted = parse_status(filter);
        if (!wanted) return error_response("unknown status filter: " + filter);
    }

    nlohmann::json resp = {{"status", "ok"}, {"jobs", nlohmann::json::array()}};
    for (const auto& job : jobs_->jobs()) {
        if (wanted && job.status != *wanted) continue;
        resp["jobs"].push_back(summary(job));
    }
    return resp;
}

nlohmann::json DaemonCore::handle_show(const nlohmann::json& cmd) {
    auto id = resolve_id(cmd);
    if (!id) return error_response(id.error());

    auto job = jobs_->job(*id);
    if (!job) return error_response("no such job: " + *id);
    return job_response(*job);
}

nlohmann::json DaemonCore::handle_retry(const nlohmann::json& cmd) {
    auto id = resolve_id(cmd);
    if (!id) return error_response(id.error());

    auto job = jobs_->job(*id);
    if (!job) return error_response("no such job: " + *id);

    if (cmd.value("cmd", "") == "run") {
        if (job->status != JobStatus::Queued) {
            return error_response(std::format("job is {}, not queued", to_string(job->status)));
        }
        jobs_->run(*id);
    } else {
        if (job->status != JobStatus::Failed) {
            return error_response(std::format("job is {}, not failed", to_string(job->status)));
        }
        jobs_->retry(*id);
    }

    if (cmd.value("wait", false)) return {{"status", "waiting"}, {"id", *id}};
    return {{"status", "ok"}, {"id", *id}};
}

nlohmann::json DaemonCore::handle_cancel(const nlohmann::json& cmd) {
    auto id = resolve_id(cmd);
    if (!id) return error_response(id.error());

    if (session_.state() == SessionState::Recording && session_.job_id() == *id) {
        session_.abort();
        log("Recording aborted");
    }
    jobs_->cancel(*id);
    return {{"status", "ok"}, {"id", *id}};
}

nlohmann::json DaemonCore::handle_remove(const nlohmann::json& cmd) {
    auto id = resolve_id(cmd);
    if (!id) return error_response(id.error());

    auto job = jobs_->job(*id);
    if (!job) return error_response("no such job: " + *id);

    if (session_.state() == SessionState::Recording && session_.job_id() == *id) {
        session_.abort();
    }
    jobs_->remove_job(*id);

    if (cmd.value("delete_audio", false)) {
        std::error_code ec;
        fs::remove(job->audio_path, ec);
        if (ec) std::println(stderr, "daemon: cannot delete {}: {}", job->audio_path, ec.message());
    }
    return {{"status", "ok"}, {"id", *id}};
}

nlohmann::json DaemonCore::handle_record(const nlohmann::json& cmd) {
    std::string action = cmd.value("action", "");

    if (action == "start") {
        if (session_.state() != SessionState::Idle) return error_response("already recording");
        if (capture_status_.is_live_streaming()) {
            return error_response("audio capture is busy with a live session");
        }

        auto path = session_.start_recording();
        if (!path) return error_response(path.error());

        auto filename = fs::path(*path).filename().string();
        auto id = jobs_->begin_capture(*path, filename);
        session_.set_job_id(id);
        log("Recording started: " + filename);
        return {{"status", "ok"}, {"id", id}, {"path", *path}};
    }

    if (action == "stop") {
        if (session_.state() != SessionState::Recording) return error_response("not recording");

        auto id = session_.job_id();
        auto rec = session_.stop_recording();
        if (!rec) {
            jobs_->fail_capture(id, rec.error());
            return error_response(rec.error());
        }

        log(std::format("Recording stopped, {:.1f}s audio, transcribing...", rec->duration_s));
        jobs_->complete_capture(id);

        if (cmd.value("wait", false)) return {{"status", "waiting"}, {"id", id}};
        return {{"status", "ok"}, {"id", id}, {"duration", rec->duration_s}};
    }

    return error_response("record expects start or stop");
}

nlohmann::json DaemonCore::handle_live(const nlohmann::json& cmd) {
    std::string action = cmd.value("action", "");

    if (action == "start") {
        if (session_.state() != SessionState::Idle) {
            return error_response("audio capture is busy with a recording");
        }
        auto backend = live_->start();
        if (!backend) return error_response(backend.error());
        return {{"status", "ok"}, {"backend", std::string(to_string(*backend))}};
    }

    if (action == "stop") {
        live_->stop();
        return {{"status", "ok"}, {"text", live_->final_text()}};
    }

    if (action == "switch") {
        auto backend = parse_live_backend(cmd.value("backend", ""));
        if (!backend) return error_response("unknown live backend");
        try {
            live_->switch_backend(*backend);
        } catch (const LiveSessionError& e) {
            return error_response(e.what());
        }
        return {{"status", "ok"}, {"backend", std::string(to_string(*backend))}};
    }

    if (action == "save") {
        auto saved = live_->save();
        if (!saved) return error_response(saved.error());

        nlohmann::json resp = {{"status", "ok"}, {"text_path", saved->text_path}};
        if (saved->audio_path) resp["audio_path"] = *saved->audio_path;
        if (saved->job_id) resp["id"] = *saved->job_id;
        return resp;
    }

    if (action == "text") {
        nlohmann::json resp = {
            {"status", "ok"},
            {"state", std::string(to_string(live_->state()))},
            {"final", live_->final_text()},
            {"partial", live_->partial_text()},
            {"text", live_->combined_text()},
        };
        if (auto err = live_->last_error()) resp["error"] = *err;
        return resp;
    }

    return error_response("live expects start, stop, switch, save or text");
}

nlohmann::json DaemonCore::handle_export(const nlohmann::json& cmd) {
    auto id = resolve_id(cmd);
    if (!id) return error_response(id.error());

    auto format = parse_export_format(cmd.value("format", "txt"));
    if (!format) return error_response("unknown export format");

    auto job = jobs_->job(*id);
    if (!job) return error_response("no such job: " + *id);
    if (job->status != JobStatus::Completed || !job->result) {
        return error_response("job has no transcript");
    }

    return {
        {"status", "ok"},
        {"filename", export_filename(*job, *format)},
        {"content", render_transcript(*job->result, *format)},
    };
}

nlohmann::json DaemonCore::handle_attempts(const nlohmann::json& cmd) {
    if (!attempt_db_.is_open()) return error_response("attempt database unavailable");

    std::vector<AttemptEntry> entries;
    if (cmd.contains("id")) {
        auto id = resolve_id(cmd);
        if (!id) return error_response(id.error());
        entries = attempt_db_.for_job(*id);
    } else {
        entries = attempt_db_.recent(cmd.value("limit", 20));
    }

    nlohmann::json resp = {{"status", "ok"}, {"entries", nlohmann::json::array()}};
    for (auto& e : entries) {
        resp["entries"].push_back({
            {"id", e.id},
            {"timestamp", e.timestamp},
            {"job_id", e.job_id},
            {"strategy", e.strategy},
            {"outcome", e.outcome},
            {"error", e.error},
            {"processing_time", e.processing_time},
        });
    }
    return resp;
}

nlohmann::json DaemonCore::handle_status(const nlohmann::json& /*cmd*/) {
    nlohmann::json resp = {{"status", "ok"}};

    if (session_.state() == SessionState::Recording) {
        resp["state"] = "recording";
        resp["duration"] = session_.recording_duration();
        resp["id"] = session_.job_id();
    } else if (live_->state() != LiveState::Idle) {
        resp["state"] = "live";
        if (auto b = live_->active_backend()) resp["live_backend"] = std::string(to_string(*b));
        resp["captured"] = live_->captured_seconds();
    } else {
        resp["state"] = "idle";
    }

    std::map<std::string, int> counts;
    for (const auto& job : jobs_->jobs()) counts[std::string(to_string(job.status))]++;
    resp["jobs"] = counts;
    resp["online"] = connectivity_.has_active_connection();
    resp["live_backend_selected"] = std::string(to_string(live_->backend()));
    return resp;
}

void DaemonCore::on_job_events() {
    std::vector<Job> finished;
    {
        std::lock_guard lock(finished_mtx_);
        finished.swap(finished_);
    }

    for (const auto& job : finished) {
        for (auto it = waiting_clients_.begin(); it != waiting_clients_.end();) {
            if (it->second != job.id) {
                ++it;
                continue;
            }
            ipc_.send_response(it->first, job_response(job));
            it = waiting_clients_.erase(it);
        }
    }
}

void DaemonCore::add_waiting_client(int fd, const JobId& id) {
    // The job may have finished before the client was registered.
    auto job = jobs_->job(id);
    if (!job || job->is_terminal()) {
        ipc_.send_response(fd, job ? job_response(*job) : error_response("job was removed"));
        return;
    }
    waiting_clients_[fd] = id;
}

void DaemonCore::remove_waiting_client(int fd) {
    waiting_clients_.erase(fd);
}

void DaemonCore::shutdown() {
    if (live_ && live_->state() != LiveState::Idle) live_->stop();

    if (session_.state() == SessionState::Recording) {
        log("Recording interrupted by shutdown");
        session_.abort();
    }

    if (jobs_) {
        jobs_->unsubscribe(observer_token_);
        jobs_->shutdown();
    }

    for (auto& [fd, id] : waiting_clients_) {
        ipc_.send_response(fd, error_response("daemon shutting down"));
    }
    waiting_clients_.clear();
    attempt_db_.close();

    // Jobs left recording are failed by recovery on the next start.
    capture_status_.reset();
}

std::expected<JobId, std::string> DaemonCore::resolve_id(const nlohmann::json& cmd) {
    std::string prefix = cmd.value("id", "");
    if (prefix.empty()) return std::unexpected("missing job id");

    std::optional<JobId> match;
    for (const auto& job : jobs_->jobs()) {
        if (job.id == prefix) return job.id;
        if (!job.id.starts_with(prefix)) continue;
        if (match) return std::unexpected("ambiguous job id: " + prefix);
        match = job.id;
    }
    if (!match) return std::unexpected("no such job: " + prefix);
    return *match;
}

std::unique_ptr<StreamingEngine> DaemonCore::make_engine(LiveBackend backend) {
    std::string url;
    switch (backend) {
        case LiveBackend::Server: url = config_.local_server.url; break;
        case LiveBackend::WhisperTiny: url = config_.live.tiny_url; break;
        case LiveBackend::WhisperBase: url = config_.live.base_url; break;
    }

    std::string name(to_string(backend));
    auto server = std::make_shared<WhisperServerBackend>(
        name, url, config_.local_server.api_format, config_.local_server.timeout);

    WindowOptions opts;
    opts.window_seconds = config_.live.window_seconds;
    opts.hop_seconds = config_.live.hop_seconds;
    opts.sample_rate = config_.audio.sample_rate;

    return std::make_unique<WindowedEngine>(
        name,
        [server](std::span<const int16_t> audio, uint32_t rate, std::stop_token stop) {
            return server->transcribe_pcm(audio, rate, stop);
        },
        opts);
}

nlohmann::json DaemonCore::job_response(const Job& job) {
    nlohmann::json resp = {{"status", "ok"}, {"job", job}};
    return resp;
}

void DaemonCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[whisper-control] {}", msg);
    }
}
