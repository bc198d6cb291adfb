#pragma once

#include "config.hpp"
#include "jobs/capture_status.hpp"
#include "jobs/job_orchestrator.hpp"
#include "live/live_session.hpp"
#include "platform/audio_capture.hpp"
#include "platform/connectivity.hpp"
#include "platform/ipc_server.hpp"
#include "ring_buffer.hpp"
#include "session.hpp"
#include "storage/attempt_db.hpp"
#include "storage/job_ledger.hpp"
#include "storage/model_catalog.hpp"
#include "whisper/backend_factory.hpp"

#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Portable daemon logic: owns the job orchestrator, the file recording session and the
// live session, and answers IPC commands. All methods except the job observer run on
// the event loop thread.
class DaemonCore {
public:
    // Wakes the event loop so that it calls on_job_events().
    using NotifyCallback = std::function<void()>;

    DaemonCore(Config config, bool verbose,
               RingBuffer& ring_buf, AudioCapture& audio,
               IpcServer& ipc, const Connectivity& connectivity,
               NotifyCallback notify);
    ~DaemonCore();

    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;

    bool init();

    // A response with status "waiting" means the reply is sent later, once the job
    // named by "id" reaches a terminal state; pass the client to add_waiting_client().
    nlohmann::json handle_command(const std::string& cmd_str, const nlohmann::json& cmd);

    // Answers clients waiting on jobs that finished since the last call.
    void on_job_events();

    void add_waiting_client(int fd, const JobId& id);
    void remove_waiting_client(int fd);

    JobOrchestrator* orchestrator() { return jobs_.get(); }
    const CaptureStatus& capture_status() const { return capture_status_; }

    void shutdown();

private:
    nlohmann::json handle_import(const nlohmann::json& cmd);
    nlohmann::json handle_list(const nlohmann::json& cmd);
    nlohmann::json handle_show(const nlohmann::json& cmd);
    nlohmann::json handle_retry(const nlohmann::json& cmd);
    nlohmann::json handle_cancel(const nlohmann::json& cmd);
    nlohmann::json handle_remove(const nlohmann::json& cmd);
    nlohmann::json handle_record(const nlohmann::json& cmd);
    nlohmann::json handle_live(const nlohmann::json& cmd);
    nlohmann::json handle_export(const nlohmann::json& cmd);
    nlohmann::json handle_attempts(const nlohmann::json& cmd);
    nlohmann::json handle_status(const nlohmann::json& cmd);

    // Accepts a full id or a unique prefix of one.
    std::expected<JobId, std::string> resolve_id(const nlohmann::json& cmd);

    std::unique_ptr<StreamingEngine> make_engine(LiveBackend backend);
    nlohmann::json job_response(const Job& job);

    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    RingBuffer& ring_buf_;
    AudioCapture& audio_;
    IpcServer& ipc_;
    const Connectivity& connectivity_;
    NotifyCallback notify_;

    CaptureStatus capture_status_;
    JobLedger ledger_;
    AttemptDb attempt_db_;
    FileModelCatalog catalog_;
    HttpBackendFactory backend_factory_;
    std::unique_ptr<JobOrchestrator> jobs_;
    int observer_token_ = 0;

    Session session_;
    std::unique_ptr<LiveSession> live_;

    std::mutex finished_mtx_;
    std::vector<Job> finished_;

    std::map<int, JobId> waiting_clients_;
};
