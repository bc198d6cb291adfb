#include <catch2/catch_test_macros.hpp>

#include "daemon_core.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>
#include <utility>
#include <vector>

using json = nlohmann::json;
using test::TmpDir;
using test::wait_for;

namespace {

// Keeps every response instead of writing it to a socket.
class FakeIpcServer : public IpcServer {
public:
    bool start(const std::string&) override { return true; }
    void stop() override {}
    int server_fd() const override { return -1; }
    int accept_client() override { return -1; }
    ReadStatus read_command(int, json&) override { return ReadStatus::Closed; }
    bool send_response(int fd, const json& response) override {
        std::lock_guard lock(mtx);
        sent.emplace_back(fd, response);
        return true;
    }
    void close_client(int) override {}

    std::vector<std::pair<int, json>> responses() {
        std::lock_guard lock(mtx);
        return sent;
    }

private:
    std::mutex mtx;
    std::vector<std::pair<int, json>> sent;
};

Config test_config(const TmpDir& dir) {
    Config cfg;
    cfg.paths.data_dir = dir.file("data");
    cfg.apply_environment();
    // Nothing installed and no cloud: every transcription fails fast without network.
    cfg.transcription.cloud_enabled = false;
    return cfg;
}

struct CoreFixture {
    TmpDir dir;
    RingBuffer ring{1024 * 1024};
    test::MockAudioCapture capture;
    FakeIpcServer ipc;
    test::FakeConnectivity net;
    std::atomic<int> notified{0};
    DaemonCore core;

    CoreFixture()
        : core(test_config(dir), false, ring, capture, ipc, net, [this] { ++notified; }) {}

    ~CoreFixture() { core.shutdown(); }

    json send(const json& cmd) { return core.handle_command(cmd.value("cmd", ""), cmd); }

    std::string import_wav(const std::string& name, bool wait = false) {
        auto path = dir.file(name);
        test::write_wav(path, 1.0);
        auto resp = send({{"cmd", "import"}, {"path", path}, {"wait", wait}});
        REQUIRE(resp["status"] == (wait ? "waiting" : "ok"));
        return resp["id"].get<std::string>();
    }

    json show(const std::string& id) { return send({{"cmd", "show"}, {"id", id}}); }

    void settle() { REQUIRE(core.orchestrator()->wait_idle()); }
};

} // namespace

TEST_CASE("DaemonCore jobs", "[daemon]") {
    CoreFixture fx;
    REQUIRE(fx.core.init());
    REQUIRE(std::filesystem::is_directory(fx.dir.file("data/recordings")));
    REQUIRE(std::filesystem::is_directory(fx.dir.file("data/models")));

    SECTION("ImportCopiesAndFailsWithoutBackend") {
        auto id = fx.import_wav("talk.wav");
        fx.settle();

        auto resp = fx.show(id);
        REQUIRE(resp["status"] == "ok");
        auto& job = resp["job"];
        REQUIRE(job["status"] == "failed");
        REQUIRE(job["error"] == "No available transcription backend");
        REQUIRE(job["filename"] == "talk.wav");
        REQUIRE(job["source_path"] == fx.dir.file("talk.wav"));
        REQUIRE(job["audio_path"] == fx.dir.file("data/recordings/talk.wav"));
        REQUIRE(std::filesystem::exists(fx.dir.file("data/recordings/talk.wav")));
    }

    SECTION("ImportNameCollisionGetsPrefix") {
        auto first = fx.import_wav("talk.wav");
        auto second = fx.import_wav("talk.wav");
        auto a = fx.show(first)["job"]["audio_path"].get<std::string>();
        auto b = fx.show(second)["job"]["audio_path"].get<std::string>();
        REQUIRE(a != b);
        REQUIRE(b.ends_with("-talk.wav"));
    }

    SECTION("ImportErrors") {
        REQUIRE(fx.send({{"cmd", "import"}})["message"] == "missing path");
        auto r = fx.send({{"cmd", "import"}, {"path", fx.dir.file("nope.wav")}});
        REQUIRE(r["status"] == "error");
        REQUIRE(r["message"] == "no such file: " + fx.dir.file("nope.wav"));
    }

    SECTION("ListFilters") {
        fx.import_wav("a.wav");
        fx.import_wav("b.wav");
        fx.settle();

        REQUIRE(fx.send({{"cmd", "list"}})["jobs"].size() == 2);
        REQUIRE(fx.send({{"cmd", "list"}, {"filter", "failed"}})["jobs"].size() == 2);
        REQUIRE(fx.send({{"cmd", "list"}, {"filter", "completed"}})["jobs"].empty());
        auto bad = fx.send({{"cmd", "list"}, {"filter", "paused"}});
        REQUIRE(bad["status"] == "error");
    }

    SECTION("IdPrefixes") {
        auto id = fx.import_wav("a.wav");
        REQUIRE(fx.show(id.substr(0, 8))["job"]["id"] == id);
        REQUIRE(fx.send({{"cmd", "show"}})["message"] == "missing job id");
        REQUIRE(fx.show("zzz")["message"] == "no such job: zzz");
    }

    SECTION("RunAndRetryPreconditions") {
        auto id = fx.import_wav("a.wav");
        fx.settle();

        auto run = fx.send({{"cmd", "run"}, {"id", id}});
        REQUIRE(run["status"] == "error");
        REQUIRE(run["message"] == "job is failed, not queued");

        auto retry = fx.send({{"cmd", "retry"}, {"id", id}});
        REQUIRE(retry["status"] == "ok");
        fx.settle();
        REQUIRE(fx.show(id)["job"]["status"] == "failed");
    }

    SECTION("ExportNeedsTranscript") {
        auto id = fx.import_wav("a.wav");
        fx.settle();
        REQUIRE(fx.send({{"cmd", "export"}, {"id", id}})["message"] == "job has no transcript");
        REQUIRE(fx.send({{"cmd", "export"}, {"id", id}, {"format", "docx"}})["message"] ==
                "unknown export format");
    }

    SECTION("RemoveWithAudio") {
        auto id = fx.import_wav("a.wav");
        fx.settle();
        auto resp = fx.send({{"cmd", "remove"}, {"id", id}, {"delete_audio", true}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(fx.send({{"cmd", "list"}})["jobs"].empty());
        REQUIRE_FALSE(std::filesystem::exists(fx.dir.file("data/recordings/a.wav")));
        REQUIRE(std::filesystem::exists(fx.dir.file("a.wav")));
    }

    SECTION("WaitingClientAnsweredWhenJobEnds") {
        auto id = fx.import_wav("a.wav", true);
        fx.core.add_waiting_client(7, id);
        fx.settle();
        fx.core.on_job_events();

        auto sent = fx.ipc.responses();
        REQUIRE(sent.size() == 1);
        REQUIRE(sent[0].first == 7);
        REQUIRE(sent[0].second["job"]["id"] == id);
        REQUIRE(sent[0].second["job"]["status"] == "failed");
        REQUIRE(fx.notified > 0);
    }

    SECTION("AttemptsAvailable") {
        fx.import_wav("a.wav");
        fx.settle();
        auto resp = fx.send({{"cmd", "attempts"}});
        REQUIRE(resp["status"] == "ok");
        REQUIRE(resp["entries"].empty());
    }

    SECTION("UnknownCommand") {
        REQUIRE(fx.send({{"cmd", "dance"}})["message"] == "unknown command");
    }
}

TEST_CASE("DaemonCore capture", "[daemon]") {
    CoreFixture fx;
    REQUIRE(fx.core.init());

    SECTION("IdleStatus") {
        auto st = fx.send({{"cmd", "status"}});
        REQUIRE(st["state"] == "idle");
        REQUIRE(st["online"] == true);
        REQUIRE(st["live_backend_selected"] == "server");
    }

    SECTION("RecordThenTranscribe") {
        auto start = fx.send({{"cmd", "record"}, {"action", "start"}});
        REQUIRE(start["status"] == "ok");
        auto id = start["id"].get<std::string>();
        REQUIRE(fx.capture.is_capturing());

        REQUIRE(fx.send({{"cmd", "status"}})["state"] == "recording");
        REQUIRE(fx.send({{"cmd", "record"}, {"action", "start"}})["message"] ==
                "already recording");
        REQUIRE(fx.send({{"cmd", "live"}, {"action", "start"}})["message"] ==
                "audio capture is busy with a recording");

        auto pcm = test::tone(16000);
        fx.ring.write(pcm.data(), pcm.size() * sizeof(int16_t));

        auto stop = fx.send({{"cmd", "record"}, {"action", "stop"}});
        REQUIRE(stop["status"] == "ok");
        REQUIRE(stop["duration"] == 1.0);
        fx.settle();

        auto job = fx.show(id)["job"];
        REQUIRE(job["status"] == "failed");
        REQUIRE(job["error"] == "No available transcription backend");
        REQUIRE(std::filesystem::exists(job["audio_path"].get<std::string>()));
        REQUIRE(fx.send({{"cmd", "status"}})["state"] == "idle");
    }

    SECTION("SilentRecordingFails") {
        auto id = fx.send({{"cmd", "record"}, {"action", "start"}})["id"].get<std::string>();
        auto stop = fx.send({{"cmd", "record"}, {"action", "stop"}});
        REQUIRE(stop["message"] == "no audio captured");
        fx.settle();
        auto job = fx.show(id)["job"];
        REQUIRE(job["status"] == "failed");
        REQUIRE(job["error"] == "no audio captured");
    }

    SECTION("StopWithoutRecording") {
        REQUIRE(fx.send({{"cmd", "record"}, {"action", "stop"}})["message"] == "not recording");
        REQUIRE(fx.send({{"cmd", "record"}, {"action", "pause"}})["status"] == "error");
    }

    SECTION("CancelAbortsRecording") {
        auto id = fx.send({{"cmd", "record"}, {"action", "start"}})["id"].get<std::string>();
        REQUIRE(fx.send({{"cmd", "cancel"}, {"id", id}})["status"] == "ok");
        REQUIRE_FALSE(fx.capture.is_capturing());
        fx.settle();
        REQUIRE(fx.show(id)["job"]["status"] == "cancelled");
    }

    SECTION("LiveSwitchAndText") {
        auto sw = fx.send({{"cmd", "live"}, {"action", "switch"}, {"backend", "whisper-tiny"}});
        REQUIRE(sw["status"] == "ok");
        REQUIRE(fx.send({{"cmd", "status"}})["live_backend_selected"] == "whisper-tiny");
        REQUIRE(fx.send({{"cmd", "live"}, {"action", "switch"}, {"backend", "nope"}})["message"] ==
                "unknown live backend");

        auto text = fx.send({{"cmd", "live"}, {"action", "text"}});
        REQUIRE(text["state"] == "idle");
        REQUIRE(text["text"] == "");
        REQUIRE(fx.send({{"cmd", "live"}, {"action", "save"}})["message"] == "nothing to save");
    }

    SECTION("ShutdownReleasesWaitersAndCapture") {
        auto id = fx.send({{"cmd", "record"}, {"action", "start"}})["id"].get<std::string>();
        REQUIRE(wait_for([&] { return fx.show(id)["status"] == "ok"; }));
        REQUIRE(wait_for([&] { return fx.core.capture_status().is_recording(); }));
        fx.core.add_waiting_client(9, id);
        fx.core.shutdown();
        REQUIRE(fx.core.capture_status().snapshot().idle());

        auto sent = fx.ipc.responses();
        REQUIRE(sent.size() == 1);
        REQUIRE(sent[0].first == 9);
        REQUIRE(sent[0].second["message"] == "daemon shutting down");
        REQUIRE_FALSE(fx.capture.is_capturing());
    }
}
