#include "platform/linux/unix_socket_client.hpp"
#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <string>
#include <vector>

using json = nlohmann::json;

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  import <file> [--wait]              Queue an audio file for transcription");
    std::println(stderr, "  list [--filter STATUS]              List jobs");
    std::println(stderr, "  show <id>                           Show a job and its transcript");
    std::println(stderr, "  run <id> [--wait]                   Start a queued job now");
    std::println(stderr, "  retry <id> [--wait]                 Retry a failed job");
    std::println(stderr, "  cancel <id>                         Cancel a job");
    std::println(stderr, "  remove <id> [--delete-audio]        Remove a job");
    std::println(stderr, "  record start|stop [--wait]          Record from the microphone");
    std::println(stderr, "  live start|stop|save|text           Live transcription");
    std::println(stderr, "  live switch server|whisper-tiny|whisper-base");
    std::println(stderr, "  export <id> [--format txt|json|srt|vtt] [--output PATH]");
    std::println(stderr, "  attempts [--limit N] [--id ID]      Show backend attempts");
    std::println(stderr, "  status                              Show daemon status");
}

static void print_job_line(const json& job) {
    std::string line = std::format("{:.8}  {:<12} {:<13} {}", job.value("id", ""),
                                   job.value("status", ""), job.value("stage", ""),
                                   job.value("filename", ""));
    if (job.value("status", "") == "transcribing" || job.value("status", "") == "recording") {
        line += std::format("  {:.0f}%", job.value("progress", 0.0) * 100.0);
    }
    std::println("{}", line);
    if (job.contains("error")) std::println("    {}", job["error"].get<std::string>());
}

static void print_job(const json& job) {
    std::println("ID:       {}", job.value("id", ""));
    std::println("File:     {}", job.value("filename", ""));
    std::println("Created:  {}", job.value("created_at", ""));
    std::println("Status:   {} ({})", job.value("status", ""), job.value("stage", ""));
    if (job.contains("duration")) {
        std::println("Duration: {:.1f}s", job["duration"].get<double>());
    }
    if (job.contains("source_path")) {
        std::println("Source:   {}", job["source_path"].get<std::string>());
    }
    if (job.contains("error")) std::println("Error:    {}", job["error"].get<std::string>());
    if (job.contains("result")) {
        std::println("");
        std::println("{}", job["result"].value("text", ""));
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;
    std::string filter = "all";
    std::string format = "txt";
    std::string output_path;
    std::string job_filter;
    int limit = 20;
    bool wait = false;
    bool delete_audio = false;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--wait" || arg == "-w") {
            wait = true;
        } else if (arg == "--delete-audio") {
            delete_audio = true;
        } else if (arg == "--filter" && i + 1 < argc) {
            filter = argv[++i];
        } else if (arg == "--format" && i + 1 < argc) {
            format = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            limit = std::atoi(argv[++i]);
        } else if (arg == "--id" && i + 1 < argc) {
            job_filter = argv[++i];
        } else {
            positional.push_back(arg);
        }
    }

    auto arg_at = [&](size_t i) { return i < positional.size() ? positional[i] : std::string(); };

    json cmd;
    if (command == "import") {
        if (positional.empty()) {
            std::println(stderr, "import needs a file");
            return 1;
        }
        // The daemon runs from /, so relative paths are resolved here.
        std::error_code ec;
        auto path = std::filesystem::absolute(positional[0], ec);
        cmd = {{"cmd", "import"}, {"path", ec ? positional[0] : path.string()}, {"wait", wait}};
    } else if (command == "list") {
        cmd = {{"cmd", "list"}, {"filter", filter}};
    } else if (command == "show" || command == "cancel") {
        cmd = {{"cmd", command}, {"id", arg_at(0)}};
    } else if (command == "run" || command == "retry") {
        cmd = {{"cmd", command}, {"id", arg_at(0)}, {"wait", wait}};
    } else if (command == "remove") {
        cmd = {{"cmd", "remove"}, {"id", arg_at(0)}, {"delete_audio", delete_audio}};
    } else if (command == "record") {
        cmd = {{"cmd", "record"}, {"action", arg_at(0)}, {"wait", wait}};
    } else if (command == "live") {
        cmd = {{"cmd", "live"}, {"action", arg_at(0)}};
        if (arg_at(0) == "switch") cmd["backend"] = arg_at(1);
    } else if (command == "export") {
        cmd = {{"cmd", "export"}, {"id", arg_at(0)}, {"format", format}};
    } else if (command == "attempts") {
        cmd = {{"cmd", "attempts"}, {"limit", limit}};
        if (!job_filter.empty()) cmd["id"] = job_filter;
    } else if (command == "status") {
        cmd = {{"cmd", "status"}};
    } else {
        std::println(stderr, "Unknown command: {}", command);
        usage(argv[0]);
        return 1;
    }

    UnixSocketClient client;
    auto sock_path = platform::ipc_endpoint();

    if (!client.connect(sock_path)) {
        std::println(stderr, "Failed to connect to daemon at {}", sock_path);
        std::println(stderr, "Is whisper-control running?");
        return 1;
    }

    if (!client.send(cmd)) {
        std::println(stderr, "Failed to send command");
        return 1;
    }

    json response;
    if (!client.recv(response, wait ? -1 : 30000)) {
        std::println(stderr, "No response from daemon (timeout)");
        return 1;
    }

    if (response.value("status", "") == "error") {
        std::println(stderr, "Error: {}", response.value("message", "unknown error"));
        return 1;
    }

    if (response.contains("job")) {
        auto& job = response["job"];
        print_job(job);
        return job.value("status", "") == "failed" ? 1 : 0;
    }

    if (command == "list") {
        for (auto& job : response["jobs"]) print_job_line(job);
    } else if (command == "export") {
        auto content = response.value("content", "");
        if (output_path.empty()) {
            std::print("{}", content);
        } else {
            if (std::filesystem::is_directory(output_path)) {
                output_path += "/" + response.value("filename", "transcript.txt");
            }
            std::ofstream out(output_path, std::ios::binary);
            out << content;
            if (!out) {
                std::println(stderr, "Failed to write {}", output_path);
                return 1;
            }
            std::println("Wrote {}", output_path);
        }
    } else if (command == "attempts") {
        for (auto& e : response["entries"]) {
            std::println("[{}] {:.8}  {:<13} {:<10} {:.1f}s  {}", e.value("timestamp", ""),
                         e.value("job_id", ""), e.value("strategy", ""), e.value("outcome", ""),
                         e.value("processing_time", 0.0), e.value("error", ""));
        }
    } else if (command == "status") {
        std::println("State: {}", response.value("state", "unknown"));
        if (response.contains("duration")) {
            std::println("Recording duration: {:.1f}s", response["duration"].get<double>());
        }
        if (response.contains("live_backend")) {
            std::println("Live backend: {}", response["live_backend"].get<std::string>());
        }
        std::println("Network: {}", response.value("online", false) ? "online" : "offline");
        if (response.contains("jobs")) {
            for (auto& [status, count] : response["jobs"].items()) {
                std::println("  {:<13} {}", status, count.get<int>());
            }
        }
    } else if (command == "live" && response.contains("text")) {
        std::println("{}", response["text"].get<std::string>());
    } else if (response.contains("text_path")) {
        std::println("Saved {}", response["text_path"].get<std::string>());
    } else if (response.contains("id")) {
        std::println("{}", response["id"].get<std::string>());
    } else {
        std::println("OK");
    }

    return 0;
}
