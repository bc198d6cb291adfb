#include "job_json.hpp"

#include <stdexcept>

using json = nlohmann::json;

namespace {

template <typename T>
std::optional<T> optional_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    return it->get<T>();
}

} // namespace

void to_json(json& j, const TranscriptSegment& s) {
    j = {{"start", s.start}, {"end", s.end}, {"text", s.text}};
}

void from_json(const json& j, TranscriptSegment& s) {
    s.start = j.value("start", 0.0);
    s.end = j.value("end", 0.0);
    s.text = j.value("text", "");
}

void to_json(json& j, const TranscriptionResult& r) {
    j = {{"text", r.text}, {"segments", r.segments}, {"duration", r.duration}};
    if (r.language) j["language"] = *r.language;
}

void from_json(const json& j, TranscriptionResult& r) {
    r.text = j.value("text", "");
    r.segments = j.value("segments", std::vector<TranscriptSegment>{});
    r.language = optional_field<std::string>(j, "language");
    r.duration = j.value("duration", 0.0);
}

void to_json(json& j, const Job& job) {
    j = {
        {"id", job.id},
        {"created_at", job.created_at},
        {"filename", job.filename},
        {"audio_path", job.audio_path},
        {"status", std::string(to_string(job.status))},
        {"stage", job.stage},
        {"progress", job.progress},
    };
    if (job.source_path) j["source_path"] = *job.source_path;
    if (job.error) j["error"] = *job.error;
    if (job.result) j["result"] = *job.result;
    if (job.duration) j["duration"] = *job.duration;
    if (job.capture_pending) j["capture_pending"] = true;
}

void from_json(const json& j, Job& job) {
    job.id = j.at("id").get<std::string>();
    job.created_at = j.value("created_at", "");
    job.filename = j.value("filename", "");
    job.audio_path = j.value("audio_path", "");
    job.source_path = optional_field<std::string>(j, "source_path");

    auto status_str = j.at("status").get<std::string>();
    auto status = parse_status(status_str);
    if (!status) {
        throw std::invalid_argument("unknown job status: " + status_str);
    }
    job.status = *status;

    job.stage = j.value("stage", "");
    job.progress = j.value("progress", 0.0);
    job.error = optional_field<std::string>(j, "error");
    job.result = optional_field<TranscriptionResult>(j, "result");
    job.duration = optional_field<double>(j, "duration");
    job.capture_pending = j.value("capture_pending", false);
}
