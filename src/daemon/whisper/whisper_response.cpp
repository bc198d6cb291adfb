#include "whisper_response.hpp"
#include "transcript_text.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::expected<TranscriptionResult, BackendFailure>
parse_verbose_json(const std::string& body, bool preserve_timestamps, double duration_hint) {
    try {
        auto j = json::parse(body);

        if (j.contains("error")) {
            auto& e = j["error"];
            std::string msg = e.is_string() ? e.get<std::string>()
                              : e.is_object() ? e.value("message", e.dump())
                                              : e.dump();
            return std::unexpected(BackendFailure{FailureKind::Backend, "server error: " + msg});
        }
        if (!j.contains("text") || !j["text"].is_string()) {
            return std::unexpected(
                BackendFailure{FailureKind::Backend, "unexpected response: " + body.substr(0, 200)});
        }

        TranscriptionResult r;
        r.text = trim(sanitize_transcript(j["text"].get<std::string>(), preserve_timestamps));
        if (j.contains("language") && j["language"].is_string()) {
            r.language = j["language"].get<std::string>();
        }
        r.duration = j.contains("duration") && j["duration"].is_number()
                         ? j["duration"].get<double>()
                         : duration_hint;

        if (j.contains("segments") && j["segments"].is_array()) {
            for (auto& s : j["segments"]) {
                auto text = trim(sanitize_transcript(s.value("text", ""), preserve_timestamps));
                if (text.empty()) continue;
                r.segments.push_back({
                    .start = s.value("start", 0.0),
                    .end = s.value("end", 0.0),
                    .text = std::move(text),
                });
            }
        }
        if (r.duration <= 0.0 && !r.segments.empty()) r.duration = r.segments.back().end;
        if (r.segments.empty() && !r.text.empty()) {
            r.segments.push_back({.start = 0.0, .end = r.duration, .text = r.text});
        }
        return r;
    } catch (const json::exception& e) {
        return std::unexpected(
            BackendFailure{FailureKind::Backend, std::string("JSON parse error: ") + e.what()});
    }
}
