#include "cloud_backend.hpp"
#include "http.hpp"
#include "transcript_text.hpp"
#include "whisper_response.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::expected<void, BackendFailure> check_input(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return std::unexpected(BackendFailure{
            FailureKind::Input, std::format("cannot read {}: {}", path, ec.message())});
    }
    if (size == 0) {
        return std::unexpected(BackendFailure{FailureKind::Input, "audio file is empty: " + path});
    }
    return {};
}

std::string mime_type_for(const std::string& path) {
    auto ext = fs::path(path).extension().string();
    if (ext == ".mp3") return "audio/mpeg";
    if (ext == ".m4a") return "audio/mp4";
    if (ext == ".flac") return "audio/flac";
    if (ext == ".ogg") return "audio/ogg";
    return "audio/wav";
}

} // namespace

CloudBackend::CloudBackend(CloudProvider provider, CloudOptions options)
    : provider_(provider), options_(std::move(options)) {}

std::string_view CloudBackend::name() const {
    return provider_ == CloudProvider::OpenAI ? "cloud-openai" : "cloud-gemini";
}

std::expected<TranscriptionResult, BackendFailure>
CloudBackend::transcribe(const TranscribeRequest& request, const ProgressCallback& progress,
                         std::stop_token stop) {
    if (options_.api_key.empty()) {
        return std::unexpected(BackendFailure{
            FailureKind::Backend, std::format("{}: missing API key", name())});
    }
    if (auto ok = check_input(request.audio_path); !ok) return std::unexpected(ok.error());

    return provider_ == CloudProvider::OpenAI ? transcribe_openai(request, progress, stop)
                                              : transcribe_gemini(request, progress, stop);
}

std::expected<TranscriptionResult, BackendFailure>
CloudBackend::transcribe_openai(const TranscribeRequest& request,
                                const ProgressCallback& progress, std::stop_token stop) {
    auto attempt = [&]() -> std::expected<HttpResponse, BackendFailure> {
        CurlRequest req;
        if (!req.valid()) {
            return std::unexpected(BackendFailure{FailureKind::Backend, "curl_easy_init failed"});
        }
        req.add_header("Authorization: Bearer " + options_.api_key);

        curl_mime* mime = curl_mime_init(req.handle());
        req.set_mime(mime);

        auto* part = curl_mime_addpart(mime);
        curl_mime_name(part, "file");
        curl_mime_filedata(part, request.audio_path.c_str());

        auto text_part = [mime](const char* name, const std::string& value) {
            auto* p = curl_mime_addpart(mime);
            curl_mime_name(p, name);
            curl_mime_data(p, value.c_str(), CURL_ZERO_TERMINATED);
        };
        text_part("model", "whisper-1");
        text_part("response_format", "verbose_json");
        text_part("temperature", std::format("{:.2f}", request.temperature));
        if (request.language) text_part("language", *request.language);

        req.set_timeout(options_.timeout_s);
        req.set_progress(&progress, 0.0, 0.6);
        return req.perform(options_.openai_url, stop);
    };

    auto resp = with_retry(attempt, options_.retry_attempts, options_.retry_delay, stop);
    if (!resp) return std::unexpected(resp.error());
    if (resp->status != 200) {
        return std::unexpected(BackendFailure{
            FailureKind::Backend,
            std::format("OpenAI returned HTTP {}: {}", resp->status,
                        error_message_from_body(resp->body))});
    }
    if (progress) progress(0.8);

    auto result = parse_verbose_json(resp->body, request.preserve_timestamps,
                                     request.duration_estimate.value_or(0.0));
    if (!result) return result;
    if (!result->language) result->language = request.language;
    if (progress) progress(1.0);
    return result;
}

std::expected<TranscriptionResult, BackendFailure>
CloudBackend::transcribe_gemini(const TranscribeRequest& request,
                                const ProgressCallback& progress, std::stop_token stop) {
    std::ifstream f(request.audio_path, std::ios::binary);
    if (!f) {
        return std::unexpected(
            BackendFailure{FailureKind::Input, "cannot open " + request.audio_path});
    }
    std::vector<uint8_t> audio((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (progress) progress(0.1);

    std::string prompt = request.translate
                             ? "Transcribe the provided audio and translate it to English. "
                               "Return plain text only."
                             : "Transcribe the provided audio. Return plain text only.";
    json inline_data = json::object();
    inline_data["mime_type"] = mime_type_for(request.audio_path);
    inline_data["data"] = base64_encode(audio);

    json parts = json::array();
    parts.push_back(json{{"text", prompt}});
    parts.push_back(json{{"inline_data", inline_data}});

    json content = json::object();
    content["parts"] = parts;

    json payload = json::object();
    payload["contents"] = json::array({content});
    auto body = payload.dump();
    audio.clear();

    std::expected<HttpResponse, BackendFailure> resp =
        std::unexpected(BackendFailure{FailureKind::Backend, "Gemini: no model configured"});

    for (auto& [version, model] : options_.gemini_models) {
        auto url = std::format("{}/{}/{}:generateContent?key={}", options_.gemini_url, version,
                               model, options_.api_key);
        auto attempt = [&]() -> std::expected<HttpResponse, BackendFailure> {
            CurlRequest req;
            if (!req.valid()) {
                return std::unexpected(
                    BackendFailure{FailureKind::Backend, "curl_easy_init failed"});
            }
            req.set_json_body(body);
            req.set_timeout(options_.timeout_s);
            req.set_progress(&progress, 0.1, 0.6);
            return req.perform(url, stop);
        };

        resp = with_retry(attempt, options_.retry_attempts, options_.retry_delay, stop);
        if (!resp) return std::unexpected(resp.error());
        if (resp->status != 404) break;
    }

    if (resp->status != 200) {
        return std::unexpected(BackendFailure{
            FailureKind::Backend,
            std::format("Gemini returned HTTP {}: {}", resp->status,
                        error_message_from_body(resp->body))});
    }
    if (progress) progress(0.8);

    json j = json::parse(resp->body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.contains("candidates") || !j["candidates"].is_array() ||
        j["candidates"].empty()) {
        return std::unexpected(BackendFailure{FailureKind::Backend, "Gemini: empty response"});
    }

    std::string text;
    auto& parts = j["candidates"][0]["content"]["parts"];
    if (parts.is_array()) {
        for (auto& p : parts) {
            if (!p.contains("text") || !p["text"].is_string()) continue;
            if (!text.empty()) text += ' ';
            text += p["text"].get<std::string>();
        }
    }
    text = trim(sanitize_transcript(text, request.preserve_timestamps));
    if (text.empty()) {
        return std::unexpected(BackendFailure{FailureKind::Backend, "Gemini: empty transcript"});
    }

    double duration = request.duration_estimate.value_or(0.0);
    TranscriptionResult r{
        .text = text,
        .segments = {{.start = 0.0, .end = duration, .text = text}},
        .language = request.language,
        .duration = duration,
    };
    if (progress) progress(1.0);
    return r;
}
