#include "whisper_server_backend.hpp"
#include "http.hpp"
#include "whisper_response.hpp"
#include "../wav_encoder.hpp"

#include <filesystem>
#include <format>

namespace fs = std::filesystem;

namespace {

void add_text_part(curl_mime* mime, const char* name, const std::string& value) {
    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, name);
    curl_mime_data(part, value.c_str(), CURL_ZERO_TERMINATED);
}

} // namespace

WhisperServerBackend::WhisperServerBackend(std::string name, std::string url,
                                           std::string api_format, long timeout_s)
    : name_(std::move(name)), url_(std::move(url)), api_format_(std::move(api_format)),
      timeout_s_(timeout_s) {
    while (!url_.empty() && url_.back() == '/') url_.pop_back();
}

std::string WhisperServerBackend::endpoint() const {
    return api_format_ == "openai" ? url_ + "/v1/audio/transcriptions" : url_ + "/inference";
}

void WhisperServerBackend::add_fields(curl_mime* mime, const TranscribeRequest& request) const {
    add_text_part(mime, "response_format", "verbose_json");
    add_text_part(mime, "temperature", std::format("{:.2f}", request.temperature));

    if (api_format_ == "openai") {
        add_text_part(mime, "model", "whisper-1");
        if (request.language) add_text_part(mime, "language", *request.language);
    } else {
        add_text_part(mime, "language", request.language.value_or("auto"));
        if (request.translate) add_text_part(mime, "translate", "true");
    }
}

std::expected<TranscriptionResult, BackendFailure>
WhisperServerBackend::transcribe(const TranscribeRequest& request,
                                 const ProgressCallback& progress, std::stop_token stop) {
    std::error_code ec;
    auto size = fs::file_size(request.audio_path, ec);
    if (ec) {
        return std::unexpected(BackendFailure{
            FailureKind::Input, std::format("cannot read {}: {}", request.audio_path, ec.message())});
    }
    if (size == 0) {
        return std::unexpected(
            BackendFailure{FailureKind::Input, "audio file is empty: " + request.audio_path});
    }

    if (progress) progress(0.05);

    CurlRequest req;
    if (!req.valid()) {
        return std::unexpected(BackendFailure{FailureKind::Backend, "curl_easy_init failed"});
    }

    curl_mime* mime = curl_mime_init(req.handle());
    req.set_mime(mime);
    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_filedata(part, request.audio_path.c_str());
    add_fields(mime, request);

    req.set_timeout(timeout_s_);
    req.set_progress(&progress, 0.05, 0.9);

    auto resp = req.perform(endpoint(), stop);
    if (!resp) return std::unexpected(resp.error());
    if (resp->status < 200 || resp->status >= 300) {
        return std::unexpected(BackendFailure{
            FailureKind::Backend,
            std::format("{} returned HTTP {}: {}", name_, resp->status,
                        error_message_from_body(resp->body))});
    }

    auto result = parse_verbose_json(resp->body, request.preserve_timestamps,
                                     request.duration_estimate.value_or(0.0));
    if (result && progress) progress(1.0);
    return result;
}

std::expected<TranscriptionResult, BackendFailure>
WhisperServerBackend::transcribe_pcm(std::span<const int16_t> audio, uint32_t sample_rate,
                                     std::stop_token stop) {
    if (audio.empty()) {
        return std::unexpected(BackendFailure{FailureKind::Input, "empty audio"});
    }

    double duration_s = static_cast<double>(audio.size()) / sample_rate;
    auto wav_data = wav::encode(audio, sample_rate);

    CurlRequest req;
    if (!req.valid()) {
        return std::unexpected(BackendFailure{FailureKind::Backend, "curl_easy_init failed"});
    }

    curl_mime* mime = curl_mime_init(req.handle());
    req.set_mime(mime);
    auto* part = curl_mime_addpart(mime);
    curl_mime_name(part, "file");
    curl_mime_data(part, reinterpret_cast<const char*>(wav_data.data()), wav_data.size());
    curl_mime_filename(part, "audio.wav");
    curl_mime_type(part, "audio/wav");
    add_fields(mime, TranscribeRequest{});

    req.set_timeout(30);

    auto resp = req.perform(endpoint(), stop);
    if (!resp) return std::unexpected(resp.error());
    if (resp->status < 200 || resp->status >= 300) {
        return std::unexpected(BackendFailure{
            FailureKind::Backend,
            std::format("{} returned HTTP {}", name_, resp->status)});
    }
    return parse_verbose_json(resp->body, false, duration_s);
}
