#pragma once

#include "backend.hpp"

#include <curl/curl.h>

#include <cstdint>
#include <span>
#include <string>

// A whisper.cpp server (or any OpenAI-compatible transcription server) reachable over HTTP.
class WhisperServerBackend : public TranscriptionBackend {
public:
    // api_format: "whisper.cpp" or "openai"
    WhisperServerBackend(std::string name, std::string url,
                         std::string api_format = "whisper.cpp", long timeout_s = 600);

    std::string_view name() const override { return name_; }

    std::expected<TranscriptionResult, BackendFailure>
        transcribe(const TranscribeRequest& request, const ProgressCallback& progress,
                   std::stop_token stop) override;

    // Transcribes an in-memory window of mono PCM. Used by the live engine.
    std::expected<TranscriptionResult, BackendFailure>
        transcribe_pcm(std::span<const int16_t> audio, uint32_t sample_rate,
                       std::stop_token stop);

    const std::string& url() const { return url_; }

private:
    std::string endpoint() const;
    void add_fields(curl_mime* mime, const TranscribeRequest& request) const;

    std::string name_;
    std::string url_;
    std::string api_format_;
    long timeout_s_;
};
