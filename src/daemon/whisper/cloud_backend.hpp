#pragma once

#include "backend.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

enum class CloudProvider { OpenAI, Gemini };

struct CloudOptions {
    std::string api_key;
    std::string openai_url = "https://api.openai.com/v1/audio/transcriptions";
    std::string gemini_url = "https://generativelanguage.googleapis.com";
    // (api version, model) pairs tried in order while Gemini answers 404.
    std::vector<std::pair<std::string, std::string>> gemini_models = {
        {"v1", "models/gemini-1.5-flash-001"},
        {"v1", "models/gemini-1.5-flash"},
        {"v1beta", "models/gemini-1.5-flash-latest"},
        {"v1beta", "models/gemini-1.5-pro"},
        {"v1beta", "models/gemini-1.5-flash-002"},
    };
    int retry_attempts = 3;
    std::chrono::milliseconds retry_delay{200};
    long timeout_s = 300;
};

class CloudBackend : public TranscriptionBackend {
public:
    CloudBackend(CloudProvider provider, CloudOptions options);

    std::string_view name() const override;

    std::expected<TranscriptionResult, BackendFailure>
        transcribe(const TranscribeRequest& request, const ProgressCallback& progress,
                   std::stop_token stop) override;

private:
    std::expected<TranscriptionResult, BackendFailure>
        transcribe_openai(const TranscribeRequest& request, const ProgressCallback& progress,
                          std::stop_token stop);
    std::expected<TranscriptionResult, BackendFailure>
        transcribe_gemini(const TranscribeRequest& request, const ProgressCallback& progress,
                          std::stop_token stop);

    CloudProvider provider_;
    CloudOptions options_;
};
