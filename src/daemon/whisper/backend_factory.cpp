#include "backend_factory.hpp"
#include "whisper_server_backend.hpp"

HttpBackendFactory::HttpBackendFactory(ServerEndpoints endpoints, CloudOptions cloud_defaults)
    : endpoints_(std::move(endpoints)), cloud_defaults_(std::move(cloud_defaults)) {}

std::unique_ptr<TranscriptionBackend> HttpBackendFactory::create(Strategy strategy,
                                                                 const SelectorConfig& cfg) {
    switch (strategy) {
        case Strategy::Local:
            return std::make_unique<WhisperServerBackend>(
                "local", endpoints_.local_url, endpoints_.api_format, endpoints_.timeout_s);
        case Strategy::Fallback:
            return std::make_unique<WhisperServerBackend>(
                "fallback", endpoints_.fallback_url, endpoints_.api_format, endpoints_.timeout_s);
        case Strategy::CloudOpenAI: {
            auto opts = cloud_defaults_;
            opts.api_key = cfg.openai_api_key;
            return std::make_unique<CloudBackend>(CloudProvider::OpenAI, std::move(opts));
        }
        case Strategy::CloudGemini: {
            auto opts = cloud_defaults_;
            opts.api_key = cfg.gemini_api_key;
            return std::make_unique<CloudBackend>(CloudProvider::Gemini, std::move(opts));
        }
    }
    return nullptr;
}
