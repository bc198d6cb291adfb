#include "backend_selector.hpp"

#include <algorithm>

std::string_view stage_name(Strategy s) {
    switch (s) {
        case Strategy::Local: return "local";
        case Strategy::CloudOpenAI: return "cloud-openai";
        case Strategy::CloudGemini: return "cloud-gemini";
        case Strategy::Fallback: return "fallback";
    }
    return "unknown";
}

std::string_view provider_name(Strategy s) {
    switch (s) {
        case Strategy::Local: return "Local";
        case Strategy::CloudOpenAI: return "OpenAI";
        case Strategy::CloudGemini: return "Gemini";
        case Strategy::Fallback: return "Fallback";
    }
    return "Unknown";
}

bool model_healthy(const SelectorConfig& cfg, const ModelCatalog& catalog,
                   const std::string& model_id) {
    if (model_id.empty() || !catalog.is_available(model_id)) return false;

    auto expected = cfg.model_checksums.find(model_id);
    if (expected == cfg.model_checksums.end() || expected->second.empty()) return true;

    auto actual = catalog.checksum(model_id);
    return actual && *actual == expected->second;
}

namespace {

std::optional<Strategy> usable_cloud(const SelectorConfig& cfg, const Connectivity& connectivity) {
    if (cfg.offline_mode || !cfg.cloud_enabled) return std::nullopt;

    std::optional<Strategy> cloud;
    if (cfg.cloud_provider == "openai" && !cfg.openai_api_key.empty()) {
        cloud = Strategy::CloudOpenAI;
    } else if (cfg.cloud_provider == "gemini" && !cfg.gemini_api_key.empty()) {
        cloud = Strategy::CloudGemini;
    }
    if (!cloud) return std::nullopt;

    if (!connectivity.has_active_connection()) return std::nullopt;
    return cloud;
}

} // namespace

std::vector<Strategy> select_strategies(const SelectorConfig& cfg,
                                        const Connectivity& connectivity,
                                        const ModelCatalog& catalog) {
    std::vector<Strategy> out;

    bool local_ok = model_healthy(cfg, catalog, cfg.selected_model);
    auto cloud = usable_cloud(cfg, connectivity);

    if (cloud && !local_ok) {
        out.push_back(*cloud);
    } else {
        if (local_ok) out.push_back(Strategy::Local);
        if (cloud && cfg.enable_cloud_fallback) out.push_back(*cloud);
    }

    bool fallback_redundant = cfg.fallback_model == cfg.selected_model &&
        std::ranges::find(out, Strategy::Local) != out.end();
    if (!fallback_redundant && model_healthy(cfg, catalog, cfg.fallback_model)) {
        out.push_back(Strategy::Fallback);
    }

    return out;
}

std::string_view to_string(LiveBackend b) {
    switch (b) {
        case LiveBackend::Server: return "server";
        case LiveBackend::WhisperTiny: return "whisper-tiny";
        case LiveBackend::WhisperBase: return "whisper-base";
    }
    return "unknown";
}

std::optional<LiveBackend> parse_live_backend(std::string_view s) {
    for (auto b : {LiveBackend::Server, LiveBackend::WhisperTiny, LiveBackend::WhisperBase}) {
        if (to_string(b) == s) return b;
    }
    return std::nullopt;
}

std::optional<std::string> required_model(LiveBackend b) {
    switch (b) {
        case LiveBackend::Server: return std::nullopt;
        case LiveBackend::WhisperTiny: return "ggml-tiny.en";
        case LiveBackend::WhisperBase: return "ggml-base.en";
    }
    return std::nullopt;
}

std::vector<LiveBackend> select_streaming(LiveBackend requested, const ModelCatalog& catalog) {
    auto usable = [&](LiveBackend b) {
        auto model = required_model(b);
        return !model || catalog.is_available(*model);
    };

    std::vector<LiveBackend> out;
    if (usable(requested)) out.push_back(requested);
    for (auto b : {LiveBackend::Server, LiveBackend::WhisperBase, LiveBackend::WhisperTiny}) {
        if (b != requested && usable(b)) out.push_back(b);
    }
    return out;
}
