#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read(const json& obj, const char* key, T& out) {
    if (obj.contains(key) && !obj[key].is_null()) out = obj[key].get<T>();
}

} // namespace

SelectorConfig Config::selector() const {
    return SelectorConfig{
        .offline_mode = transcription.offline_mode,
        .cloud_enabled = transcription.cloud_enabled,
        .cloud_provider = transcription.cloud_provider,
        .openai_api_key = transcription.openai_api_key,
        .gemini_api_key = transcription.gemini_api_key,
        .enable_cloud_fallback = transcription.enable_cloud_fallback,
        .selected_model = transcription.selected_model,
        .fallback_model = transcription.fallback_model,
        .model_checksums = transcription.model_checksums,
    };
}

Config Config::load(const std::string& path) {
    Config cfg;
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return cfg;
    }

    try {
        auto j = json::parse(f);

        if (j.contains("transcription")) {
            auto& t = j["transcription"];
            read(t, "selected_model", cfg.transcription.selected_model);
            read(t, "fallback_model", cfg.transcription.fallback_model);
            read(t, "offline_mode", cfg.transcription.offline_mode);
            read(t, "cloud_enabled", cfg.transcription.cloud_enabled);
            read(t, "cloud_provider", cfg.transcription.cloud_provider);
            read(t, "openai_api_key", cfg.transcription.openai_api_key);
            read(t, "gemini_api_key", cfg.transcription.gemini_api_key);
            read(t, "enable_cloud_fallback", cfg.transcription.enable_cloud_fallback);
            read(t, "language", cfg.transcription.language);
            read(t, "translate", cfg.transcription.translate);
            read(t, "temperature", cfg.transcription.temperature);
            read(t, "preserve_timestamps", cfg.transcription.preserve_timestamps);
            read(t, "model_checksums", cfg.transcription.model_checksums);
        }

        if (j.contains("local_server")) {
            auto& s = j["local_server"];
            read(s, "url", cfg.local_server.url);
            read(s, "fallback_url", cfg.local_server.fallback_url);
            read(s, "api_format", cfg.local_server.api_format);
            read(s, "timeout", cfg.local_server.timeout);
        }

        if (j.contains("cloud")) {
            auto& c = j["cloud"];
            read(c, "openai_url", cfg.cloud.openai_url);
            read(c, "gemini_url", cfg.cloud.gemini_url);
            read(c, "retry_attempts", cfg.cloud.retry_attempts);
            read(c, "retry_delay_ms", cfg.cloud.retry_delay_ms);
            read(c, "timeout", cfg.cloud.timeout);
        }

        if (j.contains("jobs")) {
            auto& jb = j["jobs"];
            read(jb, "max_concurrent", cfg.jobs.max_concurrent);
            read(jb, "cancel_grace_ms", cfg.jobs.cancel_grace_ms);
            read(jb, "auto_run", cfg.jobs.auto_run);
        }

        if (j.contains("live")) {
            auto& l = j["live"];
            read(l, "backend", cfg.live.backend);
            read(l, "window_seconds", cfg.live.window_seconds);
            read(l, "hop_seconds", cfg.live.hop_seconds);
            read(l, "save_interval_ms", cfg.live.save_interval_ms);
            read(l, "tiny_url", cfg.live.tiny_url);
            read(l, "base_url", cfg.live.base_url);
        }

        if (j.contains("audio")) {
            auto& a = j["audio"];
            read(a, "sample_rate", cfg.audio.sample_rate);
            read(a, "max_seconds", cfg.audio.max_seconds);
        }

        if (j.contains("paths")) {
            auto& p = j["paths"];
            read(p, "data_dir", cfg.paths.data_dir);
            read(p, "models_dir", cfg.paths.models_dir);
            read(p, "recordings_dir", cfg.paths.recordings_dir);
        }

    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }

    if (!parse_live_backend(cfg.live.backend)) {
        std::println(stderr, "config: unknown live backend '{}', using server", cfg.live.backend);
        cfg.live.backend = "server";
    }
    if (cfg.transcription.cloud_provider != "openai" &&
        cfg.transcription.cloud_provider != "gemini") {
        std::println(stderr, "config: unknown cloud provider '{}', using openai",
                     cfg.transcription.cloud_provider);
        cfg.transcription.cloud_provider = "openai";
    }

    return cfg;
}

void Config::apply_environment() {
    if (transcription.openai_api_key.empty()) {
        if (const char* key = std::getenv("OPENAI_API_KEY")) transcription.openai_api_key = key;
    }
    if (transcription.gemini_api_key.empty()) {
        if (const char* key = std::getenv("GEMINI_API_KEY")) transcription.gemini_api_key = key;
    }

    if (paths.data_dir.empty()) paths.data_dir = platform::data_dir();
    if (paths.data_dir.empty()) paths.data_dir = "/tmp/whisper-control";
    auto data = fs::path(paths.data_dir);
    if (paths.models_dir.empty()) paths.models_dir = (data / "models").string();
    if (paths.recordings_dir.empty()) {
        paths.recordings_dir = (data / "recordings").string();
    }
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
