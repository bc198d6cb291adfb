#pragma once

#include "jobs/backend_selector.hpp"

#include <cstdint>
#include <map>
#include <string>

struct Config {
    struct Transcription {
        std::string selected_model = "ggml-base.en";
        std::string fallback_model = "ggml-tiny.en";
        bool offline_mode = false;
        bool cloud_enabled = false;
        std::string cloud_provider = "openai"; // "openai" or "gemini"
        std::string openai_api_key;
        std::string gemini_api_key;
        bool enable_cloud_fallback = false;
        std::string language; // empty: auto-detect
        bool translate = false;
        double temperature = 0.0;
        bool preserve_timestamps = false;
        std::map<std::string, std::string> model_checksums;
    } transcription;

    struct LocalServer {
        std::string url = "http://127.0.0.1:8080";
        std::string fallback_url = "http://127.0.0.1:8081";
        std::string api_format = "whisper.cpp"; // "whisper.cpp" or "openai"
        long timeout = 600;
    } local_server;

    struct Cloud {
        std::string openai_url = "https://api.openai.com/v1/audio/transcriptions";
        std::string gemini_url = "https://generativelanguage.googleapis.com";
        int retry_attempts = 3;
        int retry_delay_ms = 200;
        long timeout = 300;
    } cloud;

    struct Jobs {
        int max_concurrent = 1;
        int cancel_grace_ms = 2000;
        bool auto_run = true;
    } jobs;

    struct Live {
        std::string backend = "server";
        double window_seconds = 12.0;
        double hop_seconds = 3.0;
        int save_interval_ms = 1500;
        // whisper.cpp servers running the tiny / base models.
        std::string tiny_url = "http://127.0.0.1:8082";
        std::string base_url = "http://127.0.0.1:8083";
    } live;

    struct Audio {
        uint32_t sample_rate = 16000;
        uint32_t max_seconds = 600;

        // Computed from max_seconds and sample_rate (no independent config key).
        size_t ring_buffer_bytes() const {
            return static_cast<size_t>(max_seconds) * sample_rate * sizeof(int16_t);
        }
    } audio;

    struct Paths {
        // Empty: the platform data directory, and models/ and recordings/ below it.
        std::string data_dir;
        std::string models_dir;
        std::string recordings_dir;
    } paths;

    SelectorConfig selector() const;

    // Fills unset API keys from OPENAI_API_KEY / GEMINI_API_KEY and unset paths from
    // the platform data directory.
    void apply_environment();

    static Config load(const std::string& path);
    // <config_dir>/config.json
    static Config load_default();
};
