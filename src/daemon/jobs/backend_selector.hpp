#pragma once

#include "platform/connectivity.hpp"
#include "storage/model_catalog.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// One way of executing a file transcription.
enum class Strategy { Local, CloudOpenAI, CloudGemini, Fallback };

// Label written to Job::stage while a strategy is running.
std::string_view stage_name(Strategy s);
std::string_view provider_name(Strategy s);

// Snapshot of the settings the selector reads. Taken once per job (or retry).
struct SelectorConfig {
    bool offline_mode = false;
    bool cloud_enabled = false;
    std::string cloud_provider = "openai"; // "openai" or "gemini"
    std::string openai_api_key;
    std::string gemini_api_key;
    bool enable_cloud_fallback = false;
    std::string selected_model;
    std::string fallback_model;
    // Expected checksums per model id; a model without an entry is not checked.
    std::map<std::string, std::string> model_checksums;
};

bool model_healthy(const SelectorConfig& cfg, const ModelCatalog& catalog,
                   const std::string& model_id);

// Ordered candidates for one job. Never includes a strategy that cannot run with the
// given inputs; empty when no backend is usable. Same inputs, same order.
std::vector<Strategy> select_strategies(const SelectorConfig& cfg,
                                        const Connectivity& connectivity,
                                        const ModelCatalog& catalog);

// Streaming-capable engines for live sessions.
enum class LiveBackend { Server, WhisperTiny, WhisperBase };

std::string_view to_string(LiveBackend b);
std::optional<LiveBackend> parse_live_backend(std::string_view s);
std::optional<std::string> required_model(LiveBackend b);

// The requested engine first when usable, then the other usable engines in a fixed
// order (Server, WhisperBase, WhisperTiny).
std::vector<LiveBackend> select_streaming(LiveBackend requested, const ModelCatalog& catalog);
