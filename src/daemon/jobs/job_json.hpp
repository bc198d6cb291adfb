#pragma once

#include "job.hpp"

#include <nlohmann/json.hpp>

// Field names match the ledger file. Optional fields are written only when present and
// read back as absent when missing or null; unknown fields are ignored.
void to_json(nlohmann::json& j, const TranscriptSegment& s);
void from_json(const nlohmann::json& j, TranscriptSegment& s);

void to_json(nlohmann::json& j, const TranscriptionResult& r);
void from_json(const nlohmann::json& j, TranscriptionResult& r);

void to_json(nlohmann::json& j, const Job& job);
void from_json(const nlohmann::json& j, Job& job);
