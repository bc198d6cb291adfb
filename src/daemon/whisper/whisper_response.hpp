#pragma once

#include "whisper/backend.hpp"

#include <expected>
#include <string>

// Parses a Whisper "verbose_json" body (as returned by whisper.cpp's /inference and
// OpenAI's /v1/audio/transcriptions). Bodies without segments produce a single segment
// spanning `duration_hint`.
std::expected<TranscriptionResult, BackendFailure>
parse_verbose_json(const std::string& body, bool preserve_timestamps, double duration_hint);
