#pragma once

#include "jobs/job.hpp"

#include <string>
#include <string_view>
#include <vector>

std::string trim(std::string_view s);

// Removes Whisper control tokens (<|...|>), inline timestamps, leading "[a - b]" ranges
// and parenthetical non-speech cues, then collapses whitespace. Returns `text` unchanged
// when `preserve_timestamps` is set.
std::string sanitize_transcript(const std::string& text, bool preserve_timestamps);

// Drops anything in angle brackets; used on streaming hypotheses.
std::string strip_markup(const std::string& text);

// Splits on sentence punctuation and spreads `duration` evenly across the sentences.
// Falls back to one segment covering everything.
std::vector<TranscriptSegment> segments_from_text(const std::string& text, double duration);
