#pragma once

#include "jobs/job.hpp"

#include <optional>
#include <string>
#include <string_view>

enum class ExportFormat { Text, Json, Srt, Vtt };

std::optional<ExportFormat> parse_export_format(std::string_view s);
std::string_view extension(ExportFormat f);

// Renders a transcript in the given format. Text joins the segment texts; SRT and VTT
// emit one cue per segment.
std::string render_transcript(const TranscriptionResult& result, ExportFormat format);

// "<stem of filename>.<extension>"
std::string export_filename(const Job& job, ExportFormat format);

// HH:MM:SS,mmm (SRT) or HH:MM:SS.mmm (VTT).
std::string format_timestamp(double seconds, char millis_separator);
