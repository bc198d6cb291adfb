#include "transcript_export.hpp"
#include "jobs/job_json.hpp"

#include <cmath>
#include <filesystem>
#include <format>
#include <nlohmann/json.hpp>

std::optional<ExportFormat> parse_export_format(std::string_view s) {
    if (s == "txt" || s == "text") return ExportFormat::Text;
    if (s == "json") return ExportFormat::Json;
    if (s == "srt") return ExportFormat::Srt;
    if (s == "vtt") return ExportFormat::Vtt;
    return std::nullopt;
}

std::string_view extension(ExportFormat f) {
    switch (f) {
        case ExportFormat::Text: return "txt";
        case ExportFormat::Json: return "json";
        case ExportFormat::Srt: return "srt";
        case ExportFormat::Vtt: return "vtt";
    }
    return "txt";
}

std::string format_timestamp(double seconds, char millis_separator) {
    auto total_ms = static_cast<long long>(std::llround(std::max(seconds, 0.0) * 1000.0));
    auto ms = total_ms % 1000;
    auto total_s = total_ms / 1000;
    return std::format("{:02}:{:02}:{:02}{}{:03}", total_s / 3600, (total_s % 3600) / 60,
                       total_s % 60, millis_separator, ms);
}

std::string render_transcript(const TranscriptionResult& result, ExportFormat format) {
    std::string out;
    switch (format) {
        case ExportFormat::Text:
            if (result.segments.empty()) return result.text;
            for (auto& seg : result.segments) {
                if (!out.empty()) out += ' ';
                out += seg.text;
            }
            return out;

        case ExportFormat::Json:
            return nlohmann::json(result).dump(2);

        case ExportFormat::Srt:
            for (size_t i = 0; i < result.segments.size(); ++i) {
                auto& seg = result.segments[i];
                out += std::format("{}\n{} --> {}\n{}\n\n", i + 1, format_timestamp(seg.start, ','),
                                   format_timestamp(seg.end, ','), seg.text);
            }
            return out;

        case ExportFormat::Vtt:
            out = "WEBVTT\n\n";
            for (auto& seg : result.segments) {
                out += std::format("{} --> {}\n{}\n\n", format_timestamp(seg.start, '.'),
                                   format_timestamp(seg.end, '.'), seg.text);
            }
            return out;
    }
    return out;
}

std::string export_filename(const Job& job, ExportFormat format) {
    auto stem = std::filesystem::path(job.filename).stem().string();
    if (stem.empty()) stem = "transcript";
    return std::format("{}.{}", stem, extension(format));
}
