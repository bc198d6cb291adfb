#include "transcript_text.hpp"

#include <algorithm>
#include <regex>
#include <sstream>

std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

std::string sanitize_transcript(const std::string& text, bool preserve_timestamps) {
    if (preserve_timestamps || text.empty()) return text;

    static const std::regex control_token(R"(<\|[^|>]*\|>)");
    static const std::regex leading_range(R"(^\s*\[[^\]]*\]\s*)");
    static const std::regex cue(R"(\([^)]*\))");
    static const std::regex spaces(R"(\s+)");

    auto cleaned = std::regex_replace(text, control_token, "");

    std::istringstream in(cleaned);
    std::string line;
    std::string joined;
    while (std::getline(in, line)) {
        line = std::regex_replace(line, leading_range, "");
        auto t = trim(line);
        if (t.size() >= 2 && t.front() == '(' && t.back() == ')') continue;
        t = trim(std::regex_replace(t, cue, ""));
        if (t.empty()) continue;
        if (!joined.empty()) joined += '\n';
        joined += t;
    }

    return trim(std::regex_replace(joined, spaces, " "));
}

std::string strip_markup(const std::string& text) {
    static const std::regex markup(R"(<[^>]+>)");
    return trim(std::regex_replace(text, markup, ""));
}

std::vector<TranscriptSegment> segments_from_text(const std::string& text, double duration) {
    std::vector<std::string> sentences;
    std::string current;
    for (char c : text) {
        if (c == '.' || c == '!' || c == '?') {
            auto t = trim(current);
            if (!t.empty()) sentences.push_back(std::move(t));
            current.clear();
        } else {
            current += c;
        }
    }
    if (auto t = trim(current); !t.empty()) sentences.push_back(std::move(t));

    if (sentences.empty()) {
        return {TranscriptSegment{.start = 0.0, .end = duration, .text = text}};
    }

    std::vector<TranscriptSegment> segments;
    double step = duration / static_cast<double>(sentences.size());
    for (size_t i = 0; i < sentences.size(); ++i) {
        double start = static_cast<double>(i) * step;
        segments.push_back({
            .start = start,
            .end = std::min(start + step, duration),
            .text = std::move(sentences[i]),
        });
    }
    return segments;
}
