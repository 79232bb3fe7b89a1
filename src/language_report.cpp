#include "huginn/language_report.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace huginn {

namespace {

const std::map<std::string, std::string>& language_names() {
    static const std::map<std::string, std::string> names = {
        {"en", "English"},    {"es", "Spanish"},    {"fr", "French"},
        {"de", "German"},     {"it", "Italian"},    {"pt", "Portuguese"},
        {"pl", "Polish"},     {"nl", "Dutch"},      {"ru", "Russian"},
        {"zh", "Chinese"},    {"ja", "Japanese"},   {"ko", "Korean"},
        {"ar", "Arabic"},     {"he", "Hebrew"},     {"th", "Thai"},
        {"vi", "Vietnamese"}, {"tr", "Turkish"},    {"cs", "Czech"},
        {"ro", "Romanian"},   {"sv", "Swedish"},    {"da", "Danish"},
        {"no", "Norwegian"},  {"fi", "Finnish"},    {"el", "Greek"},
        {"hi", "Hindi"},      {"id", "Indonesian"}, {"uk", "Ukrainian"},
        {UNKNOWN_LANGUAGE, "Unknown"}
    };
    return names;
}

std::string to_upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

std::string trim(const std::string& text) {
    const char* ws = " \t\n\r";
    size_t first = text.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

std::string escape_json_string(const std::string& str) {
    std::string escaped;
    escaped.reserve(str.size());

    for (char c : str) {
        switch (c) {
            case '"':  escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\b': escaped += "\\b"; break;
            case '\f': escaped += "\\f"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    char buf[8];
                    snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    escaped += buf;
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

void write_stats_json(std::ostream& json,
                      const std::vector<LanguageSegment>& segments,
                      const std::string& indent)
{
    auto stats = calculate_language_stats(segments);

    json << indent << "\"total_count\": " << segments.size() << ",\n";
    json << indent << "\"languages_detected\": [";
    for (size_t i = 0; i < stats.size(); ++i) {
        json << (i ? ", " : "") << "\"" << escape_json_string(stats[i].language) << "\"";
    }
    json << "],\n";
    json << indent << "\"language_breakdown\": {";
    for (size_t i = 0; i < stats.size(); ++i) {
        const auto& s = stats[i];
        json << (i ? "," : "") << "\n";
        json << indent << "  \"" << escape_json_string(s.language) << "\": {\n";
        json << indent << "    \"language_name\": \"" << escape_json_string(s.language_name) << "\",\n";
        json << indent << "    \"segment_count\": " << s.segment_count << ",\n";
        json << indent << "    \"total_duration_seconds\": " << s.total_duration << ",\n";
        json << indent << "    \"percentage_by_count\": " << s.percentage_by_count << ",\n";
        json << indent << "    \"percentage_by_duration\": " << s.percentage_by_duration << "\n";
        json << indent << "  }";
    }
    json << (stats.empty() ? "}" : "\n" + indent + "}");
}

void write_spans_json(std::ostream& json,
                      const std::vector<LanguageSegment>& segments,
                      const std::string& indent)
{
    json << "[";
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        json << (i ? "," : "") << "\n";
        json << indent << "  {\"language\": \"" << escape_json_string(seg.language) << "\", "
             << "\"start\": " << seg.start << ", "
             << "\"end\": " << seg.end << ", "
             << "\"text\": \"" << escape_json_string(seg.text) << "\"}";
    }
    json << (segments.empty() ? "]" : "\n" + indent + "]");
}

} // anonymous namespace

std::string truncate_utf8(const std::string& text, size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return text;
    }

    // Back off continuation bytes (10xxxxxx) so a multi-byte sequence is never split
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        cut--;
    }
    return text.substr(0, cut);
}

std::string language_name(const std::string& code) {
    const auto& names = language_names();
    auto it = names.find(code);
    return it != names.end() ? it->second : to_upper(code);
}

std::string format_timestamp_readable(float seconds) {
    if (seconds < 0.0f) seconds = 0.0f;
    int total = static_cast<int>(seconds);
    int minutes = total / 60;
    int secs = total % 60;

    char buf[32];
    snprintf(buf, sizeof(buf), "%02d:%02d", minutes, secs);
    return buf;
}

std::string create_language_timeline(const std::vector<LanguageSegment>& segments) {
    std::ostringstream timeline;
    for (size_t i = 0; i < segments.size(); ++i) {
        const auto& seg = segments[i];
        if (i > 0) timeline << "\n";
        timeline << "[" << format_timestamp_readable(seg.start) << " - "
                 << format_timestamp_readable(seg.end) << "] Language: "
                 << language_name(seg.language) << " (" << to_upper(seg.language) << ")";
    }
    return timeline.str();
}

std::vector<LanguageStats> calculate_language_stats(const std::vector<LanguageSegment>& segments) {
    std::vector<LanguageStats> stats;
    if (segments.empty()) {
        return stats;
    }

    float total_duration = 0.0f;
    for (const auto& seg : segments) {
        float duration = seg.end - seg.start;
        total_duration += duration;

        auto it = std::find_if(stats.begin(), stats.end(),
                               [&](const LanguageStats& s) { return s.language == seg.language; });
        if (it == stats.end()) {
            LanguageStats entry;
            entry.language = seg.language;
            entry.language_name = language_name(seg.language);
            stats.push_back(entry);
            it = stats.end() - 1;
        }
        it->segment_count++;
        it->total_duration += duration;
    }

    const float total_segments = static_cast<float>(segments.size());
    for (auto& s : stats) {
        s.percentage_by_count = 100.0f * s.segment_count / total_segments;
        if (total_duration > 0.0f) {
            s.percentage_by_duration = 100.0f * s.total_duration / total_duration;
        }
    }
    return stats;
}

void log_segment_diagnostics(const std::vector<LanguageSegment>& segments, const std::string& stage) {
    const std::string tag = "[Huginn] [DIAGNOSTIC " + stage + "] ";

    if (segments.empty()) {
        std::cout << tag << "No segments\n";
        return;
    }

    auto stats = calculate_language_stats(segments);

    std::cout << tag << "Total segments: " << segments.size() << "\n";
    std::cout << tag << "Languages detected:";
    for (const auto& s : stats) {
        std::cout << " " << s.language;
    }
    std::cout << "\n";

    // Most frequent first; stable keeps first-appearance order for ties
    std::stable_sort(stats.begin(), stats.end(),
                     [](const LanguageStats& a, const LanguageStats& b) {
                         return a.segment_count > b.segment_count;
                     });
    for (const auto& s : stats) {
        std::ostringstream line;
        line << std::fixed << std::setprecision(1) << s.percentage_by_count;
        std::cout << tag << "  " << s.language_name << " (" << s.language << "): "
                  << s.segment_count << " segments (" << line.str() << "%)\n";
    }

    std::cout << tag << "First 5 segments:\n";
    for (size_t i = 0; i < segments.size() && i < 5; ++i) {
        const auto& seg = segments[i];
        std::string preview = truncate_utf8(seg.text, 60);
        std::replace(preview.begin(), preview.end(), '\n', ' ');
        std::cout << tag << "  [" << format_timestamp_readable(seg.start) << "-"
                  << format_timestamp_readable(seg.end) << "] " << seg.language << ": "
                  << preview << "...\n";
    }
}

std::string format_multilang_report(const MultilangResult& result) {
    const std::string rule(60, '=');
    std::ostringstream report;

    report << rule << "\n";
    report << "MULTI-LANGUAGE TRANSCRIPTION REPORT\n";
    report << rule << "\n\n";

    std::string primary = result.classification.primary_language.value_or(
        result.transcription.language.empty() ? UNKNOWN_LANGUAGE : result.transcription.language);
    report << "Primary Language: " << to_upper(primary) << "\n";
    report << "Language Mode: " << to_string(result.classification.mode) << "\n";
    if (!result.classification.secondary_languages.empty()) {
        report << "Secondary Languages:";
        for (const auto& lang : result.classification.secondary_languages) {
            report << " " << to_upper(lang);
        }
        report << "\n";
    }
    if (result.classification.transition_time) {
        report << "Transition: " << format_timestamp_readable(*result.classification.transition_time) << "\n";
    }
    report << "\n";

    report << "Language Segments Detected: " << result.language_segments.size() << "\n\n";
    for (size_t i = 0; i < result.language_segments.size(); ++i) {
        const auto& seg = result.language_segments[i];
        report << "Segment " << (i + 1) << ": " << to_upper(seg.language) << " ["
               << format_timestamp_readable(seg.start) << " - "
               << format_timestamp_readable(seg.end) << "]\n";
        report << "  " << truncate_utf8(seg.text, 100) << "...\n\n";
    }

    if (!result.timeline.empty()) {
        report << "Language Timeline:\n";
        report << std::string(60, '-') << "\n";
        report << result.timeline << "\n\n";
    }

    if (result.cancelled) {
        report << "(cancelled before all segments were processed)\n\n";
    }

    report << rule;
    return report.str();
}

std::string save_diagnostics_json(const MultilangResult& result,
                                  const std::string& audio_path,
                                  const std::vector<LanguageSegment>& raw_segments,
                                  const std::string& diagnostics_dir)
{
    std::error_code ec;
    fs::create_directories(diagnostics_dir, ec);
    if (ec) {
        throw std::runtime_error("Failed to create diagnostics directory " + diagnostics_dir +
                                 ": " + ec.message());
    }

    fs::path diag_file = fs::path(diagnostics_dir) /
                         (fs::path(audio_path).stem().string() + "_diagnostics.json");

    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local_tm{};
#ifdef _WIN32
    localtime_s(&local_tm, &now);
#else
    localtime_r(&now, &local_tm);
#endif
    char timestamp[32];
    std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &local_tm);

    const auto& pass1 = result.transcription;
    const auto& merged = result.language_segments;

    std::ostringstream json;
    json << "{\n";
    json << "  \"audio_file\": \"" << escape_json_string(audio_path) << "\",\n";
    json << "  \"timestamp\": \"" << timestamp << "\",\n";
    json << "  \"pass1_info\": {\n";
    json << "    \"detected_language\": \""
         << escape_json_string(pass1.language.empty() ? UNKNOWN_LANGUAGE : pass1.language) << "\",\n";
    json << "    \"total_segments\": " << pass1.segments.size() << ",\n";
    json << "    \"segments_sample\": [";
    for (size_t i = 0; i < pass1.segments.size() && i < 5; ++i) {
        const auto& seg = pass1.segments[i];
        std::string text = truncate_utf8(seg.text, 100);
        json << (i ? "," : "") << "\n";
        json << "      {\"start\": " << seg.start << ", \"end\": " << seg.end
             << ", \"text\": \"" << escape_json_string(text) << "\"}";
    }
    json << (pass1.segments.empty() ? "]\n" : "\n    ]\n");
    json << "  },\n";
    json << "  \"statistics\": {\n";
    json << "    \"raw_segments\": {\n";
    write_stats_json(json, raw_segments, "      ");
    json << "\n    },\n";
    json << "    \"merged_segments\": {\n";
    write_stats_json(json, merged, "      ");
    json << ",\n";
    json << "      \"segments_merged\": "
         << static_cast<long>(raw_segments.size()) - static_cast<long>(merged.size()) << "\n";
    json << "    }\n";
    json << "  },\n";
    json << "  \"raw_segments\": ";
    write_spans_json(json, raw_segments, "  ");
    json << ",\n";
    json << "  \"merged_segments\": ";
    write_spans_json(json, merged, "  ");
    json << "\n}\n";

    std::ofstream out(diag_file, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open diagnostics file: " + diag_file.string());
    }
    out << json.str();
    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write diagnostics file: " + diag_file.string());
    }

    std::cout << "[Huginn] [DIAGNOSTIC] Saved detailed diagnostics to: " << diag_file.string() << "\n";
    return diag_file.string();
}

float calculate_quality_score(const std::vector<Segment>& segments) {
    if (segments.empty()) {
        return 0.0f;
    }

    float total_confidence = 0.0f;
    for (const auto& seg : segments) {
        float confidence = 1.0f - seg.no_speech_prob;
        if (seg.end - seg.start < 0.5f && trim(seg.text).size() < 3) {
            confidence *= 0.5f;
        }
        total_confidence += confidence;
    }

    return total_confidence / static_cast<float>(segments.size());
}

} // namespace huginn
