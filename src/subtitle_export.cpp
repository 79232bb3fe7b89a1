#include "huginn/subtitle_export.h"
#include "huginn/language_report.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace huginn {

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\n\r";
    size_t first = text.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

std::string format_timestamp(float seconds, char millis_separator) {
    long total_ms = std::lround(std::max(0.0f, seconds) * 1000.0f);
    long hours = total_ms / 3600000;
    long minutes = (total_ms / 60000) % 60;
    long secs = (total_ms / 1000) % 60;
    long millis = total_ms % 1000;

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(2) << hours << ":"
        << std::setw(2) << minutes << ":"
        << std::setw(2) << secs << millis_separator
        << std::setw(3) << millis;
    return oss.str();
}

void replace_all(std::string& text, const std::string& placeholder, const std::string& value) {
    size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.size(), value);
        pos += value.size();
    }
}

// Joins same-language neighbours separated by less than the threshold
std::vector<LanguageSegment> join_close_spans(const std::vector<LanguageSegment>& segments,
                                              float gap_threshold) {
    std::vector<LanguageSegment> joined;
    for (const auto& seg : segments) {
        if (!joined.empty() && gap_threshold > 0.0f) {
            auto& last = joined.back();
            if (last.language == seg.language && seg.start - last.end < gap_threshold) {
                last.end = std::max(last.end, seg.end);
                last.text = trim(last.text + " " + seg.text);
                continue;
            }
        }
        joined.push_back(seg);
    }
    return joined;
}

std::ofstream open_output(const std::string& output_path, const char* kind) {
    std::ofstream file(output_path);
    if (!file.is_open()) {
        throw std::runtime_error(std::string("Failed to create ") + kind + " file: " + output_path);
    }
    return file;
}

void close_output(std::ofstream& file, const std::string& output_path) {
    file.close();
    if (!file) {
        throw std::runtime_error("Failed to write " + output_path);
    }
}

} // anonymous namespace

// ═══════════════════════════════════════════════════════════
// High-level Export
// ═══════════════════════════════════════════════════════════

std::string SubtitleExporter::export_subtitles(const std::vector<LanguageSegment>& segments,
                                               const std::string& media_path,
                                               const SubtitleExportOptions& options) {
    switch (options.format) {
        case SubtitleFormat::SRT:
            return export_srt(segments, media_path, options);
        case SubtitleFormat::VTT:
            return export_vtt(segments, media_path, options);
        case SubtitleFormat::Text:
            return export_text(segments, media_path, options);
    }
    throw std::runtime_error("Unsupported subtitle format");
}

std::string SubtitleExporter::export_subtitles(const std::vector<Segment>& segments,
                                               const std::string& media_path,
                                               const SubtitleExportOptions& options) {
    return export_subtitles(to_language_segments(segments), media_path, options);
}

std::string SubtitleExporter::export_srt(const std::vector<LanguageSegment>& segments,
                                         const std::string& media_path,
                                         const SubtitleExportOptions& options) {
    std::string output_path = options.output_path.empty() ?
        generate_output_path(media_path, SubtitleFormat::SRT) :
        options.output_path;

    auto entries = segments_to_entries(segments, options);

    auto file = open_output(output_path, "SRT");
    for (const auto& entry : entries) {
        file << format_srt_entry(entry);
        file << "\n";  // Blank line between entries
    }
    close_output(file, output_path);

    return output_path;
}

std::string SubtitleExporter::export_vtt(const std::vector<LanguageSegment>& segments,
                                         const std::string& media_path,
                                         const SubtitleExportOptions& options) {
    std::string output_path = options.output_path.empty() ?
        generate_output_path(media_path, SubtitleFormat::VTT) :
        options.output_path;

    auto entries = segments_to_entries(segments, options);

    auto file = open_output(output_path, "VTT");
    file << "WEBVTT\n\n";
    for (const auto& entry : entries) {
        file << format_vtt_entry(entry, options);
        file << "\n";  // Blank line between cues
    }
    close_output(file, output_path);

    return output_path;
}

std::string SubtitleExporter::export_text(const std::vector<LanguageSegment>& segments,
                                          const std::string& media_path,
                                          const SubtitleExportOptions& options) {
    std::string output_path = options.output_path.empty() ?
        generate_output_path(media_path, SubtitleFormat::Text) :
        options.output_path;

    auto file = open_output(output_path, "text");
    file << format_text(segments, options);
    close_output(file, output_path);

    return output_path;
}

// ═══════════════════════════════════════════════════════════
// Segment Conversion
// ═══════════════════════════════════════════════════════════

std::vector<SubtitleEntry> SubtitleExporter::segments_to_entries(
    const std::vector<LanguageSegment>& segments,
    const SubtitleExportOptions& options) {

    std::vector<SubtitleEntry> entries;
    const size_t lines_per_cue = static_cast<size_t>(std::max(1, options.max_lines));

    for (const auto& seg : join_close_spans(segments, options.gap_threshold)) {
        std::string text = trim(seg.text);
        if (text.empty()) {
            continue;
        }

        // Group wrapped lines into cue texts
        std::vector<std::string> cue_texts;
        if (options.auto_split_long_text) {
            auto lines = wrap_lines(text, options.max_chars_per_line);
            for (size_t i = 0; i < lines.size(); i += lines_per_cue) {
                std::string cue;
                for (size_t j = i; j < std::min(lines.size(), i + lines_per_cue); ++j) {
                    if (!cue.empty()) cue += "\n";
                    cue += lines[j];
                }
                cue_texts.push_back(cue);
            }
        } else {
            cue_texts.push_back(text);
        }

        size_t total_chars = 0;
        for (const auto& cue : cue_texts) {
            total_chars += cue.size();
        }

        const float span_duration = std::max(0.0f, seg.end - seg.start);
        float cursor = seg.start;
        for (size_t i = 0; i < cue_texts.size(); ++i) {
            SubtitleEntry entry;
            entry.index = static_cast<int>(entries.size()) + 1;
            entry.language = seg.language;
            entry.start = cursor;
            entry.end = (i + 1 == cue_texts.size())
                ? seg.end
                : cursor + span_duration * static_cast<float>(cue_texts[i].size()) /
                           static_cast<float>(total_chars);
            cursor = entry.end;

            entry.text = options.include_language
                ? apply_language_format(options.language_format, seg.language, cue_texts[i])
                : cue_texts[i];

            float duration = entry.end - entry.start;
            if (duration < options.min_duration) {
                entry.end = entry.start + options.min_duration;
            }
            if (duration > options.max_duration) {
                entry.end = entry.start + options.max_duration;
            }

            entries.push_back(entry);
        }
    }

    // A stretched cue must not run into the next one
    for (size_t i = 0; i + 1 < entries.size(); ++i) {
        const float next_start = entries[i + 1].start;
        if (next_start > entries[i].start && entries[i].end > next_start) {
            entries[i].end = next_start;
        }
    }

    return entries;
}

// ═══════════════════════════════════════════════════════════
// SRT / VTT / Text Formatting
// ═══════════════════════════════════════════════════════════

std::string SubtitleExporter::format_srt_entry(const SubtitleEntry& entry) {
    std::ostringstream oss;
    oss << entry.index << "\n";
    oss << format_srt_timestamp(entry.start) << " --> "
        << format_srt_timestamp(entry.end) << "\n";
    oss << entry.text << "\n";
    return oss.str();
}

std::string SubtitleExporter::format_srt_timestamp(float seconds) {
    return format_timestamp(seconds, ',');
}

std::string SubtitleExporter::format_vtt_entry(const SubtitleEntry& entry,
                                               const SubtitleExportOptions& options) {
    std::ostringstream oss;
    oss << entry.index << "\n";
    oss << format_vtt_timestamp(entry.start) << " --> "
        << format_vtt_timestamp(entry.end) << "\n";

    if (options.vtt_lang_spans && !entry.language.empty() && entry.language != UNKNOWN_LANGUAGE) {
        oss << "<lang " << entry.language << ">" << entry.text << "</lang>\n";
    } else {
        oss << entry.text << "\n";
    }

    return oss.str();
}

std::string SubtitleExporter::format_vtt_timestamp(float seconds) {
    return format_timestamp(seconds, '.');
}

std::string SubtitleExporter::format_text(const std::vector<LanguageSegment>& segments,
                                          const SubtitleExportOptions& options) {
    std::ostringstream oss;
    for (const auto& seg : join_close_spans(segments, options.gap_threshold)) {
        std::string text = trim(seg.text);
        if (text.empty()) {
            continue;
        }
        if (options.text_include_timestamps) {
            oss << "[" << format_timestamp_readable(seg.start) << " - "
                << format_timestamp_readable(seg.end) << "] ";
        }
        oss << (options.include_language
                    ? apply_language_format(options.language_format, seg.language, text)
                    : text)
            << "\n";
    }
    return oss.str();
}

// ═══════════════════════════════════════════════════════════
// Utilities
// ═══════════════════════════════════════════════════════════

std::string SubtitleExporter::generate_output_path(const std::string& media_path,
                                                   SubtitleFormat format) {
    std::filesystem::path media(media_path);
    std::filesystem::path output = media.parent_path();

    std::string stem = media.stem().string();

    switch (format) {
        case SubtitleFormat::SRT:
            output /= stem + ".srt";
            break;
        case SubtitleFormat::VTT:
            output /= stem + ".vtt";
            break;
        case SubtitleFormat::Text:
            output /= stem + ".txt";
            break;
    }

    return output.string();
}

std::vector<std::string> SubtitleExporter::wrap_lines(const std::string& text,
                                                      int max_chars_per_line) {
    std::vector<std::string> lines;
    std::string current_line;
    std::istringstream words(text);
    std::string word;
    const size_t limit = static_cast<size_t>(std::max(1, max_chars_per_line));

    while (words >> word) {
        if (current_line.empty()) {
            current_line = word;
        } else if (current_line.length() + word.length() + 1 <= limit) {
            current_line += " " + word;
        } else {
            lines.push_back(current_line);
            current_line = word;
        }
    }

    if (!current_line.empty()) {
        lines.push_back(current_line);
    }

    return lines;
}

std::string SubtitleExporter::apply_language_format(const std::string& format_string,
                                                    const std::string& language,
                                                    const std::string& text) {
    std::string code = language;
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::string result = format_string;
    replace_all(result, "{code}", code);
    replace_all(result, "{name}", language_name(language));

    // {text} last so placeholders inside the transcript stay untouched
    size_t pos = result.find("{text}");
    if (pos != std::string::npos) {
        result.replace(pos, 6, text);
    }

    return result;
}

std::vector<LanguageSegment> SubtitleExporter::to_language_segments(const std::vector<Segment>& segments) {
    std::vector<LanguageSegment> spans;
    spans.reserve(segments.size());
    for (const auto& seg : segments) {
        spans.emplace_back(seg.language.empty() ? UNKNOWN_LANGUAGE : seg.language,
                           seg.start, seg.end, trim(seg.text));
    }
    return spans;
}

} // namespace huginn
