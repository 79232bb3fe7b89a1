#pragma once

#include "export.h"
#include "types.h"
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief Output format types
 */
enum class SubtitleFormat {
    SRT,        // SubRip (.srt) - universal compatibility
    VTT,        // WebVTT (.vtt) - web standard, supports <lang> spans
    Text        // Plain transcript (.txt), one line per span
};

/**
 * @brief Subtitle export configuration
 */
struct SubtitleExportOptions {
    // ═══════════════════════════════════════════════════════════
    // Format Options
    // ═══════════════════════════════════════════════════════════
    SubtitleFormat format = SubtitleFormat::SRT;

    // ═══════════════════════════════════════════════════════════
    // Text Formatting
    // ═══════════════════════════════════════════════════════════
    int max_chars_per_line = 42;           // Max characters per line
    int max_lines = 2;                     // Max lines per cue
    bool auto_split_long_text = true;      // Wrap lines; overflow goes to follow-up cues

    // ═══════════════════════════════════════════════════════════
    // Language Tags
    // ═══════════════════════════════════════════════════════════
    bool include_language = false;         // Prefix text with a language tag
    std::string language_format = "[{code}] {text}";  // Placeholders: {code}, {name}, {text}
    bool vtt_lang_spans = false;           // Wrap VTT cue text in <lang code>...</lang>

    // ═══════════════════════════════════════════════════════════
    // Timing
    // ═══════════════════════════════════════════════════════════
    float min_duration = 0.3f;             // Minimum cue duration (seconds)
    float max_duration = 7.0f;             // Maximum cue duration (seconds)
    float gap_threshold = 0.0f;            // Join same-language cues closer than this (0 = off)

    // ═══════════════════════════════════════════════════════════
    // Plain text
    // ═══════════════════════════════════════════════════════════
    bool text_include_timestamps = true;   // "[MM:SS - MM:SS] " line prefix

    // ═══════════════════════════════════════════════════════════
    // Output
    // ═══════════════════════════════════════════════════════════
    std::string output_path;               // Output file path (empty = auto-generate)
};

/**
 * @brief Subtitle cue
 */
struct SubtitleEntry {
    int index;                             // Cue number (1-based)
    float start;                           // Start time (seconds)
    float end;                             // End time (seconds)
    std::string text;                      // Cue text (may contain newlines)
    std::string language;                  // Language code of the source span

    SubtitleEntry() : index(0), start(0.0f), end(0.0f) {}
};

/**
 * @brief Subtitle Exporter
 *
 * Writes merged language spans (or coarse segments) as SRT, WebVTT or plain
 * text next to the source media.
 *
 * Example usage:
 * @code
 * huginn::SubtitleExporter exporter;
 * exporter.export_srt(result.language_segments, "interview.mp4");  // interview.srt
 *
 * huginn::SubtitleExportOptions options;
 * options.format = huginn::SubtitleFormat::VTT;
 * options.include_language = true;
 * exporter.export_subtitles(result.language_segments, "interview.mp4", options);
 * @endcode
 */
class HUGINN_API SubtitleExporter {
public:
    SubtitleExporter() = default;
    ~SubtitleExporter() = default;

    // ═══════════════════════════════════════════════════════════
    // High-level Export
    // ═══════════════════════════════════════════════════════════

    /**
     * @brief Export in options.format
     *
     * Output path auto-generated from media_path if not specified in options.
     *
     * @return Output file path
     * @throws std::runtime_error if the file cannot be created
     */
    std::string export_subtitles(const std::vector<LanguageSegment>& segments,
                                 const std::string& media_path,
                                 const SubtitleExportOptions& options = SubtitleExportOptions());

    /**
     * @brief Export coarse transcription segments (language taken per segment)
     */
    std::string export_subtitles(const std::vector<Segment>& segments,
                                 const std::string& media_path,
                                 const SubtitleExportOptions& options = SubtitleExportOptions());

    // ═══════════════════════════════════════════════════════════
    // Format-specific Export
    // ═══════════════════════════════════════════════════════════

    std::string export_srt(const std::vector<LanguageSegment>& segments,
                           const std::string& media_path,
                           const SubtitleExportOptions& options = SubtitleExportOptions());

    std::string export_vtt(const std::vector<LanguageSegment>& segments,
                           const std::string& media_path,
                           const SubtitleExportOptions& options = SubtitleExportOptions());

    std::string export_text(const std::vector<LanguageSegment>& segments,
                            const std::string& media_path,
                            const SubtitleExportOptions& options = SubtitleExportOptions());

    // ═══════════════════════════════════════════════════════════
    // Low-level Formatting
    // ═══════════════════════════════════════════════════════════

    /**
     * @brief Convert spans to cues
     *
     * Applies language tags, line wrapping, overflow cues and timing limits.
     * A span whose text needs more than max_lines lines is divided into
     * consecutive cues with time shared in proportion to text length.
     * Cues never overlap: a cue stretched to min_duration ends no later
     * than the next cue starts.
     */
    static std::vector<SubtitleEntry> segments_to_entries(
        const std::vector<LanguageSegment>& segments,
        const SubtitleExportOptions& options);

    static std::string format_srt_entry(const SubtitleEntry& entry);

    static std::string format_vtt_entry(const SubtitleEntry& entry,
                                        const SubtitleExportOptions& options);

    /**
     * @brief Plain text for spans, one line per span
     */
    static std::string format_text(const std::vector<LanguageSegment>& segments,
                                   const SubtitleExportOptions& options);

    // ═══════════════════════════════════════════════════════════
    // Utilities
    // ═══════════════════════════════════════════════════════════

    /**
     * @brief Output path beside the media file with the format's extension
     */
    static std::string generate_output_path(const std::string& media_path,
                                            SubtitleFormat format);

    /**
     * @brief Wrap text into lines of at most max_chars_per_line
     *
     * Words longer than a line are kept whole. Returns every line; callers
     * group them into cues.
     */
    static std::vector<std::string> wrap_lines(const std::string& text,
                                               int max_chars_per_line);

    /**
     * @brief Format time for SRT (HH:MM:SS,mmm)
     */
    static std::string format_srt_timestamp(float seconds);

    /**
     * @brief Format time for VTT (HH:MM:SS.mmm)
     */
    static std::string format_vtt_timestamp(float seconds);

    /**
     * @brief Apply the language format string
     *
     * Replaces {code} (upper-cased), {name} and {text}.
     */
    static std::string apply_language_format(const std::string& format_string,
                                             const std::string& language,
                                             const std::string& text);

    /**
     * @brief Coarse segments as language spans (empty language becomes "unknown")
     */
    static std::vector<LanguageSegment> to_language_segments(const std::vector<Segment>& segments);
};

} // namespace huginn
