#pragma once

#include "export.h"
#include "types.h"
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief At most max_bytes of text, cut on a UTF-8 character boundary
 */
HUGINN_API std::string truncate_utf8(const std::string& text, size_t max_bytes);

/**
 * @brief Display name for a language code
 *
 * Codes outside the supported table render as the upper-cased code.
 */
HUGINN_API std::string language_name(const std::string& code);

/**
 * @brief Format seconds as MM:SS (minutes are not wrapped at one hour)
 */
HUGINN_API std::string format_timestamp_readable(float seconds);

/**
 * @brief One line per span: "[MM:SS - MM:SS] Language: Name (CODE)"
 */
HUGINN_API std::string create_language_timeline(const std::vector<LanguageSegment>& segments);

/**
 * @brief Per-language statistics over a span list
 */
struct LanguageStats {
    std::string language;
    std::string language_name;
    int segment_count = 0;
    float total_duration = 0.0f;        // Seconds
    float percentage_by_count = 0.0f;
    float percentage_by_duration = 0.0f;  // 0 when the spans have no total duration
};

/**
 * @brief Statistics per language, in order of first appearance
 */
HUGINN_API std::vector<LanguageStats> calculate_language_stats(
    const std::vector<LanguageSegment>& segments);

/**
 * @brief Log a language breakdown and the first five spans to stdout
 *
 * @param stage Label for the processing stage, e.g. "RAW" or "MERGED"
 */
HUGINN_API void log_segment_diagnostics(const std::vector<LanguageSegment>& segments,
                                        const std::string& stage);

/**
 * @brief Human-readable multi-language report
 */
HUGINN_API std::string format_multilang_report(const MultilangResult& result);

/**
 * @brief Write <dir>/<stem>_diagnostics.json for a finished run
 *
 * @param result Orchestrator result (coarse pass, merged spans)
 * @param audio_path Source media path
 * @param raw_segments Spans before merging
 * @param diagnostics_dir Output directory (created if missing)
 * @return Path of the written file
 * @throws std::runtime_error if the file cannot be written
 */
HUGINN_API std::string save_diagnostics_json(const MultilangResult& result,
                                             const std::string& audio_path,
                                             const std::vector<LanguageSegment>& raw_segments,
                                             const std::string& diagnostics_dir = "diagnostics");

/**
 * @brief Mean confidence (1 - no_speech_prob) over segments
 *
 * Segments shorter than 0.5 s with fewer than 3 characters count half.
 * Returns 0 for an empty list.
 */
HUGINN_API float calculate_quality_score(const std::vector<Segment>& segments);

} // namespace huginn
