#include "huginn/segment_retranscriber.h"
#include "huginn/language_report.h"
#include "huginn/segment_merger.h"
#include <algorithm>
#include <exception>
#include <iostream>
#include <set>

namespace huginn {

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\n\r";
    size_t first = text.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

} // anonymous namespace

SegmentRetranscriber::SegmentRetranscriber(TranscriptionEngine& engine,
                                           MediaSlicer& slicer,
                                           RetranscribeOptions options)
    : engine_(engine)
    , slicer_(slicer)
    , options_(std::move(options))
{
}

ChunkOutcome SegmentRetranscriber::retranscribe_chunk(const std::string& audio_path,
                                                      const Segment& coarse)
{
    ChunkOutcome outcome;
    outcome.segment.start = coarse.start;
    outcome.segment.end = coarse.end;

    TranscribeOptions detect_options;
    detect_options.language = AUTO_LANGUAGE;
    detect_options.word_timestamps = false;

    try {
        auto result = transcribe_slice(engine_, slicer_, audio_path,
                                       coarse.start, coarse.end - coarse.start,
                                       options_.slice_mode, detect_options,
                                       options_.sample_rate, options_.channels);

        outcome.status = ChunkOutcome::Status::Transcribed;
        outcome.segment.language = restrict_language(result.language, options_.allowed_languages);
        outcome.segment.text = trim(result.text);
    } catch (const std::exception& e) {
        outcome.status = ChunkOutcome::Status::Degraded;
        outcome.segment.language = UNKNOWN_LANGUAGE;
        outcome.segment.text = trim(coarse.text);
        outcome.error = e.what();
    }

    return outcome;
}

std::vector<LanguageSegment> SegmentRetranscriber::retranscribe_segments(
    const std::string& audio_path,
    const std::vector<Segment>& coarse_segments,
    const ProgressCallback& progress_callback,
    const std::atomic<bool>* cancel)
{
    raw_segments_.clear();
    degraded_count_ = 0;
    cancelled_ = false;

    const size_t total = coarse_segments.size();
    const size_t interval = static_cast<size_t>(std::max(1, options_.progress_interval));

    std::cout << "[Huginn] Re-transcribing " << total
              << " segments for accurate language detection\n";

    for (size_t i = 0; i < total; ++i) {
        if (cancel && cancel->load()) {
            std::cout << "[Huginn] Retranscription cancelled after " << i << "/" << total << " segments\n";
            cancelled_ = true;
            break;
        }

        const auto& coarse = coarse_segments[i];
        if (coarse.end - coarse.start < options_.min_segment_duration) {
            continue;
        }

        if (progress_callback && i % interval == 0) {
            progress_callback("Language detection: " + std::to_string(i + 1) + "/" +
                              std::to_string(total) + " segments",
                              100.0f * static_cast<float>(i) / static_cast<float>(total));
        }

        auto outcome = retranscribe_chunk(audio_path, coarse);
        if (outcome.degraded()) {
            degraded_count_++;
            std::cerr << "[Huginn] Failed to re-transcribe segment " << i << ": "
                      << outcome.error << "\n";
        } else {
            std::cout << "[Huginn] Segment " << i << ": " << outcome.segment.language << " - "
                      << truncate_utf8(outcome.segment.text, 50)
                      << "\n";
        }

        raw_segments_.push_back(std::move(outcome.segment));
    }

    log_segment_diagnostics(raw_segments_, "RAW (before merge)");

    auto merged = merge_consecutive_language_segments(raw_segments_);

    log_segment_diagnostics(merged, "MERGED");

    std::set<std::string> languages;
    for (const auto& seg : merged) {
        languages.insert(seg.language);
    }
    std::cout << "[Huginn] Detected " << languages.size() << " unique language(s)";
    if (degraded_count_ > 0) {
        std::cout << ", " << degraded_count_ << " segment(s) degraded to '" << UNKNOWN_LANGUAGE << "'";
    }
    std::cout << "\n";

    return merged;
}

} // namespace huginn
