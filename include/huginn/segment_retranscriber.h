#pragma once

#include "export.h"
#include "media_slicer.h"
#include "transcription_engine.h"
#include "types.h"
#include <atomic>
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief Retranscription configuration
 */
struct RetranscribeOptions {
    float min_segment_duration = 0.1f;   // Shorter coarse segments are skipped
    int progress_interval = 5;           // Report every Nth segment
    SliceMode slice_mode = SliceMode::TempFile;
    int sample_rate = 16000;             // Slice sample rate
    int channels = 1;                    // Slice channel count (TempFile mode)
    std::vector<std::string> allowed_languages;  // Detections outside this set become "unknown" (empty = any)
};

/**
 * @brief Per-segment outcome of an isolated retranscription
 */
struct ChunkOutcome {
    enum class Status {
        Transcribed,    // Language and text come from the isolated slice
        Degraded        // Language "unknown", text from the coarse pass
    };

    Status status = Status::Transcribed;
    LanguageSegment segment;
    std::string error;       // Failure description when Degraded

    bool degraded() const { return status == Status::Degraded; }
};

/**
 * @brief Corrects per-segment languages of a single-pass transcription
 *
 * A whole-file pass decodes everything in one language context; running
 * detection on each isolated coarse segment lets the model commit to the
 * locally correct language. Segments are processed sequentially in input
 * order, each slice is deleted before the next one is cut, and the result is
 * merged with merge_consecutive_language_segments().
 */
class HUGINN_API SegmentRetranscriber {
public:
    SegmentRetranscriber(TranscriptionEngine& engine,
                         MediaSlicer& slicer,
                         RetranscribeOptions options = {});

    /**
     * @brief Retranscribe every coarse segment and merge the results
     *
     * @param audio_path Path to the full audio/video file
     * @param coarse_segments Segments of one full pass, in chronological order
     * @param progress_callback Optional progress sink
     * @param cancel Optional flag polled between segments; when set, the
     *        segments processed so far are merged and returned
     * @return Merged language spans
     */
    std::vector<LanguageSegment> retranscribe_segments(
        const std::string& audio_path,
        const std::vector<Segment>& coarse_segments,
        const ProgressCallback& progress_callback = nullptr,
        const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Retranscribe one coarse segment in isolation (never throws)
     */
    ChunkOutcome retranscribe_chunk(const std::string& audio_path, const Segment& coarse);

    /// Spans of the last run before merging
    const std::vector<LanguageSegment>& raw_segments() const { return raw_segments_; }

    /// Number of degraded segments in the last run
    int degraded_count() const { return degraded_count_; }

    /// True when the last run stopped on the cancellation flag
    bool was_cancelled() const { return cancelled_; }

private:
    TranscriptionEngine& engine_;
    MediaSlicer& slicer_;
    RetranscribeOptions options_;

    std::vector<LanguageSegment> raw_segments_;
    int degraded_count_ = 0;
    bool cancelled_ = false;
};

} // namespace huginn
