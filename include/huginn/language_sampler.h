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
 * @brief Language sampling configuration
 */
struct LanguageSamplingOptions {
    float sample_window = 4.0f;        // Probe slice length in seconds
    int max_samples = 3;               // Upper bound on probe count
    float min_interval = 300.0f;       // Accepted for compatibility; the 3-point strategy ignores it
    SliceMode slice_mode = SliceMode::TempFile;
    std::vector<std::string> allowed_languages;  // Detections outside this set count as "unknown" (empty = any)
};

/**
 * @brief Samples gathered from one recording
 */
struct SamplingResult {
    std::vector<LanguageSample> samples;   // In increasing time order
    float total_duration = 0.0f;           // 0 when the duration probe failed
};

/**
 * @brief Cheap language evidence from a few probe slices
 *
 * Probes near the start, the middle and near the end of the recording and
 * auto-detects the language of each slice. A failed probe is logged and
 * skipped; a failed duration probe degrades to a single probe at time 0.
 */
class HUGINN_API LanguageSampler {
public:
    LanguageSampler(TranscriptionEngine& engine,
                    MediaSlicer& slicer,
                    LanguageSamplingOptions options = {});

    /**
     * @brief Probe the recording and return the detected languages
     *
     * @param audio_path Path to audio/video file
     * @param progress_callback Optional progress sink ("Language sampling i/N")
     * @param cancel Optional flag polled between probes
     */
    SamplingResult sample_languages(const std::string& audio_path,
                                    const ProgressCallback& progress_callback = nullptr,
                                    const std::atomic<bool>* cancel = nullptr);

    /**
     * @brief Probe start times for a recording of known duration
     *
     * Start (min(2s, 5%)), middle, and end (max(d - window - 2s, 95%)),
     * filtered to [0, d - window) and capped at max_samples. Falls back to
     * {0} when nothing survives the filter or the duration is unknown.
     */
    static std::vector<float> probe_times(float total_duration,
                                          const LanguageSamplingOptions& options);

    const LanguageSamplingOptions& options() const { return options_; }

private:
    TranscriptionEngine& engine_;
    MediaSlicer& slicer_;
    LanguageSamplingOptions options_;
};

} // namespace huginn
