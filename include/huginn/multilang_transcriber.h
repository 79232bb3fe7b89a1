#pragma once

#include "export.h"
#include "language_sampler.h"
#include "media_slicer.h"
#include "mode_classifier.h"
#include "model_provider.h"
#include "segment_retranscriber.h"
#include "types.h"
#include <atomic>
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief Multi-language pipeline configuration
 */
struct MultilangOptions {
    std::string model_size = "base";        // Model used for every pass
    bool detect_language_changes = true;    // false = one auto-detect pass, one span
    bool force_multilang = false;           // Retranscribe even when sampling says single
    bool save_diagnostics = false;          // Write <diagnostics_dir>/<stem>_diagnostics.json
    std::string diagnostics_dir = "diagnostics";

    // Languages the recording may contain (empty = any). Applied to sampling
    // and retranscription; more than one entry always retranscribes.
    std::vector<std::string> allowed_languages;

    TranscribeOptions transcribe;           // Options of the full pass
    LanguageSamplingOptions sampling;
    LanguageModeOptions classification;
    RetranscribeOptions retranscription;
};

/**
 * @brief Multi-language transcription orchestrator
 *
 * Samples the recording, classifies its language mode, and either runs one
 * hinted pass (single language) or a full pass followed by per-segment
 * retranscription and merging.
 *
 * Example:
 * @code
 *   huginn::CachedModelProvider models(huginn::whisper_model_loader("models"));
 *   huginn::AudioExtractor slicer;
 *   huginn::MultilangTranscriber pipeline(models, slicer);
 *   auto result = pipeline.transcribe_multilang("interview.mp4");
 *   std::cout << result.timeline << "\n";
 * @endcode
 */
class HUGINN_API MultilangTranscriber {
public:
    MultilangTranscriber(ModelProvider& models,
                         MediaSlicer& slicer,
                         MultilangOptions options = {});

    /**
     * @brief Transcribe with language-change detection
     *
     * @param audio_path Path to audio/video file
     * @param progress_callback Optional progress sink
     * @return Spans, classification, timeline and the full-pass result
     * @throws std::runtime_error if the model cannot be loaded or the full
     *         pass fails
     */
    MultilangResult transcribe_multilang(const std::string& audio_path,
                                         const ProgressCallback& progress_callback = nullptr);

    /**
     * @brief Ask a running transcribe_multilang() to stop between slices
     *
     * Safe to call from another thread. The flag is cleared when the next
     * run starts.
     */
    void request_cancel() { cancel_requested_.store(true); }

    bool cancel_requested() const { return cancel_requested_.load(); }

    /// Spans before merging from the last retranscription (empty on the single path)
    const std::vector<LanguageSegment>& raw_segments() const { return raw_segments_; }

    const MultilangOptions& options() const { return options_; }

private:
    MultilangResult transcribe_single_pass(TranscriptionEngine& engine,
                                           const std::string& audio_path,
                                           const std::string& language,
                                           const ProgressCallback& progress_callback);

    void finish(MultilangResult& result, const std::string& audio_path);

    ModelProvider& models_;
    MediaSlicer& slicer_;
    MultilangOptions options_;

    std::atomic<bool> cancel_requested_{false};
    std::vector<LanguageSegment> raw_segments_;
};

} // namespace huginn
