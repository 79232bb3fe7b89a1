#include "huginn/multilang_transcriber.h"
#include "huginn/language_report.h"
#include <exception>
#include <iostream>

namespace huginn {

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\n\r";
    size_t first = text.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    size_t last = text.find_last_not_of(ws);
    return text.substr(first, last - first + 1);
}

std::string join_span_texts(const std::vector<LanguageSegment>& segments) {
    std::string text;
    for (const auto& seg : segments) {
        if (!text.empty()) text += " ";
        text += seg.text;
    }
    return text;
}

void report(const ProgressCallback& progress_callback, const std::string& message,
            std::optional<float> percent = std::nullopt) {
    if (progress_callback) {
        progress_callback(message, percent);
    }
}

} // anonymous namespace

MultilangTranscriber::MultilangTranscriber(ModelProvider& models,
                                           MediaSlicer& slicer,
                                           MultilangOptions options)
    : models_(models)
    , slicer_(slicer)
    , options_(std::move(options))
{
}

MultilangResult MultilangTranscriber::transcribe_single_pass(TranscriptionEngine& engine,
                                                             const std::string& audio_path,
                                                             const std::string& language,
                                                             const ProgressCallback& progress_callback)
{
    TranscribeOptions pass_options = options_.transcribe;
    pass_options.language = language;

    report(progress_callback, language == AUTO_LANGUAGE
        ? "Transcribing (single pass)..."
        : "Transcribing (single language: " + language + ")...");

    MultilangResult result;
    result.transcription = engine.transcribe(audio_path, pass_options);

    const auto& segments = result.transcription.segments;
    if (!segments.empty()) {
        std::string span_language = result.transcription.language;
        if (span_language.empty() || span_language == AUTO_LANGUAGE) {
            span_language = language == AUTO_LANGUAGE ? UNKNOWN_LANGUAGE : language;
        }
        span_language = restrict_language(span_language, options_.allowed_languages);
        result.language_segments.emplace_back(span_language, 0.0f, segments.back().end,
                                               trim(result.transcription.text));
    }

    return result;
}

MultilangResult MultilangTranscriber::transcribe_multilang(const std::string& audio_path,
                                                           const ProgressCallback& progress_callback)
{
    cancel_requested_.store(false);
    raw_segments_.clear();

    std::cout << "[Huginn] ═══════════════════════════════════════════════════\n";
    std::cout << "[Huginn] Multi-language transcription: " << audio_path << "\n";
    std::cout << "[Huginn] ═══════════════════════════════════════════════════\n";

    report(progress_callback, "Loading model " + options_.model_size + "...");
    auto engine = models_.get_or_load(options_.model_size);

    if (!options_.detect_language_changes) {
        std::cout << "[Huginn] Language change detection disabled\n";
        auto result = transcribe_single_pass(*engine, audio_path, AUTO_LANGUAGE, progress_callback);
        if (!result.transcription.language.empty()) {
            result.classification.primary_language = result.transcription.language;
        }
        finish(result, audio_path);
        return result;
    }

    // Cheap sampling decides whether per-segment work is needed at all
    report(progress_callback, "Sampling languages...");
    LanguageSamplingOptions sampling_options = options_.sampling;
    if (!options_.allowed_languages.empty()) {
        sampling_options.allowed_languages = options_.allowed_languages;
    }
    LanguageSampler sampler(*engine, slicer_, sampling_options);
    auto sampling = sampler.sample_languages(audio_path, progress_callback, &cancel_requested_);

    ModeDecision decision = classify_language_mode(sampling.samples, sampling.total_duration,
                                                   options_.classification);

    // Several allowed languages mean the caller expects a mixed recording
    bool force_multilang = options_.force_multilang || options_.allowed_languages.size() > 1;

    if (decision.mode == LanguageMode::Single && !force_multilang) {
        std::string hint = decision.primary_language.value_or(AUTO_LANGUAGE);
        if (hint == UNKNOWN_LANGUAGE) {
            hint = AUTO_LANGUAGE;
        }
        std::cout << "[Huginn] Single language detected (" << hint << "), using fast path\n";

        auto result = transcribe_single_pass(*engine, audio_path, hint, progress_callback);
        result.classification = decision;
        finish(result, audio_path);
        return result;
    }

    if (decision.mode == LanguageMode::Single) {
        std::cout << "[Huginn] Multi-language processing forced\n";
    }

    // Full pass gives the coarse segment boundaries
    report(progress_callback, "Transcribing full audio...");
    TranscribeOptions pass_options = options_.transcribe;
    pass_options.language = AUTO_LANGUAGE;

    MultilangResult result;
    result.classification = decision;
    result.transcription = engine->transcribe(audio_path, pass_options);

    std::cout << "[Huginn] Full pass: " << result.transcription.segments.size()
              << " segments, language=" << result.transcription.language << "\n";

    RetranscribeOptions retranscribe_options = options_.retranscription;
    if (!options_.allowed_languages.empty()) {
        retranscribe_options.allowed_languages = options_.allowed_languages;
    }
    SegmentRetranscriber retranscriber(*engine, slicer_, retranscribe_options);
    result.language_segments = retranscriber.retranscribe_segments(
        audio_path, result.transcription.segments, progress_callback, &cancel_requested_);
    result.cancelled = retranscriber.was_cancelled();
    raw_segments_ = retranscriber.raw_segments();

    finish(result, audio_path);
    return result;
}

void MultilangTranscriber::finish(MultilangResult& result, const std::string& audio_path)
{
    result.text = join_span_texts(result.language_segments);
    result.timeline = create_language_timeline(result.language_segments);

    if (options_.save_diagnostics) {
        try {
            save_diagnostics_json(result, audio_path, raw_segments_, options_.diagnostics_dir);
        } catch (const std::exception& e) {
            std::cerr << "[Huginn] Failed to save diagnostics: " << e.what() << "\n";
        }
    }

    std::cout << "[Huginn] Done: " << result.language_segments.size() << " language span(s)"
              << (result.cancelled ? " (cancelled)" : "") << "\n";
}

} // namespace huginn
