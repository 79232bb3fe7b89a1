#pragma once

#include "export.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace huginn {

/// Language label used when a slice could not be transcribed
inline const std::string UNKNOWN_LANGUAGE = "unknown";

/// Language value that asks the engine to auto-detect
inline const std::string AUTO_LANGUAGE = "auto";

/**
 * @brief Compute precision type
 */
enum class ComputeType {
    Float32,        // Full precision (most accurate, slowest)
    Float16,        // Half precision (fast on GPU)
    Int8,           // 8-bit quantized (fastest, good quality)
    Int8Float16,    // Mixed precision
    Auto            // Auto-detect best for device
};

/**
 * @brief Device type for inference
 */
enum class DeviceType {
    Auto,           // Auto-detect (prefer CUDA if available)
    CUDA,           // NVIDIA GPU
    CPU             // CPU only
};

/**
 * @brief Word-level timestamp information
 */
struct Word {
    float start;             // Start time in seconds
    float end;               // End time in seconds
    std::string word;        // The word text
    float probability;       // Confidence score (0.0-1.0)

    Word() : start(0.0f), end(0.0f), probability(1.0f) {}
};

/**
 * @brief Time-aligned segment produced by one transcription pass
 */
struct Segment {
    int id;                         // Segment index
    float start;                    // Start time in seconds
    float end;                      // End time in seconds
    std::string text;               // Transcribed text
    std::vector<Word> words;        // Word-level timestamps (if enabled)

    std::string language;           // Language the segment was decoded with

    // Quality metrics
    float temperature;              // Sampling temperature used
    float avg_logprob;              // Average log probability
    float compression_ratio;        // Text compression ratio
    float no_speech_prob;           // Probability of no speech

    Segment() : id(0), start(0.0f), end(0.0f),
                temperature(0.0f), avg_logprob(0.0f),
                compression_ratio(0.0f), no_speech_prob(0.0f) {}
};

/**
 * @brief Complete transcription result
 */
struct TranscribeResult {
    std::vector<Segment> segments;   // All transcription segments
    std::string text;                // Space-joined text of all segments
    std::string language;            // Detected/specified language
    float language_probability;      // Language detection confidence
    float duration;                  // Total audio duration in seconds

    TranscribeResult() : language_probability(0.0f), duration(0.0f) {}

    auto begin() const { return segments.begin(); }
    auto end() const { return segments.end(); }
    auto begin() { return segments.begin(); }
    auto end() { return segments.end(); }
};

/**
 * @brief Transcription configuration options
 */
struct TranscribeOptions {
    // ═══════════════════════════════════════════════════════════
    // Language and Task
    // ═══════════════════════════════════════════════════════════
    std::string language = AUTO_LANGUAGE;  // "en", "es", "auto" (auto = detect)
    std::string task = "transcribe";       // "transcribe" or "translate"

    // ═══════════════════════════════════════════════════════════
    // Decoding Parameters
    // ═══════════════════════════════════════════════════════════
    int beam_size = 5;                     // Beam search width (1-10)
    float temperature = 0.0f;              // Sampling temperature (0 = greedy)
    std::vector<float> temperature_fallback = {0.0f, 0.2f, 0.4f, 0.6f, 0.8f, 1.0f};
    float patience = 1.0f;                 // Beam search patience
    float length_penalty = 1.0f;           // Length penalty factor
    float repetition_penalty = 1.0f;       // Repetition penalty
    int no_repeat_ngram_size = 0;          // Prevent n-gram repetitions
    int max_length = 448;                  // Maximum tokens per window

    // ═══════════════════════════════════════════════════════════
    // Hallucination Filtering
    // ═══════════════════════════════════════════════════════════
    float compression_ratio_threshold = 2.4f;  // Max compression ratio
    float log_prob_threshold = -1.0f;          // Min average log probability
    float no_speech_threshold = 0.4f;          // Max no-speech probability

    // ═══════════════════════════════════════════════════════════
    // Timestamps
    // ═══════════════════════════════════════════════════════════
    bool word_timestamps = false;          // Estimate word-level timing
    float clip_start = 0.0f;               // Start time for clip (0 = beginning)
    float clip_end = -1.0f;                // End time for clip (-1 = full audio)

    // ═══════════════════════════════════════════════════════════
    // Token Suppression
    // ═══════════════════════════════════════════════════════════
    bool suppress_blank = true;            // Suppress blank outputs at window start
    std::vector<int> suppress_tokens = {-1};  // Token IDs to suppress (-1 = model defaults)

    // ═══════════════════════════════════════════════════════════
    // Prompt / Context
    // ═══════════════════════════════════════════════════════════
    std::string initial_prompt;            // Initial prompt to condition model
    bool condition_on_previous = true;     // Use previous window text as context
    float prompt_reset_on_temperature = 0.5f;  // Drop context when T exceeds this
};

/**
 * @brief Model initialization options
 */
struct ModelOptions {
    std::string model_path;                // Path to CTranslate2 model directory

    DeviceType device = DeviceType::Auto;
    ComputeType compute_type = ComputeType::Auto;

    int inter_threads = 1;                 // Model replicas on the device
    int device_index = 0;                  // GPU index for multi-GPU systems

    std::string device_string() const {
        switch (device) {
            case DeviceType::CUDA: return "cuda";
            case DeviceType::CPU: return "cpu";
            default: return "auto";
        }
    }

    std::string compute_type_string() const {
        switch (compute_type) {
            case ComputeType::Float32: return "float32";
            case ComputeType::Float16: return "float16";
            case ComputeType::Int8: return "int8";
            case ComputeType::Int8Float16: return "int8_float16";
            default: return "default";
        }
    }
};

// ═══════════════════════════════════════════════════════════
// Multi-language pipeline
// ═══════════════════════════════════════════════════════════

/**
 * @brief Language detected on one probe slice
 */
struct LanguageSample {
    float time;              // Probe start in seconds
    std::string language;    // Detected code or "unknown"

    LanguageSample(float t = 0.0f, std::string lang = UNKNOWN_LANGUAGE)
        : time(t), language(std::move(lang)) {}
};

/**
 * @brief Language mix of a recording
 */
enum class LanguageMode {
    Single,     // One language throughout
    Mixed,      // Secondary language interleaved with the primary
    Hybrid      // Secondary language only in the trailing part
};

/**
 * @brief Classifier output
 *
 * secondary_languages is empty iff mode == Single, and transition_time is set
 * iff at least one secondary language was validated.
 */
struct ModeDecision {
    LanguageMode mode = LanguageMode::Single;
    std::optional<std::string> primary_language;
    std::vector<std::string> secondary_languages;
    std::optional<float> transition_time;
};

/**
 * @brief Language-homogeneous span of the timeline (0 <= start < end)
 */
struct LanguageSegment {
    std::string language;
    float start;
    float end;
    std::string text;

    LanguageSegment() : start(0.0f), end(0.0f) {}
    LanguageSegment(std::string lang, float s, float e, std::string t)
        : language(std::move(lang)), start(s), end(e), text(std::move(t)) {}
};

/**
 * @brief Progress sink
 *
 * @param message Status message for display
 * @param percent Optional progress in percent (0-100)
 */
using ProgressCallback = std::function<void(const std::string& message, std::optional<float> percent)>;

/**
 * @brief Result of the multi-language orchestrator
 */
struct MultilangResult {
    TranscribeResult transcription;                 // Full pass (or fast single pass)
    std::vector<LanguageSegment> language_segments; // Merged spans
    ModeDecision classification;                    // Sampling-based decision
    std::string timeline;                           // Human-readable language timeline
    std::string text;                               // Space-joined span texts
    bool cancelled = false;                         // Retranscription stopped early
};

HUGINN_API std::string to_string(LanguageMode mode);

/**
 * @brief Map a detected language onto an allowed set
 *
 * Empty or unlisted detections become "unknown"; an empty allowed set
 * keeps every non-empty detection.
 */
HUGINN_API std::string restrict_language(const std::string& detected,
                                         const std::vector<std::string>& allowed_languages);

} // namespace huginn
