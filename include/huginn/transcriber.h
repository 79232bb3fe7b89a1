#pragma once

#include "export.h"
#include "transcription_engine.h"
#include "types.h"
#include <memory>
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief CTranslate2 Whisper transcription engine
 *
 * Production TranscriptionEngine. Features include:
 *
 * - Language detection on the first 30 seconds
 * - Sequential 30-second windows with previous-text conditioning
 * - Temperature fallback on low-confidence windows
 * - Timestamp-token segmentation and hallucination filtering
 *
 * Example:
 * @code
 *   huginn::ModelOptions model_options;
 *   model_options.model_path = "models/faster-whisper-base";
 *   huginn::Transcriber transcriber(model_options);
 *   auto result = transcriber.transcribe("audio.mp3");
 *   for (const auto& segment : result) {
 *       std::cout << segment.text << std::endl;
 *   }
 * @endcode
 */
class HUGINN_API Transcriber : public TranscriptionEngine {
public:
    /**
     * @brief Load a CTranslate2 Whisper model
     *
     * @param options Model path, device, compute type, replica count
     * @throws std::runtime_error if the model cannot be loaded
     */
    explicit Transcriber(const ModelOptions& options);

    /**
     * @brief Load a CTranslate2 Whisper model (convenience overload)
     *
     * @param model_path Path to CTranslate2-converted Whisper model
     * @param device "cuda", "cpu", "auto"
     * @param compute_type "float16", "int8", "float32", "default"
     */
    explicit Transcriber(const std::string& model_path,
                         const std::string& device = "auto",
                         const std::string& compute_type = "default");

    ~Transcriber() override;

    // Move-only (no copying)
    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;
    Transcriber(Transcriber&&) noexcept;
    Transcriber& operator=(Transcriber&&) noexcept;

    /**
     * @brief Transcribe the first audio track of a file
     *
     * Supports formats: MP3, WAV, M4A, FLAC, MP4, MOV, etc.
     * Audio is converted to 16kHz mono.
     *
     * @throws std::runtime_error if the file cannot be read or inference fails
     */
    TranscribeResult transcribe(
        const std::string& audio_path,
        const TranscribeOptions& options = {}
    ) override;

    /**
     * @brief Transcribe audio from memory
     *
     * @param audio_samples Mono float32 samples normalized to [-1, 1]
     * @param sample_rate Sample rate (linearly resampled to 16kHz if different)
     * @throws std::runtime_error if inference fails
     */
    TranscribeResult transcribe(
        const std::vector<float>& audio_samples,
        int sample_rate = 16000,
        const TranscribeOptions& options = {}
    ) override;

    struct ModelInfo {
        bool is_multilingual;
        int n_mels;
        int num_languages;
        std::string model_type;  // "tiny", "base", "small", etc.
    };
    ModelInfo get_model_info() const;

private:
    class Impl;  // Forward declaration for pimpl idiom
    std::unique_ptr<Impl> pimpl_;
};

} // namespace huginn
