#pragma once

#include "huginn/export.h"
#include "huginn/media_slicer.h"
#include <memory>
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief AudioExtractor - Heimdall-backed audio extraction and slicing
 *
 * Extracts audio from audio/video files and prepares it for Whisper:
 * - 16kHz sample rate (or the rate a slice asks for)
 * - Mono channel
 * - Float32 samples normalized to [-1, 1]
 *
 * As a MediaSlicer it decodes the first audio track once per path and sample
 * rate, then cuts slices by sample index, so repeated slices of one file do
 * not re-decode it.
 */
class HUGINN_API AudioExtractor : public MediaSlicer {
public:
    AudioExtractor();
    ~AudioExtractor() override;

    AudioExtractor(const AudioExtractor&) = delete;
    AudioExtractor& operator=(const AudioExtractor&) = delete;

    /**
     * @brief Open a file for multi-track extraction
     * @param file_path Path to audio/video file
     * @return True if successful
     */
    bool open(const std::string& file_path);

    /**
     * @brief Close the currently open file
     */
    void close();

    /**
     * @brief Get number of audio tracks in file
     * @return Number of audio tracks (0 if no file open)
     */
    int get_track_count() const;

    /**
     * @brief Get duration in seconds
     */
    float get_duration() const;

    /**
     * @brief Extract audio from a specific track at 16kHz
     * @param track_index Track index (0-based)
     * @param samples Output buffer for float32 samples
     * @return True if successful
     */
    bool extract_track(int track_index, std::vector<float>& samples);

    /**
     * @brief Extract track 0 of a file at 16kHz (convenience method)
     *
     * @param file_path Path to audio/video file
     * @param samples Output buffer for float32 samples
     * @param duration Output duration in seconds
     * @return True if successful
     */
    bool extract_audio(const std::string& file_path,
                       std::vector<float>& samples,
                       float& duration);

    /**
     * @brief Get last error message
     */
    std::string get_last_error() const { return last_error_; }

    // ═══════════════════════════════════════════════════════════
    // MediaSlicer
    // ═══════════════════════════════════════════════════════════

    /**
     * @throws std::runtime_error if the file has no readable audio stream
     */
    float probe_duration(const std::string& source_path) override;

    /**
     * @throws std::invalid_argument for a negative start, non-positive
     *         duration, rate or channel count
     * @throws std::runtime_error if decoding fails or start is past the end
     */
    std::vector<float> extract_samples(const std::string& source_path,
                                       float start,
                                       float duration,
                                       int sample_rate = 16000,
                                       int channels = 1) override;

    /**
     * @brief Drop the decoded track kept for slicing
     */
    void clear_cache();

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
    std::string last_error_;
};

} // namespace huginn
