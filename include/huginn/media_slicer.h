#pragma once

#include "export.h"
#include "transcription_engine.h"
#include "types.h"
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief How a slice is handed to the transcription engine
 */
enum class SliceMode {
    TempFile,   // Write a temporary 16-bit PCM WAV and transcribe the file
    InMemory    // Pass the decoded float32 buffer directly
};

/**
 * @brief Time-bounded PCM extraction from a media file
 *
 * Implementations resample and downmix deterministically and never shift
 * timing. All methods throw std::runtime_error when the source cannot be read.
 */
class HUGINN_API MediaSlicer {
public:
    virtual ~MediaSlicer() = default;

    /**
     * @brief Total duration of the first audio stream in seconds
     */
    virtual float probe_duration(const std::string& source_path) = 0;

    /**
     * @brief Decode [start, start + duration) into interleaved float32 samples
     *
     * The slice is clamped to the end of the stream.
     *
     * @param source_path Path to audio/video file
     * @param start Slice start in seconds
     * @param duration Slice length in seconds
     * @param sample_rate Output sample rate
     * @param channels Output channel count (samples interleaved when > 1)
     */
    virtual std::vector<float> extract_samples(
        const std::string& source_path,
        float start,
        float duration,
        int sample_rate = 16000,
        int channels = 1
    ) = 0;

    /**
     * @brief Write [start, start + duration) to a new temporary WAV file
     *
     * The default implementation decodes with extract_samples() and writes a
     * 16-bit PCM WAV under the system temp directory. The caller owns the file
     * (wrap it in a TempAudioFile).
     *
     * @return Path of the temporary file
     */
    virtual std::string extract_slice(
        const std::string& source_path,
        float start,
        float duration,
        int sample_rate = 16000,
        int channels = 1
    );
};

/**
 * @brief Owner of a temporary audio file, removed on destruction
 *
 * Removal failures are logged as warnings, never thrown.
 */
class HUGINN_API TempAudioFile {
public:
    TempAudioFile() = default;
    explicit TempAudioFile(std::string path);
    ~TempAudioFile();

    TempAudioFile(const TempAudioFile&) = delete;
    TempAudioFile& operator=(const TempAudioFile&) = delete;
    TempAudioFile(TempAudioFile&& other) noexcept;
    TempAudioFile& operator=(TempAudioFile&& other) noexcept;

    const std::string& path() const { return path_; }
    bool empty() const { return path_.empty(); }

    /**
     * @brief Remove the file now
     * @return false if the file existed and could not be removed
     */
    bool remove();

private:
    std::string path_;
};

/**
 * @brief Unique path for a temporary WAV file (not created)
 */
HUGINN_API std::string make_temp_audio_path(const std::string& prefix = "huginn_slice");

/**
 * @brief Write interleaved float32 samples as a 16-bit PCM WAV file
 *
 * Samples are clamped to [-1, 1].
 *
 * @throws std::runtime_error if the file cannot be written
 * @throws std::invalid_argument for a non-positive rate or channel count
 */
HUGINN_API void write_wav_file(const std::string& path,
                               const std::vector<float>& samples,
                               int sample_rate,
                               int channels = 1);

/**
 * @brief Slice the source and transcribe only that slice
 *
 * TempFile mode deletes the temporary file before returning or throwing.
 * InMemory mode always requests mono samples.
 *
 * @throws whatever the slicer or engine throws
 */
HUGINN_API TranscribeResult transcribe_slice(TranscriptionEngine& engine,
                                             MediaSlicer& slicer,
                                             const std::string& source_path,
                                             float start,
                                             float duration,
                                             SliceMode mode,
                                             const TranscribeOptions& options,
                                             int sample_rate = 16000,
                                             int channels = 1);

} // namespace huginn
