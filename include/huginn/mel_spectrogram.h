#pragma once

#include <cstddef>
#include <vector>

namespace huginn {

/**
 * @brief Log-mel features laid out [n_mels x n_frames], row-major
 *
 * This is the layout CTranslate2 expects for Whisper input ([1, n_mels, n_frames]).
 */
struct MelFeatures {
    int n_mels = 0;
    int n_frames = 0;
    std::vector<float> data;

    float at(int mel, int frame) const { return data[static_cast<std::size_t>(mel) * n_frames + frame]; }

    /**
     * @brief Copy frames [start_frame, start_frame + count) of every mel row
     *
     * Frames past the end are filled with the feature floor of the padding.
     */
    std::vector<float> window(int start_frame, int count, float pad_value = 0.0f) const;
};

/**
 * @brief Whisper-compatible mel-spectrogram converter
 *
 * Matches the reference Whisper front end:
 * - periodic Hann window, centered frames with reflect padding
 * - power spectrum, Slaney-normalized mel filterbank
 * - log10, clamp to (max - 8), scale (x + 4) / 4
 *
 * Defaults: 16kHz, 400-point FFT (25ms), 160-sample hop (10ms), 80 mel bins.
 * large-v3 models need 128 bins.
 */
class MelSpectrogram {
public:
    MelSpectrogram(int sample_rate = 16000,
                   int n_fft = 400,
                   int n_mels = 80,
                   int hop_length = 160);

    /**
     * @brief Convert audio samples to log-mel features
     *
     * @param samples Audio samples (mono, float32, normalized to [-1, 1])
     * @return Features with samples.size() / hop_length frames
     */
    MelFeatures compute(const std::vector<float>& samples) const;

    int getMelBins() const { return n_mels_; }
    int getHopLength() const { return hop_length_; }

private:
    void createHannWindow();
    void createMelFilters();
    void createDftTables();

    static float hzToMel(float hz);
    static float melToHz(float mel);

    int sample_rate_;
    int n_fft_;
    int n_mels_;
    int hop_length_;
    int n_freqs_;

    std::vector<float> hann_window_;
    std::vector<float> mel_filters_;   // [n_mels x n_freqs]
    std::vector<float> dft_cos_;       // [n_freqs x n_fft]
    std::vector<float> dft_sin_;       // [n_freqs x n_fft]
};

} // namespace huginn
