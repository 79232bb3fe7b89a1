#include "huginn/mel_spectrogram.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace huginn {

std::vector<float> MelFeatures::window(int start_frame, int count, float pad_value) const
{
    std::vector<float> out(static_cast<size_t>(n_mels) * count, pad_value);

    int available = std::max(0, std::min(count, n_frames - start_frame));
    for (int mel = 0; mel < n_mels; mel++) {
        const float* src = data.data() + static_cast<size_t>(mel) * n_frames + start_frame;
        std::copy(src, src + available, out.begin() + static_cast<size_t>(mel) * count);
    }
    return out;
}

MelSpectrogram::MelSpectrogram(int sample_rate, int n_fft, int n_mels, int hop_length)
    : sample_rate_(sample_rate)
    , n_fft_(n_fft)
    , n_mels_(n_mels)
    , hop_length_(hop_length)
    , n_freqs_(n_fft / 2 + 1)
{
    if (sample_rate <= 0 || n_fft <= 0 || n_mels <= 0 || hop_length <= 0) {
        throw std::invalid_argument("Invalid mel-spectrogram parameters");
    }

    createHannWindow();
    createMelFilters();
    createDftTables();
}

void MelSpectrogram::createHannWindow()
{
    // Periodic window (torch.hann_window default)
    hann_window_.resize(n_fft_);
    for (int i = 0; i < n_fft_; i++) {
        hann_window_[i] = 0.5f * (1.0f - static_cast<float>(std::cos(2.0 * M_PI * i / n_fft_)));
    }
}

float MelSpectrogram::hzToMel(float hz)
{
    // Slaney scale: linear below 1 kHz, logarithmic above
    const float f_sp = 200.0f / 3.0f;
    const float min_log_hz = 1000.0f;
    const float min_log_mel = min_log_hz / f_sp;
    const float logstep = std::log(6.4f) / 27.0f;

    if (hz >= min_log_hz) {
        return min_log_mel + std::log(hz / min_log_hz) / logstep;
    }
    return hz / f_sp;
}

float MelSpectrogram::melToHz(float mel)
{
    const float f_sp = 200.0f / 3.0f;
    const float min_log_hz = 1000.0f;
    const float min_log_mel = min_log_hz / f_sp;
    const float logstep = std::log(6.4f) / 27.0f;

    if (mel >= min_log_mel) {
        return min_log_hz * std::exp(logstep * (mel - min_log_mel));
    }
    return f_sp * mel;
}

void MelSpectrogram::createMelFilters()
{
    mel_filters_.assign(static_cast<size_t>(n_mels_) * n_freqs_, 0.0f);

    std::vector<float> fft_freqs(n_freqs_);
    for (int i = 0; i < n_freqs_; i++) {
        fft_freqs[i] = i * sample_rate_ / static_cast<float>(n_fft_);
    }

    const float max_mel = hzToMel(sample_rate_ / 2.0f);
    std::vector<float> mel_freqs(n_mels_ + 2);
    for (int i = 0; i < n_mels_ + 2; i++) {
        mel_freqs[i] = melToHz(max_mel * i / (n_mels_ + 1));
    }

    for (int m = 0; m < n_mels_; m++) {
        const float left = mel_freqs[m];
        const float center = mel_freqs[m + 1];
        const float right = mel_freqs[m + 2];
        const float enorm = 2.0f / (right - left);

        for (int f = 0; f < n_freqs_; f++) {
            float lower = (fft_freqs[f] - left) / (center - left);
            float upper = (right - fft_freqs[f]) / (right - center);
            float weight = std::max(0.0f, std::min(lower, upper));
            mel_filters_[static_cast<size_t>(m) * n_freqs_ + f] = weight * enorm;
        }
    }
}

void MelSpectrogram::createDftTables()
{
    dft_cos_.resize(static_cast<size_t>(n_freqs_) * n_fft_);
    dft_sin_.resize(static_cast<size_t>(n_freqs_) * n_fft_);

    for (int k = 0; k < n_freqs_; k++) {
        for (int n = 0; n < n_fft_; n++) {
            // k * n reduced mod n_fft keeps the angle precise
            double angle = 2.0 * M_PI * ((static_cast<long>(k) * n) % n_fft_) / n_fft_;
            dft_cos_[static_cast<size_t>(k) * n_fft_ + n] = static_cast<float>(std::cos(angle));
            dft_sin_[static_cast<size_t>(k) * n_fft_ + n] = static_cast<float>(-std::sin(angle));
        }
    }
}

MelFeatures MelSpectrogram::compute(const std::vector<float>& samples) const
{
    MelFeatures features;
    features.n_mels = n_mels_;
    features.n_frames = static_cast<int>(samples.size() / hop_length_);

    if (features.n_frames == 0) {
        return features;
    }

    // Center frames with reflect padding of n_fft / 2 on each side
    const int pad = n_fft_ / 2;
    const int n = static_cast<int>(samples.size());
    auto sample_at = [&](int index) {
        if (n == 1) return samples[0];
        while (index < 0 || index >= n) {
            if (index < 0) index = -index;
            if (index >= n) index = 2 * (n - 1) - index;
        }
        return samples[index];
    };

    features.data.assign(static_cast<size_t>(n_mels_) * features.n_frames, 0.0f);

    std::vector<float> frame(n_fft_);
    std::vector<float> power(n_freqs_);
    float global_max = -std::numeric_limits<float>::infinity();

    for (int t = 0; t < features.n_frames; t++) {
        const int offset = t * hop_length_ - pad;
        for (int i = 0; i < n_fft_; i++) {
            frame[i] = sample_at(offset + i) * hann_window_[i];
        }

        for (int k = 0; k < n_freqs_; k++) {
            const float* c = dft_cos_.data() + static_cast<size_t>(k) * n_fft_;
            const float* s = dft_sin_.data() + static_cast<size_t>(k) * n_fft_;
            float re = 0.0f;
            float im = 0.0f;
            for (int i = 0; i < n_fft_; i++) {
                re += frame[i] * c[i];
                im += frame[i] * s[i];
            }
            power[k] = re * re + im * im;
        }

        for (int m = 0; m < n_mels_; m++) {
            const float* filter = mel_filters_.data() + static_cast<size_t>(m) * n_freqs_;
            float mel_value = 0.0f;
            for (int k = 0; k < n_freqs_; k++) {
                mel_value += filter[k] * power[k];
            }

            float log_mel = std::log10(std::max(mel_value, 1e-10f));
            features.data[static_cast<size_t>(m) * features.n_frames + t] = log_mel;
            global_max = std::max(global_max, log_mel);
        }
    }

    const float floor = global_max - 8.0f;
    for (auto& value : features.data) {
        value = (std::max(value, floor) + 4.0f) / 4.0f;
    }

    return features;
}

} // namespace huginn
