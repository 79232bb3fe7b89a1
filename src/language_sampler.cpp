#include "huginn/language_sampler.h"
#include <algorithm>
#include <exception>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace huginn {

LanguageSampler::LanguageSampler(TranscriptionEngine& engine,
                                 MediaSlicer& slicer,
                                 LanguageSamplingOptions options)
    : engine_(engine)
    , slicer_(slicer)
    , options_(std::move(options))
{
}

std::vector<float> LanguageSampler::probe_times(float total_duration,
                                                const LanguageSamplingOptions& options)
{
    if (total_duration <= 0.0f) {
        return {0.0f};
    }

    const float window = options.sample_window;
    const float candidates[] = {
        std::min(2.0f, total_duration * 0.05f),
        total_duration / 2.0f,
        std::max(total_duration - window - 2.0f, total_duration * 0.95f)
    };

    std::vector<float> points;
    for (float t : candidates) {
        if (t >= 0.0f && t < total_duration - window) {
            points.push_back(t);
        }
    }

    if (options.max_samples > 0 && points.size() > static_cast<size_t>(options.max_samples)) {
        points.resize(options.max_samples);
    }

    if (points.empty()) {
        points.push_back(0.0f);
    }
    return points;
}

SamplingResult LanguageSampler::sample_languages(const std::string& audio_path,
                                                 const ProgressCallback& progress_callback,
                                                 const std::atomic<bool>* cancel)
{
    SamplingResult result;

    try {
        result.total_duration = slicer_.probe_duration(audio_path);
    } catch (const std::exception& e) {
        std::cerr << "[Huginn] WARNING: Duration probe failed: " << e.what()
                  << "; falling back to single sample\n";
        result.total_duration = 0.0f;
    }
    if (result.total_duration < 0.0f) {
        result.total_duration = 0.0f;
    }

    auto points = probe_times(result.total_duration, options_);

    TranscribeOptions detect_options;
    detect_options.language = AUTO_LANGUAGE;
    detect_options.word_timestamps = false;

    for (size_t idx = 0; idx < points.size(); ++idx) {
        if (cancel && cancel->load()) {
            std::cout << "[Huginn] Language sampling cancelled\n";
            break;
        }

        const float start_time = points[idx];
        float window = options_.sample_window;
        if (result.total_duration > 0.0f) {
            window = std::min(window, result.total_duration - start_time);
        }

        if (progress_callback) {
            std::ostringstream msg;
            msg << "Language sampling " << (idx + 1) << "/" << points.size()
                << " @ " << std::fixed << std::setprecision(0) << start_time << "s";
            progress_callback(msg.str(), 100.0f * static_cast<float>(idx) / points.size());
        }

        try {
            auto r = transcribe_slice(engine_, slicer_, audio_path, start_time, window,
                                      options_.slice_mode, detect_options);
            std::string lang = restrict_language(r.language, options_.allowed_languages);
            result.samples.emplace_back(start_time, lang);
            std::cout << "[Huginn] Sample " << (idx + 1) << ": t=" << std::fixed
                      << std::setprecision(1) << start_time << "s lang=" << lang << "\n";
        } catch (const std::exception& e) {
            std::cerr << "[Huginn] WARNING: Sample failed at " << std::fixed
                      << std::setprecision(1) << start_time << "s: " << e.what() << "\n";
        }
    }

    std::cout << "[Huginn] Language sampling complete: " << result.samples.size()
              << "/" << points.size() << " samples, duration " << result.total_duration << "s\n";

    return result;
}

} // namespace huginn
