#include "huginn/audio_extractor.h"
#include <heimdall.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <map>
#include <stdexcept>

namespace huginn {

// =======================
// AudioExtractor::Impl
// =======================

class AudioExtractor::Impl {
public:
    heimdall::Heimdall heimdall;
    static constexpr int WHISPER_SAMPLE_RATE = 16000;

    // Cached file info
    std::string current_file;
    int stream_count = 0;
    int64_t duration_ms = 0;
    bool is_open = false;

    // Decoded track 0 kept for slicing
    std::string cached_path;
    int cached_rate = 0;
    std::vector<float> cached_samples;

    // Decode one stream; empty result when the stream is missing or silent
    std::vector<float> decode_stream(const std::string& path, int sample_rate, int stream_index) {
        std::vector<int> stream_indices = { stream_index };
        auto tracks = heimdall.extract_audio(path, sample_rate, stream_indices, 100);  // Full quality

        auto it = tracks.find(stream_index);
        if (it == tracks.end()) {
            return {};
        }
        return std::move(it->second);
    }

    const std::vector<float>& decoded(const std::string& path, int sample_rate) {
        if (cached_path == path && cached_rate == sample_rate) {
            return cached_samples;
        }

        cached_path.clear();
        cached_samples.clear();

        std::vector<float> samples;
        try {
            samples = decode_stream(path, sample_rate, 0);
        } catch (const std::exception& e) {
            throw std::runtime_error("Failed to decode audio from " + path + ": " + e.what());
        }

        if (samples.empty()) {
            throw std::runtime_error("No audio decoded from " + path);
        }

        std::cout << "[Huginn] Decoded " << samples.size() << " samples ("
                  << (samples.size() / static_cast<float>(sample_rate)) << "s at "
                  << sample_rate << "Hz) for slicing\n";

        cached_samples = std::move(samples);
        cached_path = path;
        cached_rate = sample_rate;
        return cached_samples;
    }
};

AudioExtractor::AudioExtractor()
    : pimpl_(std::make_unique<Impl>())
{
}

AudioExtractor::~AudioExtractor() = default;

bool AudioExtractor::open(const std::string& file_path)
{
    last_error_.clear();

    try {
        auto info = pimpl_->heimdall.get_audio_info(file_path);
        if (info.stream_count <= 0) {
            last_error_ = "No audio tracks in file";
            std::cerr << "[Huginn] " << last_error_ << ": " << file_path << "\n";
            pimpl_->is_open = false;
            return false;
        }

        pimpl_->current_file = file_path;
        pimpl_->stream_count = info.stream_count;
        pimpl_->duration_ms = info.duration_ms;
        pimpl_->is_open = true;

        std::cout << "[Huginn] Opened file with " << pimpl_->stream_count
                  << " audio track(s), duration: " << (pimpl_->duration_ms / 1000.0f) << "s\n";

        return true;
    } catch (const std::exception& e) {
        last_error_ = std::string("Failed to open file: ") + e.what();
        std::cerr << "[Huginn] " << last_error_ << "\n";
        pimpl_->is_open = false;
        return false;
    }
}

void AudioExtractor::close()
{
    pimpl_->is_open = false;
    pimpl_->current_file.clear();
    pimpl_->stream_count = 0;
    pimpl_->duration_ms = 0;
}

int AudioExtractor::get_track_count() const
{
    if (!pimpl_->is_open) return 0;
    return pimpl_->stream_count;
}

float AudioExtractor::get_duration() const
{
    if (!pimpl_->is_open) return 0.0f;
    return static_cast<float>(pimpl_->duration_ms) / 1000.0f;
}

bool AudioExtractor::extract_track(int track_index, std::vector<float>& samples)
{
    last_error_.clear();

    if (!pimpl_->is_open) {
        last_error_ = "No file is open";
        return false;
    }

    if (track_index < 0 || track_index >= pimpl_->stream_count) {
        last_error_ = "Invalid track index: " + std::to_string(track_index);
        return false;
    }

    try {
        auto track = pimpl_->decode_stream(pimpl_->current_file, Impl::WHISPER_SAMPLE_RATE, track_index);
        if (track.empty()) {
            last_error_ = "Failed to extract audio from track " + std::to_string(track_index);
            std::cerr << "[Huginn] " << last_error_ << "\n";
            return false;
        }

        samples = std::move(track);

        std::cout << "[Huginn] Track " << track_index << ": extracted " << samples.size()
                  << " samples (" << (samples.size() / static_cast<float>(Impl::WHISPER_SAMPLE_RATE)) << "s at 16kHz)\n";

        return true;
    } catch (const std::exception& e) {
        last_error_ = std::string("Failed to extract audio: ") + e.what();
        std::cerr << "[Huginn] " << last_error_ << "\n";
        return false;
    }
}

bool AudioExtractor::extract_audio(const std::string& file_path,
                                   std::vector<float>& samples,
                                   float& duration)
{
    if (!open(file_path)) {
        return false;
    }

    duration = get_duration();
    bool ok = extract_track(0, samples);
    close();
    return ok;
}

float AudioExtractor::probe_duration(const std::string& source_path)
{
    heimdall::AudioInfo info{};
    try {
        info = pimpl_->heimdall.get_audio_info(source_path);
    } catch (const std::exception& e) {
        throw std::runtime_error("Failed to probe " + source_path + ": " + e.what());
    }

    if (info.stream_count <= 0) {
        throw std::runtime_error("No audio tracks in file: " + source_path);
    }

    return static_cast<float>(info.duration_ms) / 1000.0f;
}

std::vector<float> AudioExtractor::extract_samples(const std::string& source_path,
                                                   float start,
                                                   float duration,
                                                   int sample_rate,
                                                   int channels)
{
    if (start < 0.0f || duration <= 0.0f) {
        throw std::invalid_argument("Invalid slice: start=" + std::to_string(start) +
                                    "s duration=" + std::to_string(duration) + "s");
    }
    if (sample_rate <= 0 || channels <= 0) {
        throw std::invalid_argument("Invalid slice format: " + std::to_string(sample_rate) +
                                    " Hz, " + std::to_string(channels) + " channel(s)");
    }

    const auto& mono = pimpl_->decoded(source_path, sample_rate);

    size_t first = static_cast<size_t>(std::llround(static_cast<double>(start) * sample_rate));
    if (first >= mono.size()) {
        throw std::runtime_error("Slice start " + std::to_string(start) + "s is past the end of " +
                                 source_path);
    }
    size_t count = static_cast<size_t>(std::llround(static_cast<double>(duration) * sample_rate));
    size_t last = std::min(mono.size(), first + count);

    if (channels == 1) {
        return std::vector<float>(mono.begin() + first, mono.begin() + last);
    }

    // Heimdall decodes mono; upmix by duplication
    std::vector<float> interleaved;
    interleaved.reserve((last - first) * channels);
    for (size_t i = first; i < last; ++i) {
        for (int c = 0; c < channels; ++c) {
            interleaved.push_back(mono[i]);
        }
    }
    return interleaved;
}

void AudioExtractor::clear_cache()
{
    pimpl_->cached_path.clear();
    pimpl_->cached_rate = 0;
    pimpl_->cached_samples.clear();
    pimpl_->cached_samples.shrink_to_fit();
}

} // namespace huginn
