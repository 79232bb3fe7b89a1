#include "huginn/media_slicer.h"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace huginn {

namespace {

void write_u32(std::ofstream& out, uint32_t value) {
    const unsigned char bytes[4] = {
        static_cast<unsigned char>(value & 0xFF),
        static_cast<unsigned char>((value >> 8) & 0xFF),
        static_cast<unsigned char>((value >> 16) & 0xFF),
        static_cast<unsigned char>((value >> 24) & 0xFF)
    };
    out.write(reinterpret_cast<const char*>(bytes), 4);
}

void write_u16(std::ofstream& out, uint16_t value) {
    const unsigned char bytes[2] = {
        static_cast<unsigned char>(value & 0xFF),
        static_cast<unsigned char>((value >> 8) & 0xFF)
    };
    out.write(reinterpret_cast<const char*>(bytes), 2);
}

} // anonymous namespace

// =======================
// MediaSlicer
// =======================

std::string MediaSlicer::extract_slice(const std::string& source_path,
                                       float start,
                                       float duration,
                                       int sample_rate,
                                       int channels)
{
    auto samples = extract_samples(source_path, start, duration, sample_rate, channels);

    std::string path = make_temp_audio_path();
    try {
        write_wav_file(path, samples, sample_rate, channels);
    } catch (const std::exception&) {
        TempAudioFile partial(path);
        throw;
    }
    return path;
}

// =======================
// TempAudioFile
// =======================

TempAudioFile::TempAudioFile(std::string path)
    : path_(std::move(path))
{
}

TempAudioFile::~TempAudioFile()
{
    remove();
}

TempAudioFile::TempAudioFile(TempAudioFile&& other) noexcept
    : path_(std::move(other.path_))
{
    other.path_.clear();
}

TempAudioFile& TempAudioFile::operator=(TempAudioFile&& other) noexcept
{
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

bool TempAudioFile::remove()
{
    if (path_.empty()) {
        return true;
    }

    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        std::cerr << "[Huginn] WARNING: Failed to clean up temp file " << path_
                  << ": " << ec.message() << "\n";
        path_.clear();
        return false;
    }

    path_.clear();
    return true;
}

std::string make_temp_audio_path(const std::string& prefix)
{
    static std::atomic<unsigned long> counter{0};
    static const unsigned long session = std::random_device{}();

    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = std::filesystem::current_path();
    }

    std::ostringstream name;
    name << prefix << "_" << std::hex << session << "_" << std::dec << counter++ << ".wav";
    return (dir / name.str()).string();
}

// =======================
// WAV writer
// =======================

void write_wav_file(const std::string& path,
                    const std::vector<float>& samples,
                    int sample_rate,
                    int channels)
{
    if (sample_rate <= 0 || channels <= 0) {
        throw std::invalid_argument("Invalid WAV format: " + std::to_string(sample_rate) +
                                    " Hz, " + std::to_string(channels) + " channel(s)");
    }

    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to create WAV file: " + path);
    }

    const uint16_t bits_per_sample = 16;
    const uint16_t block_align = static_cast<uint16_t>(channels * bits_per_sample / 8);
    const uint32_t byte_rate = static_cast<uint32_t>(sample_rate) * block_align;
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));

    // RIFF header
    out.write("RIFF", 4);
    write_u32(out, 36 + data_size);
    out.write("WAVE", 4);

    // fmt chunk (PCM)
    out.write("fmt ", 4);
    write_u32(out, 16);
    write_u16(out, 1);
    write_u16(out, static_cast<uint16_t>(channels));
    write_u32(out, static_cast<uint32_t>(sample_rate));
    write_u32(out, byte_rate);
    write_u16(out, block_align);
    write_u16(out, bits_per_sample);

    // data chunk
    out.write("data", 4);
    write_u32(out, data_size);
    for (float s : samples) {
        float clamped = std::max(-1.0f, std::min(1.0f, s));
        auto pcm = static_cast<int16_t>(clamped * 32767.0f);
        write_u16(out, static_cast<uint16_t>(pcm));
    }

    out.close();
    if (!out) {
        throw std::runtime_error("Failed to write WAV file: " + path);
    }
}

// =======================
// Slice transcription
// =======================

TranscribeResult transcribe_slice(TranscriptionEngine& engine,
                                  MediaSlicer& slicer,
                                  const std::string& source_path,
                                  float start,
                                  float duration,
                                  SliceMode mode,
                                  const TranscribeOptions& options,
                                  int sample_rate,
                                  int channels)
{
    if (mode == SliceMode::InMemory) {
        auto samples = slicer.extract_samples(source_path, start, duration, sample_rate, 1);
        return engine.transcribe(samples, sample_rate, options);
    }

    TempAudioFile slice(slicer.extract_slice(source_path, start, duration, sample_rate, channels));
    return engine.transcribe(slice.path(), options);
}

} // namespace huginn
