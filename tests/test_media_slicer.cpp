#include "fakes.h"
#include "huginn/media_slicer.h"
#include <gtest/gtest.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <set>

using namespace huginn;
using namespace huginn::testing;

namespace fs = std::filesystem;

namespace {

std::vector<unsigned char> read_bytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<unsigned char>(std::istreambuf_iterator<char>(in), {});
}

uint32_t read_u32(const std::vector<unsigned char>& bytes, size_t offset) {
    return bytes[offset] | (bytes[offset + 1] << 8) | (bytes[offset + 2] << 16) |
           (static_cast<uint32_t>(bytes[offset + 3]) << 24);
}

uint16_t read_u16(const std::vector<unsigned char>& bytes, size_t offset) {
    return static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
}

} // anonymous namespace

TEST(MediaSlicerTest, WavHeaderDescribesPcm16) {
    std::string path = make_temp_audio_path("huginn_wav_test");
    write_wav_file(path, {0.0f, 0.5f, -0.5f, 1.0f, -1.0f, 2.0f}, 16000, 2);

    auto bytes = read_bytes(path);
    ASSERT_EQ(bytes.size(), 44u + 6u * 2u);
    EXPECT_EQ(std::string(bytes.begin(), bytes.begin() + 4), "RIFF");
    EXPECT_EQ(read_u32(bytes, 4), 36u + 12u);
    EXPECT_EQ(std::string(bytes.begin() + 8, bytes.begin() + 12), "WAVE");
    EXPECT_EQ(read_u16(bytes, 20), 1u);           // PCM
    EXPECT_EQ(read_u16(bytes, 22), 2u);           // channels
    EXPECT_EQ(read_u32(bytes, 24), 16000u);       // sample rate
    EXPECT_EQ(read_u32(bytes, 28), 16000u * 4u);  // byte rate
    EXPECT_EQ(read_u16(bytes, 34), 16u);          // bits per sample
    EXPECT_EQ(read_u32(bytes, 40), 12u);          // data size

    // Out-of-range samples are clamped
    EXPECT_EQ(static_cast<int16_t>(read_u16(bytes, 44 + 5 * 2)), 32767);
    EXPECT_EQ(static_cast<int16_t>(read_u16(bytes, 44 + 4 * 2)), -32767);

    fs::remove(path);
}

TEST(MediaSlicerTest, WavRejectsBadFormat) {
    EXPECT_THROW(write_wav_file("unused.wav", {}, 0, 1), std::invalid_argument);
    EXPECT_THROW(write_wav_file("unused.wav", {}, 16000, 0), std::invalid_argument);
    EXPECT_THROW(write_wav_file((fs::temp_directory_path() / "no_such_dir" / "a.wav").string(), {}, 16000, 1),
                 std::runtime_error);
}

TEST(MediaSlicerTest, TempPathsAreUnique) {
    std::set<std::string> paths;
    for (int i = 0; i < 50; ++i) {
        paths.insert(make_temp_audio_path());
    }
    EXPECT_EQ(paths.size(), 50u);
    EXPECT_EQ(fs::path(*paths.begin()).extension(), ".wav");
}

TEST(MediaSlicerTest, TempAudioFileRemovesOnDestruction) {
    std::string path = make_temp_audio_path("huginn_temp_test");
    write_wav_file(path, {0.0f}, 16000);
    ASSERT_TRUE(fs::exists(path));

    {
        TempAudioFile file(path);
        EXPECT_EQ(file.path(), path);
    }

    EXPECT_FALSE(fs::exists(path));
}

TEST(MediaSlicerTest, TempAudioFileMoveTransfersOwnership) {
    std::string path = make_temp_audio_path("huginn_temp_test");
    write_wav_file(path, {0.0f}, 16000);

    TempAudioFile outer;
    EXPECT_TRUE(outer.empty());
    {
        TempAudioFile inner(path);
        outer = std::move(inner);
        EXPECT_TRUE(inner.empty());
    }
    EXPECT_TRUE(fs::exists(path));

    EXPECT_TRUE(outer.remove());
    EXPECT_FALSE(fs::exists(path));
    EXPECT_TRUE(outer.empty());
}

TEST(MediaSlicerTest, MissingTempFileIsNotAnError) {
    TempAudioFile file(make_temp_audio_path("huginn_never_written"));
    EXPECT_TRUE(file.remove());
}

TEST(MediaSlicerTest, DefaultExtractSliceWritesWav) {
    FakeSlicer slicer(10.0f);
    TempAudioFile slice(slicer.extract_slice("source.mp3", 2.0f, 0.5f));

    ASSERT_TRUE(fs::exists(slice.path()));
    EXPECT_EQ(fs::file_size(slice.path()), 44u + 8000u * 2u);
    ASSERT_EQ(slicer.slices.size(), 1u);
    EXPECT_FLOAT_EQ(slicer.slices[0].first, 2.0f);
}

TEST(MediaSlicerTest, TranscribeSliceRemovesTempFileOnEngineFailure) {
    FakeSlicer slicer(10.0f);
    FakeEngine engine(slicer, "source.mp3");
    engine.on_slice = [](float) -> TranscribeResult { throw std::runtime_error("decode"); };

    EXPECT_THROW(transcribe_slice(engine, slicer, "source.mp3", 1.0f, 2.0f,
                                  SliceMode::TempFile, TranscribeOptions()),
                 std::runtime_error);

    ASSERT_EQ(engine.slice_paths.size(), 1u);
    EXPECT_FALSE(fs::exists(engine.slice_paths[0]));
}

TEST(MediaSlicerTest, TranscribeSlicePassesOptionsThrough) {
    FakeSlicer slicer(10.0f);
    FakeEngine engine(slicer, "source.mp3");
    engine.on_slice = languages_by_time({{0.0f, "nl"}});

    TranscribeOptions options;
    options.language = "nl";
    options.beam_size = 2;

    auto result = transcribe_slice(engine, slicer, "source.mp3", 0.0f, 1.0f, SliceMode::InMemory, options);

    EXPECT_EQ(result.language, "nl");
    ASSERT_EQ(engine.options_seen.size(), 1u);
    EXPECT_EQ(engine.options_seen[0].language, "nl");
    EXPECT_EQ(engine.options_seen[0].beam_size, 2);
    EXPECT_EQ(engine.buffer_sizes[0], 16000u);
}
