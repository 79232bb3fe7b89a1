#include "fakes.h"
#include "huginn/segment_retranscriber.h"
#include <gtest/gtest.h>
#include <filesystem>

using namespace huginn;
using namespace huginn::testing;

namespace {

const std::string kSource = "meeting.wav";

class SegmentRetranscriberTest : public ::testing::Test {
protected:
    SegmentRetranscriberTest() : slicer(200.0f), engine(slicer, kSource) {
        engine.on_slice = languages_by_time({{0.0f, "en"}, {10.0f, "es"}});
    }

    FakeSlicer slicer;
    FakeEngine engine;
};

} // anonymous namespace

TEST_F(SegmentRetranscriberTest, MergesPerSegmentLanguages) {
    std::vector<Segment> coarse = {
        make_segment(0.0f, 5.0f, "hello"),
        make_segment(5.0f, 10.0f, "there"),
        make_segment(10.0f, 15.0f, "hola"),
        make_segment(15.0f, 20.0f, "amigo"),
    };

    SegmentRetranscriber retranscriber(engine, slicer);
    auto spans = retranscriber.retranscribe_segments(kSource, coarse);

    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].language, "en");
    EXPECT_FLOAT_EQ(spans[0].start, 0.0f);
    EXPECT_FLOAT_EQ(spans[0].end, 10.0f);
    EXPECT_EQ(spans[0].text, "en@0 en@5");
    EXPECT_EQ(spans[1].language, "es");
    EXPECT_FLOAT_EQ(spans[1].start, 10.0f);
    EXPECT_FLOAT_EQ(spans[1].end, 20.0f);
    EXPECT_EQ(spans[1].text, "es@10 es@15");

    EXPECT_EQ(retranscriber.raw_segments().size(), 4u);
    EXPECT_EQ(retranscriber.degraded_count(), 0);
    EXPECT_FALSE(retranscriber.was_cancelled());
}

TEST_F(SegmentRetranscriberTest, SlicesMatchCoarseBoundaries) {
    std::vector<Segment> coarse = {
        make_segment(1.5f, 4.0f, "a"),
        make_segment(4.0f, 9.25f, "b"),
    };

    SegmentRetranscriber retranscriber(engine, slicer);
    retranscriber.retranscribe_segments(kSource, coarse);

    ASSERT_EQ(slicer.slices.size(), 2u);
    EXPECT_FLOAT_EQ(slicer.slices[0].first, 1.5f);
    EXPECT_FLOAT_EQ(slicer.slices[0].second, 2.5f);
    EXPECT_FLOAT_EQ(slicer.slices[1].first, 4.0f);
    EXPECT_FLOAT_EQ(slicer.slices[1].second, 5.25f);
    EXPECT_EQ(slicer.last_source, kSource);

    for (const auto& options : engine.options_seen) {
        EXPECT_EQ(options.language, AUTO_LANGUAGE);
    }
    for (const auto& path : engine.slice_paths) {
        EXPECT_FALSE(std::filesystem::exists(path));
    }
}

TEST_F(SegmentRetranscriberTest, SkipsSegmentsShorterThanMinimum) {
    std::vector<Segment> coarse = {
        make_segment(0.0f, 5.0f, "hello"),
        make_segment(5.0f, 5.05f, "uh"),
        make_segment(5.05f, 9.0f, "world"),
    };

    SegmentRetranscriber retranscriber(engine, slicer);
    auto spans = retranscriber.retranscribe_segments(kSource, coarse);

    EXPECT_EQ(slicer.slices.size(), 2u);
    EXPECT_EQ(retranscriber.raw_segments().size(), 2u);
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_FLOAT_EQ(spans[0].end, 9.0f);
}

TEST_F(SegmentRetranscriberTest, FailedSliceDegradesToUnknownWithCoarseText) {
    slicer.fail_starts.insert(5.0f);
    std::vector<Segment> coarse = {
        make_segment(0.0f, 5.0f, "hello"),
        make_segment(5.0f, 7.0f, "  lost words "),
        make_segment(7.0f, 9.0f, "again"),
    };

    SegmentRetranscriber retranscriber(engine, slicer);
    auto spans = retranscriber.retranscribe_segments(kSource, coarse);

    EXPECT_EQ(retranscriber.degraded_count(), 1);
    ASSERT_EQ(spans.size(), 3u);
    EXPECT_EQ(spans[0].language, "en");
    EXPECT_EQ(spans[1].language, UNKNOWN_LANGUAGE);
    EXPECT_EQ(spans[1].text, "lost words");
    EXPECT_FLOAT_EQ(spans[1].start, 5.0f);
    EXPECT_FLOAT_EQ(spans[1].end, 7.0f);
    EXPECT_EQ(spans[2].language, "en");
}

TEST_F(SegmentRetranscriberTest, RetranscribeChunkReportsFailureWithoutThrowing) {
    engine.on_slice = [](float) -> TranscribeResult { throw std::runtime_error("model exploded"); };

    SegmentRetranscriber retranscriber(engine, slicer);
    ChunkOutcome outcome;
    EXPECT_NO_THROW(outcome = retranscriber.retranscribe_chunk(kSource, make_segment(3.0f, 6.0f, "text")));

    EXPECT_TRUE(outcome.degraded());
    EXPECT_EQ(outcome.error, "model exploded");
    EXPECT_EQ(outcome.segment.language, UNKNOWN_LANGUAGE);
    EXPECT_EQ(outcome.segment.text, "text");
}

TEST_F(SegmentRetranscriberTest, RetranscribeChunkTrimsText) {
    SegmentRetranscriber retranscriber(engine, slicer);
    auto outcome = retranscriber.retranscribe_chunk(kSource, make_segment(12.0f, 14.0f, "coarse"));

    EXPECT_FALSE(outcome.degraded());
    EXPECT_EQ(outcome.segment.language, "es");
    EXPECT_EQ(outcome.segment.text, "es@12");
    EXPECT_FLOAT_EQ(outcome.segment.start, 12.0f);
    EXPECT_FLOAT_EQ(outcome.segment.end, 14.0f);
}

TEST_F(SegmentRetranscriberTest, RetranscribeChunkMapsDisallowedLanguageToUnknown) {
    RetranscribeOptions options;
    options.allowed_languages = {"en", "fr"};

    SegmentRetranscriber retranscriber(engine, slicer, options);
    auto outcome = retranscriber.retranscribe_chunk(kSource, make_segment(12.0f, 14.0f, "coarse"));

    EXPECT_FALSE(outcome.degraded());
    EXPECT_EQ(outcome.segment.language, UNKNOWN_LANGUAGE);
    EXPECT_EQ(outcome.segment.text, "es@12");
}

TEST_F(SegmentRetranscriberTest, AllowedLanguagesKeepMatchingSpans) {
    RetranscribeOptions options;
    options.allowed_languages = {"en"};

    std::vector<Segment> coarse = {
        make_segment(0.0f, 5.0f, "hello"),
        make_segment(10.0f, 15.0f, "hola"),
    };

    SegmentRetranscriber retranscriber(engine, slicer, options);
    auto spans = retranscriber.retranscribe_segments(kSource, coarse);

    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].language, "en");
    EXPECT_EQ(spans[1].language, UNKNOWN_LANGUAGE);
    EXPECT_EQ(spans[1].text, "es@10");
}

TEST_F(SegmentRetranscriberTest, ReportsProgressEveryInterval) {
    std::vector<Segment> coarse;
    for (int i = 0; i < 12; ++i) {
        coarse.push_back(make_segment(i * 2.0f, i * 2.0f + 2.0f, "x"));
    }

    std::vector<std::string> messages;
    std::vector<float> percents;
    SegmentRetranscriber retranscriber(engine, slicer);
    retranscriber.retranscribe_segments(kSource, coarse,
        [&](const std::string& message, std::optional<float> percent) {
            messages.push_back(message);
            percents.push_back(percent.value_or(-1.0f));
        });

    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0], "Language detection: 1/12 segments");
    EXPECT_EQ(messages[1], "Language detection: 6/12 segments");
    EXPECT_EQ(messages[2], "Language detection: 11/12 segments");
    EXPECT_FLOAT_EQ(percents[0], 0.0f);
    EXPECT_NEAR(percents[1], 100.0f * 5.0f / 12.0f, 1e-3f);
}

TEST_F(SegmentRetranscriberTest, CancellationKeepsProcessedSegments) {
    std::vector<Segment> coarse;
    for (int i = 0; i < 6; ++i) {
        coarse.push_back(make_segment(i * 2.0f, i * 2.0f + 2.0f, "x"));
    }

    std::atomic<bool> cancel{false};
    auto script = languages_by_time({{0.0f, "en"}});
    engine.on_slice = [&](float start) {
        if (start >= 2.0f) cancel.store(true);
        return script(start);
    };

    SegmentRetranscriber retranscriber(engine, slicer);
    auto spans = retranscriber.retranscribe_segments(kSource, coarse, nullptr, &cancel);

    EXPECT_TRUE(retranscriber.was_cancelled());
    EXPECT_EQ(retranscriber.raw_segments().size(), 2u);
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_FLOAT_EQ(spans[0].end, 4.0f);
}

TEST_F(SegmentRetranscriberTest, NoCoarseSegmentsGiveNoSpans) {
    SegmentRetranscriber retranscriber(engine, slicer);

    EXPECT_TRUE(retranscriber.retranscribe_segments(kSource, {}).empty());
    EXPECT_TRUE(slicer.slices.empty());
}

TEST_F(SegmentRetranscriberTest, InMemoryModeUsesMonoBuffers) {
    RetranscribeOptions options;
    options.slice_mode = SliceMode::InMemory;
    options.channels = 2;

    SegmentRetranscriber retranscriber(engine, slicer, options);
    retranscriber.retranscribe_segments(kSource, {make_segment(0.0f, 1.0f, "a")});

    ASSERT_EQ(engine.buffer_sizes.size(), 1u);
    EXPECT_EQ(engine.buffer_sizes[0], 16000u);
    EXPECT_TRUE(engine.slice_paths.empty());
}
