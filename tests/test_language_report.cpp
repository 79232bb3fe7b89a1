#include "huginn/language_report.h"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>

using namespace huginn;

namespace fs = std::filesystem;

namespace {

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

// Well-formed UTF-8 sequences only (no truncated or stray continuation bytes)
bool is_valid_utf8(const std::string& text) {
    size_t i = 0;
    while (i < text.size()) {
        unsigned char lead = static_cast<unsigned char>(text[i]);
        size_t length = 1;
        if (lead >= 0xF0 && lead <= 0xF4) length = 4;
        else if (lead >= 0xE0) length = 3;
        else if (lead >= 0xC2 && lead <= 0xDF) length = 2;
        else if (lead >= 0x80) return false;

        if (i + length > text.size()) {
            return false;
        }
        for (size_t k = 1; k < length; ++k) {
            if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
                return false;
            }
        }
        i += length;
    }
    return true;
}

// 121 bytes: one ASCII byte then 60 two-byte Cyrillic letters
std::string long_cyrillic_text() {
    std::string text = "a";
    for (int i = 0; i < 60; ++i) {
        text += "\xD0\xB4";
    }
    return text;
}

MultilangResult sample_result() {
    MultilangResult result;
    result.classification.mode = LanguageMode::Mixed;
    result.classification.primary_language = "en";
    result.classification.secondary_languages = {"es"};
    result.classification.transition_time = 75.0f;
    result.transcription.language = "en";

    Segment seg;
    seg.start = 0.0f;
    seg.end = 60.0f;
    seg.text = "Welcome \"everyone\"";
    result.transcription.segments.push_back(seg);

    result.language_segments = {
        {"en", 0.0f, 60.0f, "Welcome everyone"},
        {"es", 60.0f, 125.0f, "Bienvenidos"},
    };
    result.timeline = create_language_timeline(result.language_segments);
    return result;
}

} // anonymous namespace

TEST(LanguageReportTest, LanguageNames) {
    EXPECT_EQ(language_name("en"), "English");
    EXPECT_EQ(language_name("es"), "Spanish");
    EXPECT_EQ(language_name("uk"), "Ukrainian");
    EXPECT_EQ(language_name(UNKNOWN_LANGUAGE), "Unknown");
    EXPECT_EQ(language_name("haw"), "HAW");
}

TEST(LanguageReportTest, ReadableTimestamps) {
    EXPECT_EQ(format_timestamp_readable(0.0f), "00:00");
    EXPECT_EQ(format_timestamp_readable(65.9f), "01:05");
    EXPECT_EQ(format_timestamp_readable(3600.0f), "60:00");
    EXPECT_EQ(format_timestamp_readable(-3.0f), "00:00");
}

TEST(LanguageReportTest, TimelineHasOneLinePerSpan) {
    std::vector<LanguageSegment> spans = {
        {"en", 0.0f, 65.0f, "a"},
        {"unknown", 65.0f, 70.0f, "b"},
        {"ja", 70.0f, 130.5f, "c"},
    };

    EXPECT_EQ(create_language_timeline(spans),
              "[00:00 - 01:05] Language: English (EN)\n"
              "[01:05 - 01:10] Language: Unknown (UNKNOWN)\n"
              "[01:10 - 02:10] Language: Japanese (JA)");
    EXPECT_EQ(create_language_timeline({}), "");
}

TEST(LanguageReportTest, StatsKeepFirstAppearanceOrder) {
    std::vector<LanguageSegment> spans = {
        {"es", 0.0f, 10.0f, ""},
        {"en", 10.0f, 40.0f, ""},
        {"es", 40.0f, 50.0f, ""},
        {"en", 50.0f, 60.0f, ""},
    };

    auto stats = calculate_language_stats(spans);

    ASSERT_EQ(stats.size(), 2u);
    EXPECT_EQ(stats[0].language, "es");
    EXPECT_EQ(stats[0].language_name, "Spanish");
    EXPECT_EQ(stats[0].segment_count, 2);
    EXPECT_FLOAT_EQ(stats[0].total_duration, 20.0f);
    EXPECT_FLOAT_EQ(stats[0].percentage_by_count, 50.0f);
    EXPECT_NEAR(stats[0].percentage_by_duration, 100.0f / 3.0f, 1e-3f);
    EXPECT_EQ(stats[1].language, "en");
    EXPECT_NEAR(stats[1].percentage_by_duration, 200.0f / 3.0f, 1e-3f);
}

TEST(LanguageReportTest, StatsOfZeroLengthSpansHaveNoDurationShare) {
    auto stats = calculate_language_stats({{"en", 5.0f, 5.0f, ""}});

    ASSERT_EQ(stats.size(), 1u);
    EXPECT_FLOAT_EQ(stats[0].percentage_by_count, 100.0f);
    EXPECT_FLOAT_EQ(stats[0].percentage_by_duration, 0.0f);
    EXPECT_TRUE(calculate_language_stats({}).empty());
}

TEST(LanguageReportTest, ReportSummarizesClassificationAndSpans) {
    auto report = format_multilang_report(sample_result());

    EXPECT_NE(report.find("MULTI-LANGUAGE TRANSCRIPTION REPORT"), std::string::npos);
    EXPECT_NE(report.find("Primary Language: EN"), std::string::npos);
    EXPECT_NE(report.find("Language Mode: mixed"), std::string::npos);
    EXPECT_NE(report.find("Secondary Languages: ES"), std::string::npos);
    EXPECT_NE(report.find("Transition: 01:15"), std::string::npos);
    EXPECT_NE(report.find("Language Segments Detected: 2"), std::string::npos);
    EXPECT_NE(report.find("Segment 2: ES [01:00 - 02:05]"), std::string::npos);
    EXPECT_NE(report.find("[01:00 - 02:05] Language: Spanish (ES)"), std::string::npos);
    EXPECT_EQ(report.find("cancelled"), std::string::npos);
}

TEST(LanguageReportTest, ReportMentionsCancellation) {
    auto result = sample_result();
    result.cancelled = true;

    EXPECT_NE(format_multilang_report(result).find("cancelled"), std::string::npos);
}

TEST(LanguageReportTest, DiagnosticsFileContainsBothStages) {
    fs::path dir = fs::temp_directory_path() / "huginn_report_diagnostics";
    fs::remove_all(dir);

    auto result = sample_result();
    std::vector<LanguageSegment> raw = {
        {"en", 0.0f, 30.0f, "Welcome"},
        {"en", 30.0f, 60.0f, "everyone"},
        {"es", 60.0f, 125.0f, "Bienvenidos"},
    };

    std::string path = save_diagnostics_json(result, "/media/talk.mkv", raw, dir.string());

    EXPECT_EQ(fs::path(path), dir / "talk_diagnostics.json");
    std::string json = read_file(path);
    EXPECT_NE(json.find("\"audio_file\": \"/media/talk.mkv\""), std::string::npos);
    EXPECT_NE(json.find("\"detected_language\": \"en\""), std::string::npos);
    EXPECT_NE(json.find("\"segments_merged\": 1"), std::string::npos);
    EXPECT_NE(json.find("Welcome \\\"everyone\\\""), std::string::npos);
    EXPECT_NE(json.find("\"raw_segments\": ["), std::string::npos);
    EXPECT_NE(json.find("\"merged_segments\": ["), std::string::npos);

    fs::remove_all(dir);
}

TEST(LanguageReportTest, TruncateUtf8KeepsWholeCharacters) {
    EXPECT_EQ(truncate_utf8("hello world", 5), "hello");
    EXPECT_EQ(truncate_utf8("short", 100), "short");
    EXPECT_EQ(truncate_utf8("a\xD0\xB4", 2), "a");
    EXPECT_EQ(truncate_utf8("a\xD0\xB4", 3), "a\xD0\xB4");
    // Three-byte sequence cut in the middle
    EXPECT_EQ(truncate_utf8("\xE2\x82\xAC\xE2\x82\xAC", 5), "\xE2\x82\xAC");

    std::string cut = truncate_utf8(long_cyrillic_text(), 100);
    EXPECT_EQ(cut.size(), 99u);
    EXPECT_TRUE(is_valid_utf8(cut));
}

TEST(LanguageReportTest, DiagnosticsStayValidUtf8ForLongCyrillicSegment) {
    fs::path dir = fs::temp_directory_path() / "huginn_report_cyrillic";
    fs::remove_all(dir);

    auto result = sample_result();
    result.transcription.segments[0].text = long_cyrillic_text();
    ASSERT_EQ(result.transcription.segments[0].text.size(), 121u);

    std::string path = save_diagnostics_json(result, "lecture.wav", {}, dir.string());
    std::ifstream in(path, std::ios::binary);
    std::string json((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    EXPECT_TRUE(is_valid_utf8(json));
    EXPECT_NE(json.find(truncate_utf8(long_cyrillic_text(), 100) + "\""), std::string::npos);

    fs::remove_all(dir);
}

TEST(LanguageReportTest, ReportStaysValidUtf8ForLongCyrillicSpan) {
    auto result = sample_result();
    result.language_segments[1] = {"ru", 60.0f, 125.0f, long_cyrillic_text()};

    auto report = format_multilang_report(result);

    EXPECT_TRUE(is_valid_utf8(report));
    EXPECT_NE(report.find(truncate_utf8(long_cyrillic_text(), 100) + "..."), std::string::npos);
}

TEST(LanguageReportTest, DiagnosticsFailsForUnwritableDirectory) {
    fs::path blocker = fs::temp_directory_path() / "huginn_report_blocker";
    {
        std::ofstream out(blocker);
        out << "not a directory";
    }

    EXPECT_THROW(save_diagnostics_json(sample_result(), "a.wav", {}, (blocker / "sub").string()),
                 std::runtime_error);
    fs::remove(blocker);
}

TEST(LanguageReportTest, QualityScore) {
    EXPECT_FLOAT_EQ(calculate_quality_score({}), 0.0f);

    Segment clear;
    clear.start = 0.0f;
    clear.end = 3.0f;
    clear.text = "A full sentence.";
    clear.no_speech_prob = 0.1f;

    Segment blip;
    blip.start = 3.0f;
    blip.end = 3.2f;
    blip.text = " a";
    blip.no_speech_prob = 0.0f;

    EXPECT_NEAR(calculate_quality_score({clear}), 0.9f, 1e-5f);
    EXPECT_NEAR(calculate_quality_score({clear, blip}), (0.9f + 0.5f) / 2.0f, 1e-5f);
}
