#include "huginn/mode_classifier.h"
#include <gtest/gtest.h>

using huginn::classify_language_mode;
using huginn::LanguageMode;
using huginn::LanguageModeOptions;
using huginn::LanguageSample;

TEST(ModeClassifierTest, NoSamplesIsSingleWithoutPrimary) {
    auto decision = classify_language_mode({}, 120.0f);

    EXPECT_EQ(decision.mode, LanguageMode::Single);
    EXPECT_FALSE(decision.primary_language.has_value());
    EXPECT_TRUE(decision.secondary_languages.empty());
    EXPECT_FALSE(decision.transition_time.has_value());
}

TEST(ModeClassifierTest, OneLanguageIsSingle) {
    auto decision = classify_language_mode({{2.0f, "en"}, {100.0f, "en"}, {194.0f, "en"}}, 200.0f);

    EXPECT_EQ(decision.mode, LanguageMode::Single);
    ASSERT_TRUE(decision.primary_language.has_value());
    EXPECT_EQ(*decision.primary_language, "en");
    EXPECT_TRUE(decision.secondary_languages.empty());
    EXPECT_FALSE(decision.transition_time.has_value());
}

TEST(ModeClassifierTest, EarlySecondaryIsMixed) {
    auto decision = classify_language_mode({{2.0f, "en"}, {100.0f, "es"}, {194.0f, "en"}}, 200.0f);

    EXPECT_EQ(decision.mode, LanguageMode::Mixed);
    EXPECT_EQ(*decision.primary_language, "en");
    ASSERT_EQ(decision.secondary_languages.size(), 1u);
    EXPECT_EQ(decision.secondary_languages[0], "es");
    ASSERT_TRUE(decision.transition_time.has_value());
    EXPECT_FLOAT_EQ(*decision.transition_time, 100.0f);
}

TEST(ModeClassifierTest, LateSecondaryIsHybrid) {
    auto decision = classify_language_mode({{2.0f, "en"}, {100.0f, "en"}, {194.0f, "es"}}, 200.0f);

    EXPECT_EQ(decision.mode, LanguageMode::Hybrid);
    EXPECT_FLOAT_EQ(*decision.transition_time, 194.0f);
}

TEST(ModeClassifierTest, LateRatioBoundaryIsInclusive) {
    LanguageModeOptions options;
    options.late_ratio = 0.5f;

    auto decision = classify_language_mode({{0.0f, "en"}, {10.0f, "en"}, {50.0f, "de"}}, 100.0f, options);

    EXPECT_EQ(decision.mode, LanguageMode::Hybrid);
}

TEST(ModeClassifierTest, TieGoesToFirstSeenLanguage) {
    auto decision = classify_language_mode({{2.0f, "es"}, {100.0f, "en"}}, 200.0f);

    EXPECT_EQ(*decision.primary_language, "es");
    ASSERT_EQ(decision.secondary_languages.size(), 1u);
    EXPECT_EQ(decision.secondary_languages[0], "en");
    EXPECT_EQ(decision.mode, LanguageMode::Mixed);
}

TEST(ModeClassifierTest, MostFrequentLanguageIsPrimary) {
    auto decision = classify_language_mode({{2.0f, "en"}, {100.0f, "fr"}, {194.0f, "fr"}}, 200.0f);

    EXPECT_EQ(*decision.primary_language, "fr");
    EXPECT_EQ(decision.secondary_languages, std::vector<std::string>{"en"});
    EXPECT_FLOAT_EQ(*decision.transition_time, 2.0f);
    EXPECT_EQ(decision.mode, LanguageMode::Mixed);
}

TEST(ModeClassifierTest, SecondaryBelowMinimumHitsIsIgnored) {
    LanguageModeOptions options;
    options.min_secondary_hits = 2;

    auto decision = classify_language_mode({{2.0f, "en"}, {100.0f, "es"}, {194.0f, "en"}}, 200.0f, options);

    EXPECT_EQ(decision.mode, LanguageMode::Single);
    EXPECT_TRUE(decision.secondary_languages.empty());
    EXPECT_FALSE(decision.transition_time.has_value());
}

TEST(ModeClassifierTest, UnknownDurationNeverGivesHybrid) {
    auto decision = classify_language_mode({{0.0f, "en"}, {0.0f, "ja"}}, 0.0f);

    EXPECT_EQ(decision.mode, LanguageMode::Mixed);
}

TEST(ModeClassifierTest, TransitionIsEarliestAmongSecondaries) {
    auto decision = classify_language_mode(
        {{2.0f, "en"}, {50.0f, "en"}, {100.0f, "de"}, {150.0f, "fr"}, {180.0f, "en"}}, 200.0f);

    EXPECT_EQ(decision.secondary_languages.size(), 2u);
    EXPECT_FLOAT_EQ(*decision.transition_time, 100.0f);
}

TEST(ModeClassifierTest, ModeNames) {
    EXPECT_EQ(huginn::to_string(LanguageMode::Single), "single");
    EXPECT_EQ(huginn::to_string(LanguageMode::Mixed), "mixed");
    EXPECT_EQ(huginn::to_string(LanguageMode::Hybrid), "hybrid");
}
