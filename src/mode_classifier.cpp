#include "huginn/mode_classifier.h"
#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

namespace huginn {

std::string to_string(LanguageMode mode)
{
    switch (mode) {
        case LanguageMode::Single: return "single";
        case LanguageMode::Mixed: return "mixed";
        case LanguageMode::Hybrid: return "hybrid";
    }
    return "single";
}

std::string restrict_language(const std::string& detected,
                              const std::vector<std::string>& allowed_languages)
{
    if (detected.empty()) {
        return UNKNOWN_LANGUAGE;
    }
    if (allowed_languages.empty()) {
        return detected;
    }
    bool allowed = std::find(allowed_languages.begin(), allowed_languages.end(), detected)
        != allowed_languages.end();
    return allowed ? detected : UNKNOWN_LANGUAGE;
}

ModeDecision classify_language_mode(const std::vector<LanguageSample>& samples,
                                    float total_duration,
                                    const LanguageModeOptions& options)
{
    ModeDecision decision;
    if (samples.empty()) {
        return decision;
    }

    // Tally in first-seen order so ties resolve to the earliest language
    std::vector<std::pair<std::string, int>> counts;
    for (const auto& sample : samples) {
        auto it = std::find_if(counts.begin(), counts.end(),
            [&](const auto& entry) { return entry.first == sample.language; });
        if (it == counts.end()) {
            counts.emplace_back(sample.language, 1);
        } else {
            it->second++;
        }
    }

    auto primary = counts.begin();
    for (auto it = counts.begin(); it != counts.end(); ++it) {
        if (it->second > primary->second) {
            primary = it;
        }
    }
    decision.primary_language = primary->first;

    std::optional<float> earliest_secondary;
    for (const auto& [language, hits] : counts) {
        if (language == *decision.primary_language) continue;
        if (hits < options.min_secondary_hits) continue;

        decision.secondary_languages.push_back(language);
        for (const auto& sample : samples) {
            if (sample.language != language) continue;
            if (!earliest_secondary || sample.time < *earliest_secondary) {
                earliest_secondary = sample.time;
            }
        }
    }

    if (decision.secondary_languages.empty()) {
        return decision;
    }

    decision.transition_time = earliest_secondary;
    if (total_duration > 0.0f && *earliest_secondary / total_duration >= options.late_ratio) {
        decision.mode = LanguageMode::Hybrid;
    } else {
        decision.mode = LanguageMode::Mixed;
    }

    std::cout << "[Huginn] Language mode: " << to_string(decision.mode)
              << " | primary=" << *decision.primary_language
              << " secondary=" << decision.secondary_languages.size()
              << " transition=" << *decision.transition_time << "s\n";

    return decision;
}

} // namespace huginn
