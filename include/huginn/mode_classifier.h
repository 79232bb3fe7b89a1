#pragma once

#include "export.h"
#include "types.h"
#include <vector>

namespace huginn {

/**
 * @brief Thresholds for the single / mixed / hybrid decision
 */
struct LanguageModeOptions {
    float late_ratio = 0.85f;      // Secondary starting at or after this fraction => hybrid
    int min_secondary_hits = 1;    // Samples a secondary needs to count (1 suits 3 probes)
};

/**
 * @brief Decide the language mode of a recording from probe samples
 *
 * - No samples: Single with no primary language.
 * - Primary language is the most frequent sample language; ties go to the
 *   language seen first.
 * - A secondary language is validated when it appears in at least
 *   min_secondary_hits samples. Without validated secondaries: Single.
 * - Hybrid when total_duration > 0 and the earliest validated secondary
 *   sample time divided by total_duration is >= late_ratio, else Mixed.
 *   transition_time is that earliest time in both cases.
 *
 * A single stray misdetection is enough to flag Mixed with the default
 * threshold; raise min_secondary_hits for precision.
 */
HUGINN_API ModeDecision classify_language_mode(
    const std::vector<LanguageSample>& samples,
    float total_duration,
    const LanguageModeOptions& options = {});

} // namespace huginn
