#pragma once

#include "export.h"
#include "types.h"
#include <vector>

namespace huginn {

/**
 * @brief Coalesce consecutive segments that share a language
 *
 * Segments must be in chronological order. Each output span starts at its
 * first constituent, ends at its last constituent, and carries the
 * constituent texts joined by single spaces. No two adjacent output spans
 * share a language, so merging the output again is a no-op.
 *
 * @param segments Language segments in chronological order
 * @return Merged spans (empty for empty input)
 */
HUGINN_API std::vector<LanguageSegment> merge_consecutive_language_segments(
    const std::vector<LanguageSegment>& segments);

} // namespace huginn
