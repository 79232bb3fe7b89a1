#pragma once

#include "export.h"
#include "types.h"
#include <string>
#include <vector>

namespace huginn {

/**
 * @brief Speech-to-text primitive used by the multi-language pipeline
 *
 * Given an audio file or a mono float32 buffer and an optional language hint
 * (options.language == "auto" means no hint), returns the detected language,
 * the full text and time-aligned segments. Implementations may throw; callers
 * in the pipeline treat a throw as a per-slice failure.
 *
 * Implementations are not required to be thread-safe.
 */
class HUGINN_API TranscriptionEngine {
public:
    virtual ~TranscriptionEngine() = default;

    virtual TranscribeResult transcribe(
        const std::string& audio_path,
        const TranscribeOptions& options = {}
    ) = 0;

    virtual TranscribeResult transcribe(
        const std::vector<float>& audio_samples,
        int sample_rate = 16000,
        const TranscribeOptions& options = {}
    ) = 0;
};

} // namespace huginn
