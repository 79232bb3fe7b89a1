#pragma once

#include "export.h"
#include "transcription_engine.h"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace huginn {

/**
 * @brief Source of loaded transcription engines, keyed by model size
 *
 * Owned by the orchestrator and passed down instead of a process-wide cache.
 */
class HUGINN_API ModelProvider {
public:
    virtual ~ModelProvider() = default;

    /**
     * @brief Return the engine for a model size, loading it on first use
     *
     * @param model_size "tiny", "base", "small", "medium", "large-v3", ...
     * @throws std::runtime_error if the model cannot be loaded
     */
    virtual std::shared_ptr<TranscriptionEngine> get_or_load(const std::string& model_size) = 0;
};

/**
 * @brief ModelProvider that loads each size at most once
 *
 * Example:
 * @code
 *   huginn::CachedModelProvider models(
 *       huginn::whisper_model_loader("models", model_options));
 *   auto engine = models.get_or_load("base");
 * @endcode
 */
class HUGINN_API CachedModelProvider : public ModelProvider {
public:
    using Loader = std::function<std::shared_ptr<TranscriptionEngine>(const std::string& model_size)>;

    explicit CachedModelProvider(Loader loader);

    std::shared_ptr<TranscriptionEngine> get_or_load(const std::string& model_size) override;

    bool is_loaded(const std::string& model_size) const;
    size_t loaded_count() const;

    /// Drop every cached engine (engines still referenced elsewhere stay alive)
    void clear();

private:
    Loader loader_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<TranscriptionEngine>> engines_;
};

} // namespace huginn
