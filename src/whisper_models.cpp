#include "huginn/whisper_models.h"
#include "huginn/transcriber.h"
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace huginn {

std::string resolve_model_path(const std::string& models_dir, const std::string& model_size)
{
    if (model_size.empty()) {
        throw std::invalid_argument("Model size must not be empty");
    }

    const fs::path candidates[] = {
        fs::path(models_dir) / ("faster-whisper-" + model_size),
        fs::path(models_dir) / model_size,
        fs::path(model_size)
    };

    for (const auto& candidate : candidates) {
        std::error_code ec;
        if (fs::is_directory(candidate, ec)) {
            return candidate.string();
        }
    }

    throw std::runtime_error("Whisper model '" + model_size + "' not found under " +
                             (models_dir.empty() ? std::string(".") : models_dir));
}

CachedModelProvider::Loader whisper_model_loader(const std::string& models_dir,
                                                 const ModelOptions& model_options)
{
    return [models_dir, model_options](const std::string& model_size) -> std::shared_ptr<TranscriptionEngine> {
        ModelOptions options = model_options;
        options.model_path = resolve_model_path(models_dir, model_size);

        std::cout << "[Huginn] Model path: " << options.model_path << "\n";
        return std::make_shared<Transcriber>(options);
    };
}

} // namespace huginn
