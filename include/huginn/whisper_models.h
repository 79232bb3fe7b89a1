#pragma once

#include "export.h"
#include "model_provider.h"
#include "types.h"
#include <string>

namespace huginn {

/**
 * @brief Locate the CTranslate2 model directory for a model size
 *
 * Tries, in order: <models_dir>/faster-whisper-<size>, <models_dir>/<size>,
 * then <size> as a literal path.
 *
 * @return Existing directory path
 * @throws std::runtime_error if no candidate exists
 */
HUGINN_API std::string resolve_model_path(const std::string& models_dir,
                                          const std::string& model_size);

/**
 * @brief Loader for CachedModelProvider that builds CTranslate2 Transcribers
 *
 * @param models_dir Directory holding converted models
 * @param model_options Device, compute type, replicas (model_path is ignored)
 */
HUGINN_API CachedModelProvider::Loader whisper_model_loader(const std::string& models_dir,
                                                            const ModelOptions& model_options = {});

} // namespace huginn
