#include "huginn/model_provider.h"
#include <iostream>
#include <stdexcept>

namespace huginn {

CachedModelProvider::CachedModelProvider(Loader loader)
    : loader_(std::move(loader))
{
    if (!loader_) {
        throw std::invalid_argument("CachedModelProvider requires a loader");
    }
}

std::shared_ptr<TranscriptionEngine> CachedModelProvider::get_or_load(const std::string& model_size)
{
    // Held across the load so two callers never load the same size twice
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = engines_.find(model_size);
    if (it != engines_.end()) {
        return it->second;
    }

    std::cout << "[Huginn] Loading model '" << model_size << "'\n";
    auto engine = loader_(model_size);
    if (!engine) {
        throw std::runtime_error("Model loader returned no engine for '" + model_size + "'");
    }

    engines_.emplace(model_size, engine);
    return engine;
}

bool CachedModelProvider::is_loaded(const std::string& model_size) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engines_.count(model_size) > 0;
}

size_t CachedModelProvider::loaded_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return engines_.size();
}

void CachedModelProvider::clear()
{
    std::lock_guard<std::mutex> lock(mutex_);
    engines_.clear();
}

} // namespace huginn
