// common/llm/llama_completion_client.cpp
#include "common/llm/llama_completion_client.h"
#include "agentgraph/core/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>

namespace agentgraph {

LlamaCompletionClient::LlamaCompletionClient(std::string models_dir, LlamaAdapter::Config base_config)
    : models_dir_(std::move(models_dir)), base_config_(std::move(base_config)) {}

std::string LlamaCompletionClient::model_path(const std::string& model) const {
    if (model.size() > 5 && model.compare(model.size() - 5, 5, ".gguf") == 0) {
        return (std::filesystem::path(models_dir_) / model).string();
    }
    std::string file = model;
    std::replace(file.begin(), file.end(), ':', '-');
    std::replace(file.begin(), file.end(), '/', '-');
    return (std::filesystem::path(models_dir_) / (file + ".gguf")).string();
}

LlamaAdapter& LlamaCompletionClient::adapter_for(const std::string& model) {
    auto it = adapters_.find(model);
    if (it != adapters_.end()) {
        return *it->second;
    }
    LlamaAdapter::Config config = base_config_;
    config.model_path = model_path(model);
    if (!std::filesystem::exists(config.model_path)) {
        throw ExternalServiceError("Model file not found: " + config.model_path);
    }
    spdlog::info("loading llama model {}", config.model_path);
    auto adapter = std::make_unique<LlamaAdapter>(config);
    LlamaAdapter& ref = *adapter;
    adapters_.emplace(model, std::move(adapter));
    return ref;
}

std::string LlamaCompletionClient::complete(const CompletionRequest& request) {
    if (request.image_path) {
        spdlog::warn("llama backend is text-only, ignoring image {}", *request.image_path);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    LlamaAdapter& adapter = adapter_for(request.model);
    return adapter.generate(request.system_prompt, request.user_prompt, static_cast<float>(request.temperature));
}

} // namespace agentgraph
