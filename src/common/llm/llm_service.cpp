// common/llm/llm_service.cpp
#include "common/llm/llm_service.h"
#include "common/utils/text_utils.h"
#include <spdlog/spdlog.h>

namespace agentgraph {

LlmService::LlmService(std::shared_ptr<CompletionClient> client, RoleRoster roster, std::string default_model)
    : client_(std::move(client)), roster_(std::move(roster)), default_model_(std::move(default_model)) {}

std::string LlmService::model_for(const std::string& role) const {
    auto it = roster_.find(role);
    return it != roster_.end() ? it->second : default_model_;
}

std::string LlmService::complete(const std::string& role,
                                 const std::string& user_prompt,
                                 const std::optional<std::string>& system_prompt,
                                 double temperature) {
    return complete_model(model_for(role), user_prompt, system_prompt, temperature);
}

std::string LlmService::complete_model(const std::string& model,
                                       const std::string& user_prompt,
                                       const std::optional<std::string>& system_prompt,
                                       double temperature) {
    CompletionRequest request;
    request.model = model;
    request.system_prompt = system_prompt;
    request.user_prompt = user_prompt;
    request.temperature = temperature;
    try {
        return strip_reasoning(client_->complete(request));
    } catch (const std::exception& e) {
        spdlog::warn("completion with {} failed: {}", model, e.what());
        return std::string(kLlmErrorPrefix) + e.what();
    }
}

std::string LlmService::complete_with_image(const std::string& role,
                                            const std::string& prompt,
                                            const std::optional<std::string>& image_path,
                                            double temperature) {
    CompletionRequest request;
    request.model = model_for(role);
    request.user_prompt = prompt;
    request.temperature = temperature;
    request.image_path = image_path;
    try {
        return strip_reasoning(client_->complete(request));
    } catch (const std::exception& e) {
        spdlog::warn("vision completion with {} failed: {}", request.model, e.what());
        return std::string(kVisionErrorPrefix) + e.what();
    }
}

bool LlmService::is_error(std::string_view text) {
    return text.substr(0, kLlmErrorPrefix.size()) == kLlmErrorPrefix ||
           text.substr(0, kVisionErrorPrefix.size()) == kVisionErrorPrefix;
}

} // namespace agentgraph
