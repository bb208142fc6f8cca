#ifndef AGENTGRAPH_COMMON_LLM_LLM_SERVICE_H
#define AGENTGRAPH_COMMON_LLM_LLM_SERVICE_H

#include "common/llm/completion_client.h"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace agentgraph {

using RoleRoster = std::map<std::string, std::string>; // role -> model

inline constexpr std::string_view kLlmErrorPrefix = "LLM Error: ";
inline constexpr std::string_view kVisionErrorPrefix = "Vision LLM Error: ";

// Role-addressed completion. Never throws for backend failures: they come back
// as "LLM Error: ..." / "Vision LLM Error: ..." text. Reasoning blocks are stripped.
class LlmService {
public:
    LlmService(std::shared_ptr<CompletionClient> client, RoleRoster roster, std::string default_model);

    std::string complete(const std::string& role,
                         const std::string& user_prompt,
                         const std::optional<std::string>& system_prompt = std::nullopt,
                         double temperature = 0.1);

    std::string complete_with_image(const std::string& role,
                                    const std::string& prompt,
                                    const std::optional<std::string>& image_path,
                                    double temperature = 0.1);

    // Direct model addressing, used for reviewer panels.
    std::string complete_model(const std::string& model,
                               const std::string& user_prompt,
                               const std::optional<std::string>& system_prompt = std::nullopt,
                               double temperature = 0.1);

    std::string model_for(const std::string& role) const;

    static bool is_error(std::string_view text);

private:
    std::shared_ptr<CompletionClient> client_;
    RoleRoster roster_;
    std::string default_model_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_LLM_LLM_SERVICE_H
