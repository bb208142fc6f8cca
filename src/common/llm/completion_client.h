#ifndef AGENTGRAPH_COMMON_LLM_COMPLETION_CLIENT_H
#define AGENTGRAPH_COMMON_LLM_COMPLETION_CLIENT_H

#include <optional>
#include <string>

namespace agentgraph {

struct CompletionRequest {
    std::string model;
    std::optional<std::string> system_prompt;
    std::string user_prompt;
    double temperature = 0.1;
    std::optional<std::string> image_path; // local file, sent base64-encoded
};

// Backend-specific text generation. Implementations throw ExternalServiceError.
class CompletionClient {
public:
    virtual ~CompletionClient() = default;
    virtual std::string complete(const CompletionRequest& request) = 0;
    virtual bool supports_images() const { return false; }
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_LLM_COMPLETION_CLIENT_H
