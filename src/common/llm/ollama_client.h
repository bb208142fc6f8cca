#ifndef AGENTGRAPH_COMMON_LLM_OLLAMA_CLIENT_H
#define AGENTGRAPH_COMMON_LLM_OLLAMA_CLIENT_H

#include "common/llm/completion_client.h"
#include "common/net/http_client.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace agentgraph {

// Talks to an Ollama server through POST /api/chat (non-streaming).
class OllamaClient : public CompletionClient {
public:
    OllamaClient(std::shared_ptr<HttpClient> http, std::string base_url, long timeout_sec = 300);

    std::string complete(const CompletionRequest& request) override;
    bool supports_images() const override { return true; }

    // Request body for /api/chat; reads and encodes the image when present.
    static nlohmann::json build_chat_body(const CompletionRequest& request);

private:
    std::shared_ptr<HttpClient> http_;
    std::string base_url_;
    long timeout_sec_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_LLM_OLLAMA_CLIENT_H
