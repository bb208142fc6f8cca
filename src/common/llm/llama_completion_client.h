#ifndef AGENTGRAPH_COMMON_LLM_LLAMA_COMPLETION_CLIENT_H
#define AGENTGRAPH_COMMON_LLM_LLAMA_COMPLETION_CLIENT_H

#include "common/llm/completion_client.h"
#include "common/llm/llama_adapter.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace agentgraph {

// In-process backend: one LlamaAdapter per model, loaded on first use from
// "<models_dir>/<model>.gguf" (':' and '/' in the model name become '-').
class LlamaCompletionClient : public CompletionClient {
public:
    explicit LlamaCompletionClient(std::string models_dir, LlamaAdapter::Config base_config = {});

    std::string complete(const CompletionRequest& request) override;

    std::string model_path(const std::string& model) const;

private:
    std::string models_dir_;
    LlamaAdapter::Config base_config_;
    std::mutex mutex_; // llama context is not reentrant
    std::map<std::string, std::unique_ptr<LlamaAdapter>> adapters_;

    LlamaAdapter& adapter_for(const std::string& model);
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_LLM_LLAMA_COMPLETION_CLIENT_H
