#ifndef AGENTGRAPH_COMMON_LLM_LLAMA_ADAPTER_H
#define AGENTGRAPH_COMMON_LLM_LLAMA_ADAPTER_H

#include <llama.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentgraph {

// One loaded GGUF model with its context and sampler chain.
class LlamaAdapter {
public:
    struct Config {
        std::string model_path;
        int n_ctx = 4096;
        int n_threads = 4;
        float temperature = 0.1f;
        float min_p = 0.05f;
        int n_predict = 1024;
    };

    explicit LlamaAdapter(const Config& config);
    ~LlamaAdapter();

    // Each call starts from an empty KV cache. The prompt is wrapped with the
    // model's chat template when it ships one.
    std::string generate(const std::optional<std::string>& system_prompt,
                         const std::string& user_prompt,
                         float temperature);
    bool is_loaded() const;

private:
    Config config_;
    float sampler_temperature_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler_;

    void rebuild_sampler(float temperature);
    std::string format_prompt(const std::optional<std::string>& system_prompt, const std::string& user_prompt) const;
    std::vector<llama_token> tokenize(const std::string& text, bool add_bos);
    std::string detokenize(llama_token token);
};

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_LLM_LLAMA_ADAPTER_H
