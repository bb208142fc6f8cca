// common/llm/llama_adapter.cpp
#include "common/llm/llama_adapter.h"
#include "agentgraph/core/errors.h"
#include <cmath>
#include <vector>

namespace agentgraph {

LlamaAdapter::LlamaAdapter(const Config& config)
    : config_(config),
      sampler_temperature_(config.temperature),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free),
      sampler_(nullptr, llama_sampler_free) {

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = 99; // 尽可能使用 GPU

    llama_model* raw_model = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (!raw_model) {
        throw ExternalServiceError("Failed to load model: " + config_.model_path);
    }
    model_.reset(raw_model);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = config_.n_ctx;
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_threads_batch = config_.n_threads;

    llama_context* raw_ctx = llama_init_from_model(model_.get(), ctx_params);
    if (!raw_ctx) {
        throw ExternalServiceError("Failed to create llama context for " + config_.model_path);
    }
    ctx_.reset(raw_ctx);

    rebuild_sampler(config_.temperature);
}

LlamaAdapter::~LlamaAdapter() = default;

void LlamaAdapter::rebuild_sampler(float temperature) {
    auto smpl_params = llama_sampler_chain_default_params();
    llama_sampler* raw_sampler = llama_sampler_chain_init(smpl_params);
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_min_p(config_.min_p, 1));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_temp(temperature));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    sampler_.reset(raw_sampler);
    sampler_temperature_ = temperature;
}

std::string LlamaAdapter::format_prompt(const std::optional<std::string>& system_prompt,
                                        const std::string& user_prompt) const {
    std::vector<llama_chat_message> chat;
    if (system_prompt && !system_prompt->empty()) {
        chat.push_back({"system", system_prompt->c_str()});
    }
    chat.push_back({"user", user_prompt.c_str()});

    const char* tmpl = llama_model_chat_template(model_.get(), nullptr);
    if (tmpl) {
        std::vector<char> buf(user_prompt.size() * 2 + 1024);
        int32_t n = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true, buf.data(),
                                              static_cast<int32_t>(buf.size()));
        if (n > static_cast<int32_t>(buf.size())) {
            buf.resize(n);
            n = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true, buf.data(),
                                          static_cast<int32_t>(buf.size()));
        }
        if (n >= 0) {
            return std::string(buf.data(), n);
        }
    }

    // 无模板：纯文本拼接
    std::string prompt;
    if (system_prompt && !system_prompt->empty()) {
        prompt += *system_prompt + "\n\n";
    }
    prompt += user_prompt;
    return prompt;
}

std::vector<llama_token> LlamaAdapter::tokenize(const std::string& text, bool add_bos) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    int32_t n_tokens = -llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                                       nullptr, 0, add_bos, true);
    if (n_tokens <= 0) return {};

    std::vector<llama_token> tokens(n_tokens);
    if (llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                       tokens.data(), n_tokens, add_bos, true) < 0) {
        return {};
    }
    return tokens;
}

std::string LlamaAdapter::detokenize(llama_token token) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    char buf[256] = {0};
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf) - 1, 0, true);
    if (n < 0) return "";
    return std::string(buf, n);
}

std::string LlamaAdapter::generate(const std::optional<std::string>& system_prompt,
                                   const std::string& user_prompt,
                                   float temperature) {
    if (!is_loaded()) {
        throw ExternalServiceError("Model not loaded");
    }
    if (std::fabs(temperature - sampler_temperature_) > 1e-6f) {
        rebuild_sampler(temperature);
    }

    // 每次调用互不影响
    llama_memory_clear(llama_get_memory(ctx_.get()), true);

    auto tokens = tokenize(format_prompt(system_prompt, user_prompt), true);
    if (tokens.empty()) {
        throw ExternalServiceError("Tokenization failed");
    }
    if (static_cast<int>(tokens.size()) >= config_.n_ctx) {
        throw ExternalServiceError("Prompt of " + std::to_string(tokens.size()) +
                                   " tokens exceeds context size " + std::to_string(config_.n_ctx));
    }

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    if (llama_decode(ctx_.get(), batch)) {
        throw ExternalServiceError("Prompt evaluation failed");
    }

    std::string response;
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    for (int i = 0; i < config_.n_predict; ++i) {
        llama_token new_token = llama_sampler_sample(sampler_.get(), ctx_.get(), -1);
        if (llama_vocab_is_eog(vocab, new_token)) {
            break;
        }
        response += detokenize(new_token);

        batch = llama_batch_get_one(&new_token, 1);
        if (llama_decode(ctx_.get(), batch)) {
            break;
        }
    }

    llama_sampler_reset(sampler_.get());
    return response;
}

bool LlamaAdapter::is_loaded() const {
    return model_ != nullptr && ctx_ != nullptr && sampler_ != nullptr;
}

} // namespace agentgraph
