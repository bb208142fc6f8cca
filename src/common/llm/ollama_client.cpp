// common/llm/ollama_client.cpp
#include "common/llm/ollama_client.h"
#include "agentgraph/core/errors.h"
#include "common/utils/text_utils.h"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace agentgraph {

OllamaClient::OllamaClient(std::shared_ptr<HttpClient> http, std::string base_url, long timeout_sec)
    : http_(std::move(http)), base_url_(std::move(base_url)), timeout_sec_(timeout_sec) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

nlohmann::json OllamaClient::build_chat_body(const CompletionRequest& request) {
    nlohmann::json messages = nlohmann::json::array();
    if (request.system_prompt && !request.system_prompt->empty()) {
        messages.push_back({{"role", "system"}, {"content", *request.system_prompt}});
    }

    nlohmann::json user = {{"role", "user"}, {"content", request.user_prompt}};
    // 图片不存在时仅发送文本
    if (request.image_path && std::filesystem::exists(*request.image_path)) {
        std::ifstream in(*request.image_path, std::ios::binary);
        if (!in) {
            throw ExternalServiceError("Cannot read image: " + *request.image_path);
        }
        std::stringstream buffer;
        buffer << in.rdbuf();
        user["images"] = nlohmann::json::array({base64_encode(buffer.str())});
    }
    messages.push_back(std::move(user));

    return {
        {"model", request.model},
        {"messages", std::move(messages)},
        {"stream", false},
        {"options", {{"temperature", request.temperature}}}
    };
}

std::string OllamaClient::complete(const CompletionRequest& request) {
    HttpResponse res = http_->post_json(base_url_ + "/api/chat", build_chat_body(request), timeout_sec_);
    if (res.status != 200) {
        std::string detail = res.body.substr(0, 200);
        throw ExternalServiceError("Ollama returned status " + std::to_string(res.status) + ": " + detail);
    }

    auto data = nlohmann::json::parse(res.body, nullptr, false);
    if (data.is_discarded()) {
        throw ExternalServiceError("Ollama returned invalid JSON");
    }
    if (data.contains("error")) {
        throw ExternalServiceError("Ollama error: " + data["error"].dump());
    }
    if (!data.contains("message") || !data["message"].contains("content")) {
        throw ExternalServiceError("Ollama response has no message content");
    }
    return data["message"]["content"].get<std::string>();
}

} // namespace agentgraph
