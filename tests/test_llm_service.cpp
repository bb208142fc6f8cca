// tests/test_llm_service.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentgraph/core/errors.h"
#include "common/llm/llm_service.h"
#include "common/llm/ollama_client.h"
#include "support/fakes.h"
#include <filesystem>
#include <fstream>

using namespace agentgraph;
using agentgraph::testing::ScriptedCompletionClient;

namespace {

class CannedHttpClient : public HttpClient {
public:
    HttpResponse response;
    HttpRequest last;

    HttpResponse send(const HttpRequest& request) override {
        last = request;
        return response;
    }
};

} // namespace

TEST_CASE("Roles resolve through the roster", "[llm]") {
    auto client = std::make_shared<ScriptedCompletionClient>(
        [](const CompletionRequest& r) { return "model=" + r.model; });
    LlmService llm(client, {{"coder", "qwen2.5-coder:14b"}}, "fallback:7b");

    REQUIRE(llm.complete("coder", "write it") == "model=qwen2.5-coder:14b");
    REQUIRE(llm.complete("unknown_role", "hi") == "model=fallback:7b");
    REQUIRE(llm.complete_model("cogito:14b", "hi") == "model=cogito:14b");

    auto reqs = client->requests();
    REQUIRE(reqs.size() == 3);
    REQUIRE(reqs[0].user_prompt == "write it");
    REQUIRE_FALSE(reqs[0].system_prompt);
    REQUIRE(reqs[0].temperature == 0.1);
}

TEST_CASE("Prompts, temperatures and images are forwarded", "[llm]") {
    auto client = std::make_shared<ScriptedCompletionClient>([](const CompletionRequest&) { return "ok"; });
    LlmService llm(client, {}, "m");

    llm.complete("r", "user", std::string("system"), 0.7);
    llm.complete_with_image("verifier", "look", std::string("/tmp/plot.png"));

    auto reqs = client->requests();
    REQUIRE(reqs[0].system_prompt == std::optional<std::string>("system"));
    REQUIRE(reqs[0].temperature == 0.7);
    REQUIRE(reqs[1].image_path == std::optional<std::string>("/tmp/plot.png"));
}

TEST_CASE("Reasoning blocks never reach the caller", "[llm]") {
    auto client = std::make_shared<ScriptedCompletionClient>(
        [](const CompletionRequest&) { return "<think>\nsecret chain\n</think>\n\nFinal answer"; });
    LlmService llm(client, {}, "m");
    REQUIRE(llm.complete("r", "q") == "Final answer");
    REQUIRE(llm.complete_with_image("r", "q", std::nullopt) == "Final answer");
}

TEST_CASE("Backend failures become error text", "[llm]") {
    auto client = std::make_shared<ScriptedCompletionClient>([](const CompletionRequest&) -> std::string {
        throw ExternalServiceError("connection refused");
    });
    LlmService llm(client, {}, "m");

    std::string text = llm.complete("r", "q");
    REQUIRE(text == "LLM Error: connection refused");
    REQUIRE(LlmService::is_error(text));

    std::string vision = llm.complete_with_image("r", "q", std::nullopt);
    REQUIRE(vision == "Vision LLM Error: connection refused");
    REQUIRE(LlmService::is_error(vision));

    REQUIRE_FALSE(LlmService::is_error("The LLM Error: was handled"));
}

TEST_CASE("Ollama chat requests and replies", "[llm][ollama]") {
    auto http = std::make_shared<CannedHttpClient>();
    OllamaClient ollama(http, "http://localhost:11434/", 60);

    CompletionRequest req;
    req.model = "qwen3:14b";
    req.system_prompt = "be brief";
    req.user_prompt = "hello";
    req.temperature = 0.5;

    SECTION("success") {
        http->response.status = 200;
        http->response.body = R"({"message": {"role": "assistant", "content": "hi there"}})";
        REQUIRE(ollama.complete(req) == "hi there");
        REQUIRE(http->last.url == "http://localhost:11434/api/chat");
        REQUIRE(http->last.method == "POST");
        REQUIRE(http->last.timeout_sec == 60);

        auto body = nlohmann::json::parse(http->last.body);
        REQUIRE(body["model"] == "qwen3:14b");
        REQUIRE(body["stream"] == false);
        REQUIRE(body["messages"].size() == 2);
        REQUIRE(body["messages"][0]["role"] == "system");
        REQUIRE(body["options"]["temperature"] == 0.5);
    }
    SECTION("http error") {
        http->response.status = 500;
        http->response.body = "model not loaded";
        REQUIRE_THROWS_AS(ollama.complete(req), ExternalServiceError);
    }
    SECTION("error payload") {
        http->response.status = 200;
        http->response.body = R"({"error": "model 'x' not found"})";
        REQUIRE_THROWS_AS(ollama.complete(req), ExternalServiceError);
    }
    SECTION("malformed payload") {
        http->response.status = 200;
        http->response.body = "not json";
        REQUIRE_THROWS_AS(ollama.complete(req), ExternalServiceError);
    }
}

TEST_CASE("Images are attached only when the file exists", "[llm][ollama]") {
    CompletionRequest req;
    req.model = "qwen3-vl:8b";
    req.user_prompt = "describe";
    req.image_path = "/nonexistent/plot.png";
    REQUIRE_FALSE(OllamaClient::build_chat_body(req)["messages"][0].contains("images"));

    auto path = std::filesystem::temp_directory_path() / "agentgraph_test_image.bin";
    std::ofstream(path, std::ios::binary) << "foo";
    req.image_path = path.string();
    auto body = OllamaClient::build_chat_body(req);
    REQUIRE(body["messages"][0]["images"] == nlohmann::json({"Zm9v"}));
    std::filesystem::remove(path);
}
