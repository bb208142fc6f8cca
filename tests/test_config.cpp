// tests/test_config.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentgraph/core/errors.h"
#include "common/config/engine_config.h"
#include "common/log/logging.h"
#include "common/utils/yaml_json.h"
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace agentgraph;

TEST_CASE("Defaults carry a roster for every bundled workflow", "[config]") {
    EngineConfig config = EngineConfig::defaults();
    REQUIRE(config.backend == "ollama");
    REQUIRE(config.limits.max_retries == 10);
    REQUIRE(config.limits.proof_max_retries == 6);
    REQUIRE(config.checkpoint.terminal_resume_policy == TerminalResumePolicy::NO_OP);

    for (const char* wf : {"coding", "proof", "deep_research", "quorum", "cited_research", "web_scout"}) {
        INFO(wf);
        REQUIRE_FALSE(config.roster(wf).empty());
    }
    REQUIRE(config.roster("coding").at("verifier") == "qwen3-vl:8b");
    REQUIRE(config.panel("deep_research", "skeptics").size() == 2);
}

TEST_CASE("Unknown rosters and panels fall back", "[config]") {
    EngineConfig config = EngineConfig::defaults();
    REQUIRE(config.roster("nonexistent").empty());
    REQUIRE(config.panel("quorum", "reviewers") == std::vector<std::string>{config.default_model});
}

TEST_CASE("YAML overrides merge onto the defaults", "[config]") {
    EngineConfig config = EngineConfig::from_yaml_string(R"(
backend: llama
default_model: local.gguf
llama:
  models_dir: /opt/models
  n_ctx: 4096
  min_p: 0.1
models:
  coding:
    coder: deepseek-coder:6.7b
  deep_research:
    panels:
      skeptics: [a, b, c]
limits:
  max_retries: 3
  page_max_chars: 2000
search:
  providers: [duckduckgo]
  timeout: 5
checkpoint:
  dir: /tmp/sessions
  terminal_resume_policy: reenter_loop
engine:
  max_steps: 50
  parallel_calls: true
workspace:
  dependency_install: []
log:
  level: debug
)");

    REQUIRE(config.backend == "llama");
    REQUIRE(config.llama.models_dir == "/opt/models");
    REQUIRE(config.llama.n_ctx == 4096);
    REQUIRE(config.llama.min_p > 0.09f);
    REQUIRE(config.roster("coding").at("coder") == "deepseek-coder:6.7b");
    REQUIRE(config.roster("coding").at("tester") == "qwen2.5-coder:14b");
    REQUIRE(config.panel("deep_research", "skeptics") == std::vector<std::string>{"a", "b", "c"});
    REQUIRE(config.limits.max_retries == 3);
    REQUIRE(config.limits.page_max_chars == 2000);
    REQUIRE(config.limits.section_max_loops == 2);
    REQUIRE(config.search.providers == std::vector<std::string>{"duckduckgo"});
    REQUIRE(config.search.timeout_sec == 5);
    REQUIRE(config.checkpoint.dir == "/tmp/sessions");
    REQUIRE(config.checkpoint.terminal_resume_policy == TerminalResumePolicy::REENTER_LOOP);
    REQUIRE(config.engine.max_steps == 50);
    REQUIRE(config.engine.parallel_calls);
    REQUIRE(config.workspace.dependency_install.empty());
    REQUIRE(config.log.level == "debug");
}

TEST_CASE("Invalid configuration is rejected with ConfigError", "[config]") {
    REQUIRE_THROWS_AS(EngineConfig::from_yaml_string("backend: openai"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_yaml_string("limits: 3"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_yaml_string("limits:\n  max_retries: lots"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_yaml_string("limits:\n  max_retries: -1"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_yaml_string("search:\n  providers: [bing]"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_yaml_string("checkpoint:\n  terminal_resume_policy: restart"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_yaml_string("models:\n  coding:\n    coder: [x]"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_yaml_string("models:\n  quorum:\n    panels:\n      p: []"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_yaml_string("engine:\n  parallel_calls: maybe"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_yaml_string("key: [unclosed"), ConfigError);
    REQUIRE_THROWS_AS(EngineConfig::from_yaml_string("- just\n- a list"), ConfigError);
}

TEST_CASE("Loading a config file", "[config]") {
    SECTION("missing file gives the defaults") {
        EngineConfig config = EngineConfig::load("/nonexistent/agentgraph.yaml");
        REQUIRE(config.default_model == EngineConfig::defaults().default_model);
    }
    SECTION("errors name the file") {
        auto path = std::filesystem::temp_directory_path() / "agentgraph_bad_config.yaml";
        std::ofstream(path) << "backend: nope\n";
        try {
            EngineConfig::load(path.string());
            FAIL("expected ConfigError");
        } catch (const ConfigError& e) {
            REQUIRE(std::string(e.what()).find(path.string()) == 0);
        }
        std::filesystem::remove(path);
    }
    SECTION("empty document") {
        REQUIRE(EngineConfig::from_yaml_string("").backend == "ollama");
    }
}

TEST_CASE("API keys come from the environment when the file leaves them empty", "[config]") {
    ::setenv("BRAVE_API_KEY", "env-brave", 1);
    ::setenv("GOOGLE_API_KEY", "env-google", 1);
    ::unsetenv("GOOGLE_CSE_ID");

    EngineConfig config = EngineConfig::from_yaml_string("search:\n  google_api_key: file-google\n");
    config.apply_env_overrides();
    REQUIRE(config.search.brave_api_key == "env-brave");
    REQUIRE(config.search.google_api_key == "file-google");
    REQUIRE(config.search.google_cse_id.empty());

    ::unsetenv("BRAVE_API_KEY");
    ::unsetenv("GOOGLE_API_KEY");
}

TEST_CASE("YAML scalars map to typed JSON values", "[config][yaml]") {
    auto j = parse_yaml("n: 3\nf: 1.5\nb: true\nz: ~\ns: hello\nq: '42'\nlist: [1, two]\n");
    REQUIRE(j["n"] == 3);
    REQUIRE(j["f"] == 1.5);
    REQUIRE(j["b"] == true);
    REQUIRE(j["z"].is_null());
    REQUIRE(j["s"] == "hello");
    REQUIRE(j["q"] == "42");
    REQUIRE(j["list"] == nlohmann::json({1, "two"}));
}

TEST_CASE("Logging accepts spdlog level names only", "[config][log]") {
    REQUIRE_NOTHROW(init_logging("warn", "%v"));
    REQUIRE(spdlog::default_logger()->level() == spdlog::level::warn);
    REQUIRE_NOTHROW(init_logging("info", "[%l] %v"));
    REQUIRE(spdlog::get("agentgraph") != nullptr);
    REQUIRE_THROWS_AS(init_logging("chatty", "%v"), ConfigError);
}
