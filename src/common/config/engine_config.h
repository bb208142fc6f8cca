#ifndef AGENTGRAPH_COMMON_CONFIG_ENGINE_CONFIG_H
#define AGENTGRAPH_COMMON_CONFIG_ENGINE_CONFIG_H

#include "common/llm/llm_service.h"
#include "modules/checkpoint/checkpoint_store.h"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace agentgraph {

struct OllamaSettings {
    std::string base_url = "http://localhost:11434";
    long timeout_sec = 300;
};

struct LlamaSettings {
    std::string models_dir = "models";
    int n_ctx = 8192;
    int n_threads = 4;
    int n_predict = 2048;
    float min_p = 0.05f;
};

struct WorkflowModels {
    RoleRoster roles;                                      // role -> model
    std::map<std::string, std::vector<std::string>> panels; // e.g. "skeptics" -> [models]
};

struct LimitSettings {
    int max_retries = 10;
    int proof_max_retries = 6;
    int section_max_loops = 2;
    int quorum_max_iterations = 2;
    int max_search_results = 10;
    int max_read_count = 3;
    size_t page_max_chars = 10000;
    int process_timeout_sec = 30;
};

struct SearchSettings {
    std::string brave_api_key;
    std::string google_api_key;
    std::string google_cse_id;
    long timeout_sec = 10;
    std::vector<std::string> providers = {"brave", "google", "duckduckgo"};
};

struct CheckpointSettings {
    std::string dir = ".agentgraph/sessions";
    TerminalResumePolicy terminal_resume_policy = TerminalResumePolicy::NO_OP;
};

struct EngineSettings {
    int max_steps = 500;
    bool parallel_calls = false;
};

struct WorkspaceSettings {
    std::string dir = "workspace";
    std::string python = "python3";
    std::string lean = "lean";
    std::vector<std::string> dependency_install = {"python3", "-m", "pip", "install", "--quiet"};
};

struct LogSettings {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
};

// 不可变配置：加载后以 shared_ptr<const EngineConfig> 传递
struct EngineConfig {
    std::string backend = "ollama"; // "ollama" | "llama"
    std::string default_model = "qwen2.5-coder:14b";
    OllamaSettings ollama;
    LlamaSettings llama;
    std::map<std::string, WorkflowModels> models; // workflow -> roster
    LimitSettings limits;
    SearchSettings search;
    CheckpointSettings checkpoint;
    EngineSettings engine;
    WorkspaceSettings workspace;
    LogSettings log;

    static EngineConfig defaults();
    // Missing file -> defaults; malformed file -> ConfigError.
    static EngineConfig load(const std::string& path);
    static EngineConfig from_yaml_string(const std::string& yaml);
    static EngineConfig from_json(const nlohmann::json& j);

    // BRAVE_API_KEY / GOOGLE_API_KEY / GOOGLE_CSE_ID fill keys left empty.
    void apply_env_overrides();

    RoleRoster roster(const std::string& workflow) const;
    std::vector<std::string> panel(const std::string& workflow, const std::string& name) const;
};

using ConfigPtr = std::shared_ptr<const EngineConfig>;

} // namespace agentgraph

#endif // AGENTGRAPH_COMMON_CONFIG_ENGINE_CONFIG_H
