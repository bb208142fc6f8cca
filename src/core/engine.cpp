// core/engine.cpp
#include "agentgraph/core/engine.h"
#include "agentgraph/core/errors.h"
#include "common/llm/llama_completion_client.h"
#include "common/llm/ollama_client.h"
#include "common/net/http_client.h"
#include "common/tools/page_fetcher.h"
#include "common/tools/process_runner.h"
#include "common/tools/search_provider.h"
#include "modules/executor/graph_executor.h"
#include <spdlog/spdlog.h>

namespace agentgraph {

namespace {

std::shared_ptr<SearchProvider> make_search(const EngineConfig& config, std::shared_ptr<HttpClient> http) {
    std::vector<std::shared_ptr<SearchProvider>> providers;
    for (const auto& name : config.search.providers) {
        if (name == "brave") {
            if (config.search.brave_api_key.empty()) {
                spdlog::debug("brave search skipped: no API key");
                continue;
            }
            providers.push_back(std::make_shared<BraveSearchProvider>(http, config.search.brave_api_key,
                                                                      config.search.timeout_sec));
        } else if (name == "google") {
            if (config.search.google_api_key.empty() || config.search.google_cse_id.empty()) {
                spdlog::debug("google search skipped: no API key or CSE id");
                continue;
            }
            providers.push_back(std::make_shared<GoogleSearchProvider>(http, config.search.google_api_key,
                                                                       config.search.google_cse_id,
                                                                       config.search.timeout_sec));
        } else if (name == "duckduckgo") {
            providers.push_back(std::make_shared<DuckDuckGoSearchProvider>(http, config.search.timeout_sec));
        }
    }
    return std::make_shared<FallbackSearchChain>(std::move(providers));
}

std::shared_ptr<CompletionClient> make_completion(const EngineConfig& config, std::shared_ptr<HttpClient> http) {
    if (config.backend == "llama") {
        LlamaAdapter::Config base;
        base.n_ctx = config.llama.n_ctx;
        base.n_threads = config.llama.n_threads;
        base.n_predict = config.llama.n_predict;
        base.min_p = config.llama.min_p;
        return std::make_shared<LlamaCompletionClient>(config.llama.models_dir, base);
    }
    return std::make_shared<OllamaClient>(std::move(http), config.ollama.base_url, config.ollama.timeout_sec);
}

std::string as_text(const State& state, const std::string& field) {
    auto it = state.find(field);
    if (it == state.end() || it->is_null()) return "";
    return it->is_string() ? it->get<std::string>() : it->dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace

std::unique_ptr<WorkflowEngine> WorkflowEngine::from_config(ConfigPtr config) {
    auto http = std::make_shared<CurlHttpClient>();

    WorkflowServices services;
    services.config = config;
    services.completion = make_completion(*config, http);
    services.search = make_search(*config, http);
    services.fetcher = std::make_shared<HttpPageFetcher>(http, config->search.timeout_sec);
    services.runner = std::make_shared<PosixProcessRunner>();

    auto blobs = std::make_shared<FileBlobStore>(config->checkpoint.dir);
    return std::make_unique<WorkflowEngine>(std::move(services), std::move(blobs));
}

std::unique_ptr<WorkflowEngine> WorkflowEngine::from_config_file(const std::string& path) {
    EngineConfig config = EngineConfig::load(path);
    config.apply_env_overrides();
    return from_config(std::make_shared<const EngineConfig>(std::move(config)));
}

WorkflowEngine::WorkflowEngine(WorkflowServices services, std::shared_ptr<BlobStore> blobs)
    : services_(std::move(services)), blobs_(std::move(blobs)), checkpoints_(blobs_) {
    if (!services_.config) {
        services_.config = std::make_shared<const EngineConfig>(EngineConfig::defaults());
    }
}

RunReport WorkflowEngine::execute(const std::string& workflow, const std::string& session_id,
                                  const std::string* objective) {
    Workflow wf = catalog_.build(workflow, services_);

    ExecutorOptions options;
    options.max_steps = services_.config->engine.max_steps;
    options.terminal_policy = services_.config->checkpoint.terminal_resume_policy;
    GraphExecutor executor(*wf.graph, wf.schema, wf.governor, checkpoints_, options);

    RunReport report;
    report.workflow = wf.name;
    report.artifact_name = wf.artifact_name;
    if (objective) {
        spdlog::info("starting {} session {}", wf.name, session_id);
        report.result = executor.start(session_id, State{{wf.input_field, *objective}}, wf.name);
    } else {
        spdlog::info("resuming {} session {}", wf.name, session_id);
        report.result = executor.resume(session_id);
    }
    report.artifact = as_text(report.result.final_state, wf.artifact_field);
    report.trace = executor.get_trace_exporter().to_json();
    return report;
}

RunReport WorkflowEngine::start(const std::string& workflow, const std::string& objective, std::string session_id) {
    if (session_id.empty()) {
        session_id = CheckpointStore::generate_session_id();
    }
    return execute(workflow, session_id, &objective);
}

RunReport WorkflowEngine::resume(const std::string& session_id) {
    Checkpoint cp = checkpoints_.load(session_id); // throws SessionNotFound
    return execute(cp.workflow, session_id, nullptr);
}

RunReport WorkflowEngine::run_or_resume(const std::string& workflow, const std::string& objective,
                                        const std::string& session_id) {
    if (session_id.empty()) {
        return start(workflow, objective);
    }
    try {
        RunReport report = resume(session_id);
        if (report.workflow != workflow) {
            spdlog::warn("session {} belongs to workflow {}, not {}", session_id, report.workflow, workflow);
        }
        return report;
    } catch (const SessionNotFound&) {
        return start(workflow, objective, session_id);
    }
}

std::vector<Checkpoint> WorkflowEngine::sessions() const {
    return checkpoints_.list();
}

bool WorkflowEngine::prune(const std::string& session_id) {
    return checkpoints_.prune(session_id);
}

} // namespace agentgraph
