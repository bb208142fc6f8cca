// workflows/workflow.h
#ifndef AGENTGRAPH_WORKFLOWS_WORKFLOW_H
#define AGENTGRAPH_WORKFLOWS_WORKFLOW_H

#include "agentgraph/core/state.h"
#include "common/config/engine_config.h"
#include "common/llm/completion_client.h"
#include "common/llm/llm_service.h"
#include "common/tools/page_fetcher.h"
#include "common/tools/process_runner.h"
#include "common/tools/search_provider.h"
#include "modules/governor/retry_governor.h"
#include "modules/graph/graph_definition.h"
#include "modules/state/state_store.h"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace agentgraph {

// Collaborators handed to every workflow factory. Tests substitute fakes.
struct WorkflowServices {
    ConfigPtr config;
    std::shared_ptr<CompletionClient> completion;
    std::shared_ptr<SearchProvider> search;
    std::shared_ptr<PageFetcher> fetcher;
    std::shared_ptr<ProcessRunner> runner;
};

// A configured engine instance: graph + schema + loop scopes.
struct Workflow {
    std::string name;
    std::string description;
    std::unique_ptr<CompiledGraph> graph;
    std::shared_ptr<StateSchema> schema;
    RetryGovernor governor;
    std::string input_field;    // field filled from the user objective
    std::string artifact_field; // field written out when the run completes
    std::string artifact_name;  // output file prefix: <artifact_name>_<session>.md
};

using WorkflowFactory = std::function<Workflow(const WorkflowServices&)>;

// --- helpers shared by the bundled workflows ---

std::shared_ptr<LlmService> make_llm(const WorkflowServices& services, const std::string& workflow);

std::string get_string(const State& state, const std::string& field);
std::vector<std::string> get_strings(const State& state, const std::string& field);
std::string join(const std::vector<std::string>& items, const std::string& sep);

// One entry per non-empty line, list markers ("- ", "* ") removed.
std::vector<std::string> parse_list_lines(const std::string& text);

// "Title: ...\nURL: ...\nSnippet: ..." blocks, used as search evidence in prompts.
std::string format_search_results(const std::vector<SearchResult>& results);

// Search that never throws: failures become an "Error: ..." evidence string.
std::string search_as_text(SearchProvider& search, const std::string& query, int max_results);

} // namespace agentgraph

#endif // AGENTGRAPH_WORKFLOWS_WORKFLOW_H
