// workflows/cited_research_workflow.cpp
#include "workflows/cited_research_workflow.h"
#include "common/utils/template_renderer.h"
#include "common/utils/text_utils.h"

namespace agentgraph {

std::string_view to_string(ResearchRoute route) {
    return route == ResearchRoute::RESEARCH ? "research" : "write";
}

namespace {

constexpr const char* kPlannerSystem =
    "You are a research planning assistant. Given a topic, generate a list of 3 targeted search queries "
    "to gather comprehensive information. Return ONLY the queries, separated by newlines.";

constexpr const char* kSummaryPrompt = R"(You are a researcher. Your goal is to extract facts from the search results below. IMPORTANT: You must include the source URL for every fact you extract. Format your notes like this:
- [Fact or finding] (Source: [URL])

Search Results:
{{ results }}

Research Notes:)";

constexpr const char* kWriterPrompt = R"(You are a technical writer. Write a detailed markdown report on '{{ topic }}'.

RULES FOR CITATION:
1. You MUST use inline citations in the text like [1], [2].
2. You MUST create a 'References' section at the very end.
3. Every [n] citation must correspond to a real URL provided in the Research Notes.
4. Do not make up links. Only use the ones provided.

Research Notes:
{{ context }}

Final Report:)";

} // namespace

Workflow build_cited_research_workflow(const WorkflowServices& services) {
    const EngineConfig& config = *services.config;
    auto llm = make_llm(services, "cited_research");
    auto search = services.search;
    const int max_results = config.limits.max_search_results;

    Workflow wf;
    wf.name = "cited_research";
    wf.description = "Query plan, one researched note per query, cited report";
    wf.input_field = "topic";
    wf.artifact_field = "final_report";
    wf.artifact_name = "cited_report";

    wf.schema = std::make_shared<StateSchema>();
    wf.schema->overwrite("topic", "")
        .overwrite("plan", State::array())
        .append("content")
        .overwrite("final_report", "");

    GraphBuilder builder;

    builder.add_stage("planner", [llm, max_results](const State& s) -> State {
        std::vector<std::string> plan =
            split_nonempty_lines(llm->complete("planner", get_string(s, "topic"), std::string(kPlannerSystem), 0.0));
        if (plan.empty()) {
            plan.push_back(get_string(s, "topic"));
        }
        if (plan.size() > static_cast<size_t>(max_results)) {
            plan.resize(max_results);
        }
        return {{"plan", plan}};
    });

    builder.add_stage("researcher", [llm, search, max_results](const State& s) -> State {
        std::vector<std::string> plan = get_strings(s, "plan");
        if (plan.empty()) {
            return {};
        }
        const std::string query = plan.front();
        plan.erase(plan.begin());

        std::string results = search_as_text(*search, query, max_results);
        std::string summary =
            llm->complete("researcher", PromptRenderer::render(kSummaryPrompt, {{"results", results}}), std::nullopt, 0.0);
        std::string note = "### Sources for '" + query + "':\n" + summary + "\n\n";
        return {{"plan", plan}, {"content", State::array({note})}};
    });

    builder.add_stage("writer", [llm](const State& s) -> State {
        State data = s;
        data["context"] = join(get_strings(s, "content"), "\n");
        return {{"final_report", llm->complete("writer", PromptRenderer::render(kWriterPrompt, data), std::nullopt, 0.0)}};
    });

    builder.set_entry("planner")
        .add_edge("planner", "researcher")
        .add_conditional_edge<ResearchRoute>(
            "researcher",
            [](const State& s) {
                return get_strings(s, "plan").empty() ? ResearchRoute::WRITE : ResearchRoute::RESEARCH;
            },
            {{ResearchRoute::RESEARCH, "researcher"}, {ResearchRoute::WRITE, "writer"}})
        .add_edge("writer", kTerminal);

    wf.graph = builder.build();
    return wf;
}

} // namespace agentgraph
