// workflows/web_scout_workflow.cpp
#include "workflows/web_scout_workflow.h"
#include "common/tools/ordered_calls.h"
#include "common/utils/template_renderer.h"
#include "common/utils/text_utils.h"
#include <spdlog/spdlog.h>
#include <set>

namespace agentgraph {

namespace {

constexpr const char* kQueriesSystem = R"(You are an expert Researcher. Generate 2 distinct search queries to find this info.
Output ONLY a JSON list of strings. Example: ["query1", "query2"])";

constexpr const char* kSelectSystem = R"(Analyze the search results. Return the indices of the top {{ count }} most relevant results to read.
Output ONLY a JSON list of integers. Example: [0, 4, 2])";

constexpr const char* kSelectPrompt = R"(Objective: {{ objective }}

Results:
%% for r in results
{{ loop.index }}. {{ r.title }} ({{ r.url }})
Snippet: {{ r.snippet }}
%% endfor
)";

constexpr const char* kSynthesizeSystem = R"(You are a Research Assistant.
Write a concise summary answering the user's objective based on the provided sources.
Rules:
1. Use prose (paragraphs).
2. Use inline citations like [1], [2] to refer to sources.
3. At the end, list the references.)";

constexpr const char* kSynthesizePrompt = R"(Objective: {{ objective }}

Research Data:
%% for p in pages

--- SOURCE [{{ loop.index1 }}] ---
URL: {{ p.url }}
CONTENT: {{ p.content }}
%% endfor
)";

constexpr const char* kNoData = "No relevant data found to read.";

} // namespace

std::optional<std::vector<size_t>> parse_selection(const std::string& reply) {
    std::string filtered;
    for (char c : reply) {
        if ((c >= '0' && c <= '9') || c == '[' || c == ']' || c == ',') {
            filtered += c;
        }
    }
    auto parsed = nlohmann::json::parse(filtered, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array()) {
        return std::nullopt;
    }
    std::vector<size_t> indices;
    for (const auto& v : parsed) {
        if (!v.is_number_unsigned()) {
            return std::nullopt;
        }
        indices.push_back(v.get<size_t>());
    }
    return indices;
}

Workflow build_web_scout_workflow(const WorkflowServices& services) {
    const EngineConfig& config = *services.config;
    auto llm = make_llm(services, "web_scout");
    auto search = services.search;
    auto fetcher = services.fetcher;
    const int max_results = config.limits.max_search_results;
    const size_t max_read = static_cast<size_t>(config.limits.max_read_count);
    const size_t page_chars = config.limits.page_max_chars;
    const bool parallel = config.engine.parallel_calls;

    Workflow wf;
    wf.name = "web_scout";
    wf.description = "Search, pick the best links, read them and write a cited summary";
    wf.input_field = "objective";
    wf.artifact_field = "report";
    wf.artifact_name = "scout_report";

    wf.schema = std::make_shared<StateSchema>();
    wf.schema->overwrite("objective", "")
        .overwrite("queries", State::array())
        .overwrite("results", State::array())
        .overwrite("selected", State::array())
        .overwrite("pages", State::array())
        .overwrite("report", "");

    GraphBuilder builder;

    builder.add_stage("generate_queries", [llm](const State& s) -> State {
        const std::string objective = get_string(s, "objective");
        std::string reply = llm->complete("search", "Topic: " + objective, std::string(kQueriesSystem), 0.2);

        std::vector<std::string> queries;
        auto parsed = LlmService::is_error(reply) ? std::nullopt : extract_json(reply);
        if (parsed && parsed->is_array()) {
            for (const auto& q : *parsed) {
                if (q.is_string() && !trim(q.get<std::string>()).empty()) {
                    queries.push_back(q.get<std::string>());
                }
            }
        }
        if (queries.empty()) {
            queries.push_back(objective);
        }
        return {{"queries", queries}};
    });

    builder.add_stage("search_metadata", [search, max_results](const State& s) -> State {
        State results = State::array();
        std::set<std::string> seen;
        for (const auto& query : get_strings(s, "queries")) {
            try {
                for (const auto& r : search->search(query, max_results)) {
                    if (seen.insert(r.url).second) {
                        results.push_back(nlohmann::json(r));
                    }
                }
            } catch (const std::exception& e) {
                spdlog::warn("search failed for '{}': {}", query, e.what());
            }
        }
        return {{"results", results}};
    });

    builder.add_stage("select_links", [llm, max_read](const State& s) -> State {
        const State& results = s["results"];
        if (results.empty()) {
            return {{"selected", State::array()}};
        }
        auto fallback = [&]() {
            State first = State::array();
            for (size_t i = 0; i < results.size() && i < max_read; ++i) first.push_back(results[i]);
            return first;
        };

        std::string system = PromptRenderer::render(kSelectSystem, {{"count", max_read}});
        std::string reply = llm->complete("search", PromptRenderer::render(kSelectPrompt, s), system, 0.2);
        auto indices = LlmService::is_error(reply) ? std::nullopt : parse_selection(reply);
        if (!indices) {
            spdlog::debug("link selection unparsable, reading the first {} results", max_read);
            return {{"selected", fallback()}};
        }
        State selected = State::array();
        for (size_t i : *indices) {
            if (i < results.size() && selected.size() < max_read) {
                selected.push_back(results[i]);
            }
        }
        return {{"selected", selected}};
    });

    builder.add_stage("read_pages", [fetcher, page_chars, parallel](const State& s) -> State {
        std::vector<SearchResult> targets = s["selected"].get<std::vector<SearchResult>>();
        std::vector<std::function<std::string()>> calls;
        for (const auto& t : targets) {
            calls.push_back([fetcher, url = t.url, page_chars]() { return fetcher->fetch_text(url, page_chars); });
        }
        std::vector<std::string> contents = run_ordered(calls, parallel);

        State pages = State::array();
        for (size_t i = 0; i < targets.size(); ++i) {
            pages.push_back({{"title", targets[i].title}, {"url", targets[i].url}, {"content", contents[i]}});
        }
        return {{"pages", pages}};
    });

    builder.add_stage("synthesize", [llm](const State& s) -> State {
        if (s["pages"].empty()) {
            return {{"report", kNoData}};
        }
        return {{"report", trim(llm->complete("search", PromptRenderer::render(kSynthesizePrompt, s),
                                              std::string(kSynthesizeSystem), 0.2))}};
    });

    builder.set_entry("generate_queries")
        .add_edge("generate_queries", "search_metadata")
        .add_edge("search_metadata", "select_links")
        .add_edge("select_links", "read_pages")
        .add_edge("read_pages", "synthesize")
        .add_edge("synthesize", kTerminal);

    wf.graph = builder.build();
    return wf;
}

} // namespace agentgraph
