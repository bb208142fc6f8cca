// workflows/deep_research_workflow.cpp
#include "workflows/deep_research_workflow.h"
#include "agentgraph/core/errors.h"
#include "common/tools/ordered_calls.h"
#include "common/utils/template_renderer.h"
#include "common/utils/text_utils.h"
#include <spdlog/spdlog.h>

namespace agentgraph {

std::string_view to_string(SectionRoute route) {
    return route == SectionRoute::LOOP ? "loop" : "done";
}

std::string_view to_string(PlanRoute route) {
    return route == PlanRoute::NEXT_SECTION ? "next_section" : "finalize";
}

namespace {

constexpr size_t kDraftExcerpt = 4000;

constexpr const char* kOutlinePrompt = R"(Topic: {{ main_topic }}
Create a logical outline for a comprehensive report on this topic.
Return a list of 4 to 6 distinct section headers (e.g., 'Historical Context', 'Technical Implementation').
Do NOT include an Introduction or Conclusion in this list (I will add those automatically).
CRITICAL RULE: Your outline must be NEUTRAL and INVESTIGATIVE.
 - BAD: 'The Benefits of X' (Assumes there are benefits)
 - GOOD: 'Analysis of Impact of X' (Allows for positive or negative findings)
 - BAD: 'How X Solves Y' (Assumes it solves it)
 - GOOD: 'Evaluation of X as a Solution for Y'
Return ONLY the list of headers, separated by newlines.)";

constexpr const char* kQueriesFirst = R"(Main Report Topic: {{ main_topic }}
Current Section: {{ topic }}
Generate 3 highly specific search queries to gather information specifically for this section.
Return ONLY the queries as a list, separated by newlines.
Make the queries in few words and use KEYWORDS only to make the search.)";

constexpr const char* kQueriesGaps = R"(Section: {{ topic }}
Address these gaps: {{ gaps }}
Generate 2 NEW search queries to fill these gaps.
Return ONLY the queries as a list, separated by newlines.
Make the queries in few words and use KEYWORDS only to make the search.)";

constexpr const char* kSelectUrl = R"(Query: {{ query }}
Search Results: {{ results }}

Return the single best URL for deep reading. Return ONLY the URL.)";

constexpr const char* kExtract = R"(Query: {{ query }}
Source: {{ url }}
Content: {{ content }}

Extract comprehensive findings, statistics, and arguments.
Format: [Fact] (Source: URL)
If the source is not relevant to the query, then use the format [no relevant facts found] (Source: URL))";

constexpr const char* kWriteFirst = R"(Context: Writing a report on '{{ main_topic }}'.
Current Section to write: {{ topic }}
Research Notes:
{{ notes }}

Write this specific section. Do not write a whole intro/conclusion for the whole report, just this part.
Use information from ONLY the research notes.
If no research notes are relevant, then write a factual paragraph stating no relevant information was found, and write that more research is needed.
Use academic tone. Cite sources inline [1].
Output ONLY the section text.)";

constexpr const char* kWriteRefine = R"(Refine the section: {{ topic }}.
Current Draft:
{{ current_draft }}

New Notes:
{{ notes }}

Integrate new findings. Output the updated section.
Determine if the critiques are valid first before integrating them.
Use information from ONLY the research notes.
If no research notes are relevant, then write a factual paragraph stating no relevant information was found, and write that more research is needed.
Also make sure to retain all cited sources and their inline citations [1].)";

constexpr const char* kSkepticQuery = R"(Draft:
{{ excerpt }}...

Identify one weak/unverified claim. Generate a search query to check it.
Output ONLY the search query.
Make the query in few words and use KEYWORDS only to make the search.)";

constexpr const char* kSkepticCritique = R"(Draft:
{{ excerpt }}...
Evidence found for '{{ query }}':
{{ evidence }}

Critique the draft based on this evidence. Be harsh but constructive.
If the source is not relevant then critique the draft based on weak links.
Include all the critiques that you can think of.)";

constexpr const char* kRefine = R"(Original Draft:
{{ current_draft }}

Critiques:
{{ critique_text }}

Notes:
{{ notes }}

Rewrite the draft to address critiques. Preserve citations. Output the final section text.
First determine if the critique is worth addressing before addressing them.)";

constexpr const char* kFinalEdit = R"(Topic: {{ main_topic }}
Here are the drafted sections:
{{ body }}

Instructions:
1. Write a strong Introduction summarizing the topic.
2. Include the provided sections in order.
3. Write a Conclusion.
4. Smooth out transitions between sections if they feel disjointed.
5. Compile a 'References' section at the bottom based on the URLs found in the text.
6. Preserve the citations [1] where they belong.
7. Turn bullet points into FULL PARAGRAPHS.
Output the final Markdown report.)";

std::string strip_quotes(std::string text) {
    std::erase(text, '"');
    return trim(text);
}

} // namespace

Workflow build_deep_research_workflow(const WorkflowServices& services) {
    const EngineConfig& config = *services.config;
    auto llm = make_llm(services, "deep_research");
    auto search = services.search;
    auto fetcher = services.fetcher;
    const int max_results = config.limits.max_search_results;
    const size_t page_chars = config.limits.page_max_chars;
    const bool parallel = config.engine.parallel_calls;
    const std::vector<std::string> skeptics = config.panel("deep_research", "skeptics");

    Workflow wf;
    wf.name = "deep_research";
    wf.description = "Outline, per-section research/write/critique loops, final edit";
    wf.input_field = "main_topic";
    wf.artifact_field = "final_report";
    wf.artifact_name = "final_report";

    // 内层：每节最多 section_max_loops 轮，进入 section_initiator 时清零
    wf.governor.add_scope(LoopScope{
        .name = "section",
        .counter_field = "loop_count",
        .max_iterations = config.limits.section_max_loops,
        .reset_on_entry = "section_initiator",
        .count_after = "refiner",
    });
    // 外层：上限为 section_plan 的长度
    wf.governor.add_scope(LoopScope{
        .name = "sections",
        .counter_field = "current_section_idx",
        .bound_field = "section_plan",
        .count_after = "section_compiler",
    });

    wf.schema = std::make_shared<StateSchema>();
    wf.schema->overwrite("main_topic", "")
        .overwrite("section_plan", State::array())
        .append("completed_sections")
        .overwrite("final_report", "")
        .overwrite("topic", "")
        .overwrite("research_plan", State::array())
        .overwrite("research_notes", State::array())
        .overwrite("current_draft", "")
        .overwrite("critiques", State::array());
    wf.governor.declare_fields(*wf.schema);

    GraphBuilder builder;

    builder.add_stage("global_planner", [llm](const State& s) -> State {
        std::vector<std::string> sections =
            parse_list_lines(llm->complete("global_planner", PromptRenderer::render(kOutlinePrompt, s)));
        if (sections.empty()) {
            sections.push_back(get_string(s, "main_topic"));
        }
        spdlog::info("global plan: {} sections", sections.size());
        return {{"section_plan", sections},
                {"current_section_idx", 0},
                {"research_notes", State::array()},
                {"critiques", State::array()}};
    });

    builder.add_stage("section_initiator", [](const State& s) -> State {
        const auto plan = get_strings(s, "section_plan");
        const int idx = s.value("current_section_idx", 0);
        if (idx < 0 || static_cast<size_t>(idx) >= plan.size()) {
            throw WorkflowError("section index " + std::to_string(idx) + " outside the plan");
        }
        return {{"topic", plan[idx]},
                {"research_plan", State::array()},
                {"research_notes", State::array()},
                {"current_draft", ""},
                {"critiques", State::array()}};
    });

    builder.add_stage("deep_researcher", [llm](const State& s) -> State {
        std::string prompt;
        if (s.value("loop_count", 0) == 0) {
            prompt = PromptRenderer::render(kQueriesFirst, s);
        } else {
            State data = s;
            data["gaps"] = join(get_strings(s, "critiques"), "\n");
            prompt = PromptRenderer::render(kQueriesGaps, data);
        }
        return {{"research_plan", parse_list_lines(llm->complete("planner", prompt))}};
    });

    builder.add_stage("researcher", [llm, search, fetcher, max_results, page_chars, parallel](const State& s) -> State {
        std::vector<std::function<std::string()>> calls;
        for (const auto& query : get_strings(s, "research_plan")) {
            calls.push_back([=]() {
                std::string results = search_as_text(*search, query, max_results);
                std::string url = trim(llm->complete("planner",
                                                     PromptRenderer::render(kSelectUrl, {{"query", query}, {"results", results}})));
                if (url.find("http") == std::string::npos) {
                    return "### Findings for '" + query + "':\n" + results + "\n";
                }
                std::string content = fetcher->fetch_text(url, page_chars);
                std::string summary = llm->complete(
                    "researcher",
                    PromptRenderer::render(kExtract, {{"query", query}, {"url", url}, {"content", content}}));
                return "### Deep Dive on '" + query + "':\n" + summary + "\n";
            });
        }
        std::vector<std::string> notes = get_strings(s, "research_notes");
        for (auto& note : run_ordered(calls, parallel)) {
            notes.push_back(std::move(note));
        }
        return {{"research_notes", notes}};
    });

    builder.add_stage("writer", [llm](const State& s) -> State {
        State data = s;
        data["notes"] = join(get_strings(s, "research_notes"), "\n");
        const char* tmpl = s.value("loop_count", 0) == 0 ? kWriteFirst : kWriteRefine;
        return {{"current_draft", llm->complete("writer", PromptRenderer::render(tmpl, data),
                                                std::string("You are a technical writer."), 0.3)}};
    });

    builder.add_stage("quorum", [llm, search, skeptics, max_results, parallel](const State& s) -> State {
        const std::string excerpt = truncate(get_string(s, "current_draft"), kDraftExcerpt);
        std::vector<std::function<std::string()>> calls;
        for (const auto& model : skeptics) {
            calls.push_back([=]() {
                std::string query = strip_quotes(
                    llm->complete_model(model, PromptRenderer::render(kSkepticQuery, {{"excerpt", excerpt}}),
                                        std::nullopt, 0.1));
                std::string evidence = search_as_text(*search, query, max_results);
                std::string critique = llm->complete_model(
                    model,
                    PromptRenderer::render(kSkepticCritique,
                                           {{"excerpt", excerpt}, {"query", query}, {"evidence", evidence}}),
                    std::nullopt, 0.3);
                return "[" + model + "]: " + critique;
            });
        }
        return {{"critiques", run_ordered(calls, parallel)}};
    });

    builder.add_stage("refiner", [llm](const State& s) -> State {
        State data = s;
        data["critique_text"] = join(get_strings(s, "critiques"), "\n");
        data["notes"] = join(get_strings(s, "research_notes"), "\n");
        return {{"current_draft", llm->complete("writer", PromptRenderer::render(kRefine, data), std::nullopt, 0.25)}};
    });

    builder.add_stage("section_compiler", [](const State& s) -> State {
        std::string section = "## " + get_string(s, "topic") + "\n\n" + get_string(s, "current_draft") + "\n\n";
        return {{"completed_sections", State::array({section})}};
    });

    builder.add_stage("final_editor", [llm](const State& s) -> State {
        State data = s;
        data["body"] = join(get_strings(s, "completed_sections"), "\n");
        return {{"final_report", llm->complete("editor", PromptRenderer::render(kFinalEdit, data), std::nullopt, 0.2)}};
    });

    RetryGovernor governor = wf.governor;
    builder.set_entry("global_planner")
        .add_edge("global_planner", "section_initiator")
        .add_edge("section_initiator", "deep_researcher")
        .add_edge("deep_researcher", "researcher")
        .add_edge("researcher", "writer")
        .add_edge("writer", "quorum")
        .add_edge("quorum", "refiner")
        .add_conditional_edge<SectionRoute>(
            "refiner",
            [governor](const State& s) {
                return governor.has_remaining("section", s) ? SectionRoute::LOOP : SectionRoute::DONE;
            },
            {{SectionRoute::LOOP, "deep_researcher"}, {SectionRoute::DONE, "section_compiler"}})
        .add_conditional_edge<PlanRoute>(
            "section_compiler",
            [governor](const State& s) {
                return governor.has_remaining("sections", s) ? PlanRoute::NEXT_SECTION : PlanRoute::FINALIZE;
            },
            {{PlanRoute::NEXT_SECTION, "section_initiator"}, {PlanRoute::FINALIZE, "final_editor"}})
        .add_edge("final_editor", kTerminal);

    wf.graph = builder.build();
    return wf;
}

} // namespace agentgraph
