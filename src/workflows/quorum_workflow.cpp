// workflows/quorum_workflow.cpp
#include "workflows/quorum_workflow.h"
#include "common/tools/ordered_calls.h"
#include "common/utils/template_renderer.h"

namespace agentgraph {

std::string_view to_string(QuorumRoute route) {
    return route == QuorumRoute::CRITIQUE ? "critique" : "done";
}

namespace {

constexpr const char* kDraftPrompt = R"(You are an expert assistant. Provide a detailed, preliminary answer to the following question. Be comprehensive but open to refinement.

Question: {{ question }})";

constexpr const char* kSkepticPrompt = R"(You are 'The Skeptic'. Your job is to find flaws, logical fallacies, missing context, or weak arguments in the provided answer.
Be harsh but fair. If the answer is good, acknowledge it but find at least one improvement.

Question: {{ question }}
Draft Answer: {{ current_answer }}

Critique:)";

constexpr const char* kStructuralistPrompt = R"(You are 'The Structuralist'. Focus ONLY on clarity, structure, formatting, and flow. Is the answer easy to read? Does it use headers effectively?

Draft Answer: {{ current_answer }}

Critique:)";

constexpr const char* kRefinePrompt = R"(You are the Lead Editor. You have an original draft and a set of critiques from a panel of experts. Your goal is to rewrite the draft to incorporate this feedback and create the 'Final Golden Answer'.

Original Question: {{ question }}
Current Draft: {{ current_answer }}

--- Panel Feedback ---
{{ feedback }}
----------------------

Please provide the rewritten, improved answer below. Do not include a preamble about the changes, just the answer.)";

struct Persona {
    const char* role;
    const char* label;
    const char* prompt;
};

constexpr Persona kPanel[] = {
    {"skeptic", "Skeptic's Feedback", kSkepticPrompt},
    {"structuralist", "Structuralist's Feedback", kStructuralistPrompt},
};

} // namespace

Workflow build_quorum_workflow(const WorkflowServices& services) {
    const EngineConfig& config = *services.config;
    auto llm = make_llm(services, "quorum");
    const bool parallel = config.engine.parallel_calls;

    Workflow wf;
    wf.name = "quorum";
    wf.description = "Draft, reviewer panel critique and refinement rounds";
    wf.input_field = "question";
    wf.artifact_field = "current_answer";
    wf.artifact_name = "answer";

    wf.governor.add_scope(LoopScope{
        .name = "refine",
        .counter_field = "iteration",
        .max_iterations = config.limits.quorum_max_iterations,
        .reset_on_entry = "drafter",
        .count_after = "refiner",
    });

    wf.schema = std::make_shared<StateSchema>();
    wf.schema->overwrite("question", "")
        .overwrite("current_answer", "")
        .overwrite("critiques", State::array());
    wf.governor.declare_fields(*wf.schema);

    GraphBuilder builder;

    builder.add_stage("drafter", [llm](const State& s) -> State {
        return {{"current_answer", llm->complete("drafter", PromptRenderer::render(kDraftPrompt, s), std::nullopt, 0.7)}};
    });

    builder.add_stage("quorum", [llm, parallel](const State& s) -> State {
        std::vector<std::function<std::string()>> calls;
        for (const auto& persona : kPanel) {
            std::string prompt = PromptRenderer::render(persona.prompt, s);
            calls.push_back([llm, persona, prompt]() {
                return std::string(persona.label) + ": " + llm->complete(persona.role, prompt, std::nullopt, 0.3);
            });
        }
        return {{"critiques", run_ordered(calls, parallel)}};
    });

    builder.add_stage("refiner", [llm](const State& s) -> State {
        State data = s;
        data["feedback"] = join(get_strings(s, "critiques"), "\n\n");
        std::string answer = llm->complete("drafter", PromptRenderer::render(kRefinePrompt, data), std::nullopt, 0.5);
        return {{"current_answer", answer}, {"critiques", State::array()}};
    });

    RetryGovernor governor = wf.governor;
    builder.set_entry("drafter")
        .add_edge("drafter", "quorum")
        .add_edge("quorum", "refiner")
        .add_conditional_edge<QuorumRoute>(
            "refiner",
            [governor](const State& s) {
                return governor.has_remaining("refine", s) ? QuorumRoute::CRITIQUE : QuorumRoute::DONE;
            },
            {{QuorumRoute::CRITIQUE, "quorum"}, {QuorumRoute::DONE, kTerminal}});

    wf.graph = builder.build();
    return wf;
}

} // namespace agentgraph
