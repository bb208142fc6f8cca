// workflows/proof_workflow.cpp
#include "workflows/proof_workflow.h"
#include "agentgraph/core/errors.h"
#include "common/utils/template_renderer.h"
#include "common/utils/text_utils.h"
#include "modules/classifier/failure_classifier.h"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>

namespace agentgraph {

namespace fs = std::filesystem;

std::string_view to_string(ArbiterRoute route) {
    switch (route) {
        case ArbiterRoute::DONE: return "done";
        case ArbiterRoute::FIX_SYNTAX: return "fix_syntax";
        case ArbiterRoute::FIX_LOGIC: return "fix_logic";
        case ArbiterRoute::GIVE_UP: return "give_up";
    }
    return "unknown";
}

namespace {

constexpr const char* kTheoristSystem = R"(You are an expert Mathematician. Your goal is to provide a rigorous INFORMAL proof sketch.
1. State necessary definitions.
2. State the theorem clearly.
3. Provide a step-by-step proof in natural language + LaTeX.
4. DO NOT write Lean code yet.)";

constexpr const char* kTheoristRetry = R"(Objective: {{ objective }}
Previous Attempt Failed.
Arbiter Critique: {{ critique }}

Please restructure your proof strategy to avoid this logical pitfall.)";

constexpr const char* kFormalizerSystem = R"(You are a Lean4 Expert. Translate the informal proof into valid Lean4 code.
1. Use `import Mathlib` if needed.
2. Ensure all types and definitions are strictly declared.
3. Output ONLY the Lean code inside ```lean ... ``` blocks.)";

constexpr const char* kFormalizerFix = R"(The previous Lean code had a syntax/tactic error.
Error Log:
{{ compiler_output }}

Arbiter Tip: {{ critique }}

Original Code:
```lean
{{ lean_code }}
```
Fix the code.)";

constexpr const char* kFormalizerFresh = R"(Objective: {{ objective }}
Informal Proof Strategy:
{{ informal_proof }}

Translate this into a complete `.lean` file.)";

constexpr const char* kArbiterSystem = R"(You are an expert Debugger for Lean4.
Analyze the error log and decide if the failure is due to:
1. SYNTAX: The math is likely correct, but the code/tactics are wrong (e.g., 'unknown identifier', 'type mismatch').
2. LOGIC: The proof strategy itself is flawed or the goal is unprovable (e.g., 'goals not accomplished', 'contradiction').

Output Format:
TYPE: <SYNTAX or LOGIC>
CRITIQUE: <Short explanation of what to fix>)";

constexpr const char* kArbiterPrompt = R"(Lean Code:
```lean
{{ lean_code }}
```
Compiler Output:
{{ compiler_output }}
)";

} // namespace

Workflow build_proof_workflow(const WorkflowServices& services) {
    const EngineConfig& config = *services.config;
    auto llm = make_llm(services, "proof");
    auto runner = services.runner;
    const fs::path workspace = config.workspace.dir;
    const std::string lean = config.workspace.lean;
    const int timeout = config.limits.process_timeout_sec;

    Workflow wf;
    wf.name = "proof";
    wf.description = "Informal sketch, Lean4 formalization and classifier-driven repair";
    wf.input_field = "objective";
    wf.artifact_field = "lean_code";
    wf.artifact_name = "proof";

    const std::string syntax_route(to_string(ArbiterRoute::FIX_SYNTAX));
    const std::string logic_route(to_string(ArbiterRoute::FIX_LOGIC));
    wf.governor.add_scope(LoopScope{
        .name = "proof",
        .counter_field = "iterations",
        .max_iterations = config.limits.proof_max_retries,
        .count_on_routes = {{"arbiter", syntax_route}, {"arbiter", logic_route}},
        .exhaustion_routes = {{"arbiter", std::string(to_string(ArbiterRoute::GIVE_UP))}},
    });

    wf.schema = std::make_shared<StateSchema>();
    wf.schema->overwrite("objective", "")
        .overwrite("informal_proof", "")
        .overwrite("lean_code", "")
        .overwrite("compiler_output", "")
        .overwrite("error_type", nullptr)
        .overwrite("critique", "")
        .overwrite("success", false);
    wf.governor.declare_fields(*wf.schema);

    GraphBuilder builder;

    builder.add_stage("theorist", [llm](const State& s) -> State {
        std::string prompt = s.value("iterations", 0) == 0
                                 ? "Objective: " + get_string(s, "objective")
                                 : PromptRenderer::render(kTheoristRetry, s);
        return {{"informal_proof", llm->complete("theorist", prompt, std::string(kTheoristSystem), 0.2)}};
    });

    builder.add_stage("formalizer", [llm](const State& s) -> State {
        const bool fix = get_string(s, "error_type") == to_string(FailureKind::SYNTAX);
        std::string prompt = PromptRenderer::render(fix ? kFormalizerFix : kFormalizerFresh, s);
        std::string response = llm->complete("formalizer", prompt, std::string(kFormalizerSystem), 0.2);
        return {{"lean_code", extract_fenced_block(response, "lean")}};
    });

    builder.add_stage("kernel", [runner, workspace, lean, timeout](const State& s) -> State {
        fs::create_directories(workspace);
        {
            std::ofstream out(workspace / kLeanFile, std::ios::trunc);
            if (!out) {
                throw WorkflowError("Cannot write " + (workspace / kLeanFile).string());
            }
            out << get_string(s, "lean_code");
        }

        ProcessResult r = runner->run(lean, {std::string(kLeanFile)}, timeout, workspace.string());
        if (r.exit_code == 127 && !r.error.empty()) {
            return {{"compiler_output", "Error: '" + lean + "' executable not found. Please install Lean4."},
                    {"success", false}};
        }
        if (r.timed_out) {
            return {{"compiler_output", "System Error: lean timed out after " + std::to_string(timeout) + "s"},
                    {"success", false}};
        }
        return {{"compiler_output", r.stdout_text + r.stderr_text}, {"success", r.exit_code == 0}};
    });

    builder.add_stage("arbiter", [llm](const State& s) -> State {
        if (s.value("success", false)) {
            return {};
        }
        std::string verdict = llm->complete("arbiter", PromptRenderer::render(kArbiterPrompt, s),
                                            std::string(kArbiterSystem), 0.2);
        Classification c = classify_failure(verdict, FailureKind::SYNTAX);
        if (c.defaulted) {
            spdlog::debug("arbiter verdict carries no TYPE marker, assuming {}", to_string(c.kind));
        }
        return {{"error_type", std::string(to_string(c.kind))}, {"critique", c.critique}};
    });

    RetryGovernor governor = wf.governor;
    builder.set_entry("theorist")
        .add_edge("theorist", "formalizer")
        .add_edge("formalizer", "kernel")
        .add_edge("kernel", "arbiter")
        .add_conditional_edge<ArbiterRoute>(
            "arbiter",
            [governor](const State& s) {
                if (s.value("success", false)) {
                    return ArbiterRoute::DONE;
                }
                if (!governor.has_remaining("proof", s)) {
                    return ArbiterRoute::GIVE_UP;
                }
                return get_string(s, "error_type") == to_string(FailureKind::LOGIC) ? ArbiterRoute::FIX_LOGIC
                                                                                     : ArbiterRoute::FIX_SYNTAX;
            },
            {{ArbiterRoute::DONE, kTerminal},
             {ArbiterRoute::FIX_SYNTAX, "formalizer"},
             {ArbiterRoute::FIX_LOGIC, "theorist"},
             {ArbiterRoute::GIVE_UP, kTerminal}});

    wf.graph = builder.build();
    return wf;
}

} // namespace agentgraph
