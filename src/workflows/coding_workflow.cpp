// workflows/coding_workflow.cpp
#include "workflows/coding_workflow.h"
#include "agentgraph/core/errors.h"
#include "common/utils/template_renderer.h"
#include "common/utils/text_utils.h"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <set>

namespace agentgraph {

namespace fs = std::filesystem;

std::string_view to_string(VerifyRoute route) {
    switch (route) {
        case VerifyRoute::DONE: return "done";
        case VerifyRoute::RETRY: return "retry";
        case VerifyRoute::GIVE_UP: return "give_up";
    }
    return "unknown";
}

namespace {

constexpr const char* kTesterSystem = R"(You are a QA Engineer specializing in TDD (Test Driven Development).
Write a `pytest` test file for a Python script named `{{ module }}`.
Requirements:
1. Define the expected function signatures based on the user objective.
2. Write comprehensive test cases (edge cases, happy paths).
3. Import the module using `import {{ module }} as app`.
4. Output ONLY the python code.)";

constexpr const char* kCoderRules = R"(Requirements:
1. Output ONLY the code inside markdown blocks ```python ... ```
2. Do not use 'input()'.
3. ALWAYS set `matplotlib.use('Agg')` before importing pyplot.
4. Save plots to '{{ plot }}'.
5. IMPORTANT: Your code must be compatible with the provided Test Suite.
6. Ensure you expose the functions/classes expected by the tests.
7. Make sure there is a __name__ == "__main__" section that runs in a meaningfully useful way.)";

// 三种提示：首次尝试 / 运行失败 / 校验器驳回
constexpr const char* kCoderFirst = R"(Objective: {{ objective }}

Here is the Test Suite you must pass:
```python
{{ test_code }}
```

Write the script `{{ script }}` to pass these tests and solve the objective.
{{ rules }})";

constexpr const char* kCoderRuntimeFix = R"(Goal: {{ objective }}
The script failed during execution or testing:
{{ output }}

Here are the tests:
```python
{{ test_code }}
```
Fix the code to pass the tests and resolve the crash.
Output ONLY the fixed code.)";

constexpr const char* kCoderCritiqueFix = R"(Goal: {{ objective }}
The output was rejected by the Verifier:
Critique: {{ verification_error }}

Previous Output: {{ output }}

Modify the code to satisfy the critique.
Output ONLY the fixed code.)";

constexpr const char* kVerifierPrompt = R"(User Objective: {{ objective }}

--- SOURCE CODE ---
{{ code }}

--- EXECUTION LOGS ---
{{ output }}

The automated tests PASSED. Now you must verify the LOGIC and RIGOR.

CRITICAL CHECKS:
1. Look at the `if __name__ == '__main__':` block at the bottom.
2. Are the input parameters TRIVIAL? (e.g., angles set to 0.0, time set to 0, or mass set to 0).
3. If the inputs are trivial/zeros, the simulation is meaningless even if it runs.
4. Check the LOGIC of the program. Does it actually do what it is supposed to do?

DECISION:
- If inputs are trivial or the plot looks like a flat line: Reply 'FAILED: <explanation>'
- If inputs look interesting and the plot looks valid: Reply 'PASSED')";

std::string module_name() {
    std::string_view script = kScriptName;
    return std::string(script.substr(0, script.size() - 3));
}

void write_file(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw WorkflowError("Cannot write " + path.string());
    }
    out << content;
}

std::string failure_text(const ProcessResult& r, int timeout_sec) {
    if (r.timed_out) {
        return "System Error: timed out after " + std::to_string(timeout_sec) + "s";
    }
    return "System Error: " + r.error;
}

} // namespace

Workflow build_coding_workflow(const WorkflowServices& services) {
    const EngineConfig& config = *services.config;
    auto llm = make_llm(services, "coding");
    auto runner = services.runner;
    const fs::path workspace = config.workspace.dir;
    const int timeout = config.limits.process_timeout_sec;

    Workflow wf;
    wf.name = "coding";
    wf.description = "Test-driven coding loop with execution and visual verification";
    wf.input_field = "objective";
    wf.artifact_field = "code";
    wf.artifact_name = "solution";

    wf.governor.add_scope(LoopScope{
        .name = "retry",
        .counter_field = "iterations",
        .max_iterations = config.limits.max_retries,
        .count_on_routes = {{"verifier", std::string(to_string(VerifyRoute::RETRY))}},
        .exhaustion_routes = {{"verifier", std::string(to_string(VerifyRoute::GIVE_UP))}},
    });

    wf.schema = std::make_shared<StateSchema>();
    wf.schema->overwrite("objective", "")
        .overwrite("code", "")
        .overwrite("test_code", "")
        .overwrite("output", "")
        .overwrite("verification_error", nullptr)
        .overwrite("success", false)
        .append("attempt_log");
    wf.governor.declare_fields(*wf.schema);

    GraphBuilder builder;

    builder.add_stage("tester", [llm](const State& s) -> State {
        // 测试只写一次
        if (s.value("iterations", 0) > 0 && !get_string(s, "test_code").empty()) {
            return {};
        }
        std::string system = PromptRenderer::render(kTesterSystem, {{"module", module_name()}});
        std::string response = llm->complete("tester", "Objective: " + get_string(s, "objective"), system);
        return {{"test_code", extract_fenced_block(response, "python")}};
    });

    builder.add_stage("coder", [llm](const State& s) -> State {
        State data = s;
        data["script"] = std::string(kScriptName);
        data["rules"] = PromptRenderer::render(kCoderRules, {{"plot", std::string(kPlotName)}});

        const char* tmpl = kCoderFirst;
        if (s.value("iterations", 0) > 0) {
            tmpl = get_string(s, "verification_error").empty() ? kCoderRuntimeFix : kCoderCritiqueFix;
        }
        std::string response = llm->complete("coder", PromptRenderer::render(tmpl, data), std::nullopt, 0.2);
        return {{"code", extract_fenced_block(response, "python")}, {"verification_error", nullptr}};
    });

    builder.add_stage("dependency_manager", [runner, workspace, config](const State& s) -> State {
        std::set<std::string> packages{"pytest"};
        for (const auto& field : {"code", "test_code"}) {
            for (const auto& m : third_party_python_imports(get_string(s, field))) {
                if (m != module_name()) packages.insert(m); // 被测脚本本身不是依赖
            }
        }

        const auto& install = config.workspace.dependency_install;
        if (install.empty()) {
            return {};
        }
        fs::create_directories(workspace);
        for (const auto& pkg : packages) {
            std::vector<std::string> args(install.begin() + 1, install.end());
            args.push_back(pkg);
            ProcessResult r = runner->run(install.front(), args, config.limits.process_timeout_sec * 4,
                                          workspace.string());
            if (!r.ok()) {
                spdlog::warn("installing {} failed (exit {}): {}", pkg, r.exit_code,
                             r.error.empty() ? truncate(r.stderr_text, 200) : r.error);
            }
        }
        return {};
    });

    builder.add_stage("executor", [runner, workspace, timeout, config](const State& s) -> State {
        fs::create_directories(workspace);
        const fs::path plot = workspace / kPlotName;
        std::error_code ec;
        fs::remove(plot, ec);

        write_file(workspace / kScriptName, get_string(s, "code"));
        write_file(workspace / kTestName, get_string(s, "test_code"));

        const int attempt = s.value("iterations", 0);
        auto result = [attempt](std::string output, bool success, const std::string& phase, int exit_code) {
            State entry = {{"attempt", attempt}, {"phase", phase}, {"success", success}, {"exit_code", exit_code}};
            return State{{"output", std::move(output)}, {"success", success}, {"attempt_log", State::array({entry})}};
        };

        std::string log = "--- SCRIPT EXECUTION ---\n";
        ProcessResult script = runner->run(config.workspace.python, {std::string(kScriptName)}, timeout,
                                           workspace.string());
        if (script.timed_out || !script.error.empty()) {
            return result(failure_text(script, timeout), false, "script", script.exit_code);
        }
        log += "STDOUT: " + script.stdout_text + "\nSTDERR: " + script.stderr_text + "\n";
        if (script.exit_code != 0) {
            return result(log, false, "script", script.exit_code);
        }

        log += "\n--- TEST EXECUTION ---\n";
        ProcessResult tests = runner->run(config.workspace.python, {"-m", "pytest", std::string(kTestName)},
                                          timeout, workspace.string());
        if (tests.timed_out || !tests.error.empty()) {
            log += "\nTest Runner Error: " + failure_text(tests, timeout);
            return result(log, false, "tests", tests.exit_code);
        }
        log += tests.stdout_text + tests.stderr_text;
        if (tests.exit_code != 0) {
            return result(log, false, "tests", tests.exit_code);
        }

        if (fs::exists(plot)) {
            log += "\n[System Note]: '" + std::string(kPlotName) + "' was generated.";
        }
        return result(log, true, "tests", 0);
    });

    builder.add_stage("verifier", [llm, workspace](const State& s) -> State {
        if (!s.value("success", false)) {
            return {};
        }
        const fs::path plot = workspace / kPlotName;
        std::optional<std::string> image;
        if (fs::exists(plot)) {
            image = plot.string();
        }
        std::string critique = llm->complete_with_image("verifier", PromptRenderer::render(kVerifierPrompt, s), image);
        if (critique.find("PASSED") != std::string::npos) {
            return {{"verification_error", nullptr}, {"success", true}};
        }
        std::string error = critique;
        for (size_t pos; (pos = error.find("FAILED:")) != std::string::npos;) {
            error.erase(pos, 7);
        }
        return {{"verification_error", trim(error)}, {"success", false}};
    });

    RetryGovernor governor = wf.governor;
    builder.set_entry("tester")
        .add_edge("tester", "coder")
        .add_edge("coder", "dependency_manager")
        .add_edge("dependency_manager", "executor")
        .add_edge("executor", "verifier")
        .add_conditional_edge<VerifyRoute>(
            "verifier",
            [governor](const State& s) {
                switch (governor.retry_verdict("retry", s, s.value("success", false))) {
                    case RetryVerdict::DONE: return VerifyRoute::DONE;
                    case RetryVerdict::REPAIR: return VerifyRoute::RETRY;
                    case RetryVerdict::EXHAUSTED: break;
                }
                return VerifyRoute::GIVE_UP;
            },
            {{VerifyRoute::DONE, kTerminal}, {VerifyRoute::RETRY, "coder"}, {VerifyRoute::GIVE_UP, kTerminal}});

    wf.graph = builder.build();
    return wf;
}

} // namespace agentgraph
