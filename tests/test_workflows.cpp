// tests/test_workflows.cpp
#include <catch2/catch_test_macros.hpp>
#include "agentgraph/core/engine.h"
#include "agentgraph/core/errors.h"
#include "modules/checkpoint/blob_store.h"
#include "support/fakes.h"
#include "workflows/catalog.h"
#include "workflows/web_scout_workflow.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace agentgraph;
using namespace agentgraph::testing;
namespace fs = std::filesystem;

namespace {

bool has(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

std::string prompt_of(const CompletionRequest& r) {
    return r.system_prompt.value_or("") + "\n" + r.user_prompt;
}

struct Scratch {
    fs::path dir;
    Scratch() {
        dir = fs::temp_directory_path() /
              ("agentgraph_wf_" + std::to_string(::getpid()) + "_" + CheckpointStore::generate_session_id());
        fs::create_directories(dir);
    }
    ~Scratch() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
};

struct Harness {
    EngineConfig config = EngineConfig::defaults();
    std::shared_ptr<ScriptedCompletionClient> llm;
    std::shared_ptr<FakeSearchProvider> search;
    std::shared_ptr<FakePageFetcher> fetcher = std::make_shared<FakePageFetcher>();
    std::shared_ptr<FakeProcessRunner> runner = std::make_shared<FakeProcessRunner>();
    std::shared_ptr<MemoryBlobStore> blobs = std::make_shared<MemoryBlobStore>();

    explicit Harness(ScriptedCompletionClient::Handler handler, std::vector<SearchResult> results = {})
        : llm(std::make_shared<ScriptedCompletionClient>(std::move(handler))),
          search(std::make_shared<FakeSearchProvider>("fake", std::move(results))) {}

    std::unique_ptr<WorkflowEngine> engine() const {
        WorkflowServices services;
        services.config = std::make_shared<const EngineConfig>(config);
        services.completion = llm;
        services.search = search;
        services.fetcher = fetcher;
        services.runner = runner;
        return std::make_unique<WorkflowEngine>(std::move(services), blobs);
    }

    size_t prompts_containing(const std::string& needle) const {
        auto reqs = llm->requests();
        return static_cast<size_t>(std::count_if(reqs.begin(), reqs.end(), [&](const CompletionRequest& r) {
            return has(prompt_of(r), needle);
        }));
    }
};

std::vector<SearchResult> sample_results(int n) {
    std::vector<SearchResult> out;
    for (int i = 0; i < n; ++i) {
        out.push_back({"Result " + std::to_string(i), "https://example.com/" + std::to_string(i), "snippet"});
    }
    return out;
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace

// --- shared helpers ---

TEST_CASE("List replies are split into clean items", "[workflows]") {
    REQUIRE(parse_list_lines("- Alpha\n* Beta\n\n  Gamma  \n- ") ==
            std::vector<std::string>{"Alpha", "Beta", "Gamma"});
    REQUIRE(parse_list_lines("").empty());
}

TEST_CASE("Search evidence is formatted for prompts", "[workflows]") {
    REQUIRE(format_search_results({}) == "No results found.");
    REQUIRE(format_search_results({{"T", "https://u", "S"}}) == "Title: T\nURL: https://u\nSnippet: S\n\n");

    FakeSearchProvider down("down", {}, true);
    REQUIRE(search_as_text(down, "q", 3) == "Error: down unavailable");
}

TEST_CASE("State accessors tolerate missing and non-string fields", "[workflows]") {
    State s = {{"name", "x"}, {"n", 3}, {"nothing", nullptr}, {"list", {"a", 1}}};
    REQUIRE(get_string(s, "name") == "x");
    REQUIRE(get_string(s, "n") == "3");
    REQUIRE(get_string(s, "nothing").empty());
    REQUIRE(get_string(s, "absent").empty());
    REQUIRE(get_strings(s, "list") == std::vector<std::string>{"a", "1"});
    REQUIRE(get_strings(s, "name").empty());
    REQUIRE(join({"a", "b", "c"}, ", ") == "a, b, c");
}

// --- catalog ---

TEST_CASE("The catalog registers every bundled workflow", "[workflows][catalog]") {
    WorkflowCatalog catalog;
    REQUIRE(catalog.names() == std::vector<std::string>{"cited_research", "coding", "deep_research", "proof",
                                                        "quorum", "web_scout"});
    REQUIRE_FALSE(catalog.description("proof").empty());
    REQUIRE_THROWS_AS(catalog.description("nope"), WorkflowError);
    REQUIRE_THROWS_AS(catalog.register_workflow("coding", "again", nullptr), GraphError);

    Harness h([](const CompletionRequest&) { return ""; });
    WorkflowServices services;
    services.config = std::make_shared<const EngineConfig>(h.config);
    services.completion = h.llm;
    services.search = h.search;
    services.fetcher = h.fetcher;
    services.runner = h.runner;
    for (const auto& name : catalog.names()) {
        INFO(name);
        Workflow wf = catalog.build(name, services);
        REQUIRE(wf.name == name);
        REQUIRE(wf.graph);
        REQUIRE(wf.schema->has_field(wf.input_field));
        REQUIRE(wf.schema->has_field(wf.artifact_field));
    }
    REQUIRE_THROWS_AS(catalog.build("nope", services), WorkflowError);
}

// --- coding ---

TEST_CASE("Coding workflow repairs a crashing script", "[workflows][coding]") {
    Scratch scratch;
    Harness h([](const CompletionRequest& r) -> std::string {
        std::string p = prompt_of(r);
        if (has(p, "QA Engineer")) {
            return "```python\nimport temp_sandbox_script as app\n\ndef test_f():\n    assert app.f() == 1\n```";
        }
        if (has(p, "Write the script")) return "```python\nimport numpy\ndef f():\n    return 0\n```";
        if (has(p, "The script failed")) return "```python\ndef f():\n    return 1\n```";
        if (has(p, "verify the LOGIC")) return "PASSED";
        return "unexpected";
    });
    h.config.workspace.dir = scratch.dir.string();
    h.config.workspace.dependency_install = {"pip", "install"};
    h.runner->queue("python3", process_result(1, "", "Traceback: boom"));
    h.runner->queue("python3", process_result(0, "ran"));

    auto report = h.engine()->start("coding", "a function returning one", "code1");
    const State& s = report.result.final_state;

    REQUIRE(report.result.success);
    REQUIRE(report.result.completed());
    REQUIRE(report.result.exhausted_scopes.empty());
    REQUIRE(s["success"] == true);
    REQUIRE(s["iterations"] == 1);
    REQUIRE(s["verification_error"].is_null());
    REQUIRE(report.artifact_name == "solution");
    REQUIRE(has(report.artifact, "return 1"));
    REQUIRE(read_file(scratch.dir / "temp_sandbox_script.py") == report.artifact);
    REQUIRE(has(read_file(scratch.dir / "temp_generated_tests.py"), "def test_f"));

    REQUIRE(s["attempt_log"].size() == 2);
    REQUIRE(s["attempt_log"][0]["phase"] == "script");
    REQUIRE(s["attempt_log"][0]["exit_code"] == 1);
    REQUIRE(s["attempt_log"][1]["success"] == true);
    REQUIRE(has(s["output"].get<std::string>(), "--- TEST EXECUTION ---"));

    // the crash log reaches the repair prompt
    REQUIRE(h.prompts_containing("Traceback: boom") == 1);
    REQUIRE(h.prompts_containing("QA Engineer") == 1);

    std::vector<std::string> installed;
    for (const auto& call : h.runner->calls) {
        if (call.executable == "pip") installed.push_back(call.args.back());
    }
    REQUIRE(std::count(installed.begin(), installed.end(), "numpy") == 1);
    REQUIRE(std::count(installed.begin(), installed.end(), "pytest") == 2);
    REQUIRE(std::count(installed.begin(), installed.end(), "temp_sandbox_script") == 0);

    std::vector<std::string> pytest_args{"-m", "pytest", "temp_generated_tests.py"};
    REQUIRE(h.runner->calls.back().args == pytest_args);
    REQUIRE(h.runner->calls.back().working_dir == scratch.dir.string());
}

TEST_CASE("Coding workflow feeds verifier critiques back to the coder", "[workflows][coding]") {
    Scratch scratch;
    int verdicts = 0;
    Harness h([&verdicts](const CompletionRequest& r) -> std::string {
        std::string p = prompt_of(r);
        if (has(p, "QA Engineer")) return "```python\ndef test_ok():\n    pass\n```";
        if (has(p, "verify the LOGIC")) {
            return ++verdicts == 1 ? "FAILED: the inputs are all zero" : "PASSED";
        }
        return "```python\nprint('sim')\n```";
    });
    h.config.workspace.dir = scratch.dir.string();
    h.config.workspace.dependency_install = {};

    auto report = h.engine()->start("coding", "simulate a pendulum", "code2");
    REQUIRE(report.result.final_state["success"] == true);
    REQUIRE(report.result.final_state["iterations"] == 1);
    REQUIRE(h.prompts_containing("Critique: the inputs are all zero") == 1);
    REQUIRE(h.llm->count_for_model("qwen3-vl:8b") == 2);
}

TEST_CASE("Coding workflow gives up after the retry bound", "[workflows][coding]") {
    Scratch scratch;
    Harness h([](const CompletionRequest& r) -> std::string {
        if (has(prompt_of(r), "QA Engineer")) return "```python\ndef test_x():\n    assert False\n```";
        return "```python\nraise SystemExit(1)\n```";
    });
    h.config.workspace.dir = scratch.dir.string();
    h.config.workspace.dependency_install = {};
    h.config.limits.max_retries = 2;
    h.runner->queue("python3", process_result(1, "", "SystemExit"));

    auto report = h.engine()->start("coding", "impossible", "code3");
    REQUIRE(report.result.success);
    REQUIRE(report.result.completed());
    REQUIRE(report.result.exhausted_scopes == std::vector<std::string>{"retry"});
    REQUIRE(report.result.final_state["success"] == false);
    REQUIRE(report.result.final_state["iterations"] == 2);
    REQUIRE(report.result.final_state["attempt_log"].size() == 3);
    // best-effort artifact is still reported
    REQUIRE(has(report.artifact, "SystemExit"));
    REQUIRE(h.prompts_containing("verify the LOGIC") == 0);
}

TEST_CASE("Coding workflow reports a hung script as a timeout", "[workflows][coding]") {
    Scratch scratch;
    Harness h([](const CompletionRequest& r) -> std::string {
        if (has(prompt_of(r), "QA Engineer")) return "```python\ndef test_x():\n    pass\n```";
        return "```python\nwhile True: pass\n```";
    });
    h.config.workspace.dir = scratch.dir.string();
    h.config.workspace.dependency_install = {};
    h.config.limits.max_retries = 0;
    ProcessResult hung;
    hung.timed_out = true;
    hung.error = "timed out";
    h.runner->queue("python3", hung);

    auto report = h.engine()->start("coding", "spin", "code4");
    const State& s = report.result.final_state;
    REQUIRE(s["output"] == "System Error: timed out after 30s");
    REQUIRE(report.result.exhausted_scopes == std::vector<std::string>{"retry"});
}

// --- proof ---

TEST_CASE("Proof workflow routes syntax and logic failures differently", "[workflows][proof]") {
    Scratch scratch;
    int verdicts = 0;
    Harness h([&verdicts](const CompletionRequest& r) -> std::string {
        std::string p = prompt_of(r);
        if (has(p, "Mathematician")) return "By induction on n.";
        if (has(p, "Lean4 Expert")) return "```lean\ntheorem t : True := trivial\n```";
        if (has(p, "Debugger")) {
            return ++verdicts == 1 ? "TYPE: SYNTAX\nCRITIQUE: rename the lemma"
                                   : "TYPE: LOGIC\nCRITIQUE: the induction hypothesis is too weak";
        }
        return "unexpected";
    });
    h.config.workspace.dir = scratch.dir.string();
    h.runner->queue("lean", process_result(1, "error: unknown identifier 'foo'"));
    h.runner->queue("lean", process_result(1, "error: unsolved goals"));
    h.runner->queue("lean", process_result(0, ""));

    auto report = h.engine()->start("proof", "prove something", "proof1");
    const State& s = report.result.final_state;

    REQUIRE(report.result.completed());
    REQUIRE(report.result.exhausted_scopes.empty());
    REQUIRE(s["success"] == true);
    REQUIRE(s["iterations"] == 2);
    REQUIRE(report.artifact == "theorem t : True := trivial");
    REQUIRE(read_file(scratch.dir / "proof_attempt.lean") == report.artifact);

    REQUIRE(h.prompts_containing("Mathematician") == 2);
    REQUIRE(h.prompts_containing("Lean4 Expert") == 3);
    REQUIRE(h.prompts_containing("Debugger") == 2);
    // syntax repair sees the compiler log; logic repair sees the critique
    REQUIRE(h.prompts_containing("Error Log:\nerror: unknown identifier 'foo'") == 1);
    REQUIRE(h.prompts_containing("Arbiter Critique: CRITIQUE: the induction hypothesis is too weak") == 1);
}

TEST_CASE("Proof workflow explains a missing Lean toolchain", "[workflows][proof]") {
    Scratch scratch;
    Harness h([](const CompletionRequest&) { return std::string("TYPE: SYNTAX\nno idea"); });
    h.config.workspace.dir = scratch.dir.string();
    h.config.limits.proof_max_retries = 0;
    ProcessResult missing;
    missing.exit_code = 127;
    missing.error = "Failed to launch 'lean': No such file or directory";
    h.runner->queue("lean", missing);

    auto report = h.engine()->start("proof", "anything", "proof2");
    REQUIRE(report.result.final_state["compiler_output"] ==
            "Error: 'lean' executable not found. Please install Lean4.");
    REQUIRE(report.result.final_state["error_type"] == "SYNTAX");
    REQUIRE(report.result.exhausted_scopes == std::vector<std::string>{"proof"});
}

// --- deep research ---

TEST_CASE("Deep research runs bounded loops per section and edits once", "[workflows][deep_research]") {
    Harness h(
        [](const CompletionRequest& r) -> std::string {
            std::string p = prompt_of(r);
            if (has(p, "Create a logical outline")) return "- Alpha\n- Beta";
            if (has(p, "highly specific search queries") || has(p, "NEW search queries")) return "- q1";
            if (has(p, "single best URL")) return "https://example.com/page";
            if (has(p, "Extract comprehensive findings")) return "[Fact] x (Source: https://example.com/page)";
            if (has(p, "Current Section to write")) return "first draft";
            if (has(p, "Refine the section")) return "second draft";
            if (has(p, "Identify one weak")) return "\"check claim\"";
            if (has(p, "Critique the draft")) return "needs numbers";
            if (has(p, "Rewrite the draft")) return "refined draft";
            if (has(p, "Write a strong Introduction")) return "FINAL REPORT";
            return "unexpected";
        },
        sample_results(2));

    auto report = h.engine()->start("deep_research", "fusion energy", "deep1");
    const State& s = report.result.final_state;

    REQUIRE(report.result.success);
    REQUIRE(report.artifact == "FINAL REPORT");
    REQUIRE(s["section_plan"] == State({"Alpha", "Beta"}));
    REQUIRE(s["current_section_idx"] == 2);
    REQUIRE(s["completed_sections"] == State({"## Alpha\n\nrefined draft\n\n", "## Beta\n\nrefined draft\n\n"}));

    // 2 sections x 2 loops
    REQUIRE(h.prompts_containing("highly specific search queries") == 2);
    REQUIRE(h.prompts_containing("NEW search queries") == 2);
    REQUIRE(h.prompts_containing("Refine the section") == 2);
    REQUIRE(h.fetcher->fetched.size() == 4);
    REQUIRE(h.llm->count_for_model("cogito:14b") == 8);
    REQUIRE(h.llm->count_for_model("ministral-3:14b") == 1);
    REQUIRE(h.prompts_containing("Write a strong Introduction") == 1);
    REQUIRE(std::count(h.search->queries.begin(), h.search->queries.end(), "check claim") == 8);
    // critiques reach the refiner and the next round's gap queries
    REQUIRE(h.prompts_containing("Critiques:\n[cogito:14b]: needs numbers") == 4);
    REQUIRE(h.prompts_containing("Address these gaps: [cogito:14b]: needs numbers") == 2);
}

TEST_CASE("Deep research keeps search evidence when no URL is chosen", "[workflows][deep_research]") {
    Harness h(
        [](const CompletionRequest& r) -> std::string {
            std::string p = prompt_of(r);
            if (has(p, "Create a logical outline")) return "";
            if (has(p, "single best URL")) return "none of these";
            if (has(p, "search queries")) return "- only query";
            return "text";
        },
        sample_results(1));
    h.config.limits.section_max_loops = 1;

    auto report = h.engine()->start("deep_research", "tiny topic", "deep2");
    const State& s = report.result.final_state;
    REQUIRE(s["section_plan"] == State({"tiny topic"}));
    REQUIRE(h.fetcher->fetched.empty());
    REQUIRE(has(get_strings(s, "research_notes").at(0), "### Findings for 'only query':"));
    REQUIRE(s["completed_sections"].size() == 1);
}

// --- quorum ---

TEST_CASE("Quorum refines the draft for the configured rounds", "[workflows][quorum]") {
    int edits = 0;
    Harness h([&edits](const CompletionRequest& r) -> std::string {
        std::string p = prompt_of(r);
        if (has(p, "preliminary answer")) return "draft";
        if (has(p, "The Skeptic")) return "too vague";
        if (has(p, "The Structuralist")) return "add headers";
        if (has(p, "Lead Editor")) return "improved " + std::to_string(++edits);
        return "unexpected";
    });
    h.config.engine.parallel_calls = true;

    auto report = h.engine()->start("quorum", "What is a monad?", "q1");
    const State& s = report.result.final_state;

    REQUIRE(report.artifact_name == "answer");
    REQUIRE(report.artifact == "improved 2");
    REQUIRE(s["iteration"] == 2);
    REQUIRE(s["critiques"].empty());
    REQUIRE(h.prompts_containing("The Skeptic") == 2);
    REQUIRE(h.prompts_containing("Skeptic's Feedback: too vague\n\nStructuralist's Feedback: add headers") == 2);
    REQUIRE(h.prompts_containing("Current Draft: improved 1") >= 1);
}

// --- cited research ---

TEST_CASE("Cited research writes one note per planned query", "[workflows][cited_research]") {
    Harness h(
        [](const CompletionRequest& r) -> std::string {
            std::string p = prompt_of(r);
            if (has(p, "research planning assistant")) return "q1\n\nq2\nq3";
            if (has(p, "extract facts")) return "- fact (Source: https://example.com/0)";
            if (has(p, "technical writer")) return "REPORT [1]";
            return "unexpected";
        },
        sample_results(1));

    SECTION("all queries") {
        auto report = h.engine()->start("cited_research", "rust ownership", "c1");
        const State& s = report.result.final_state;
        REQUIRE(report.artifact == "REPORT [1]");
        REQUIRE(report.artifact_name == "cited_report");
        REQUIRE(s["plan"].empty());
        REQUIRE(s["content"].size() == 3);
        REQUIRE(has(s["content"][0].get<std::string>(), "### Sources for 'q1':"));
        REQUIRE(has(s["content"][2].get<std::string>(), "### Sources for 'q3':"));
        REQUIRE(h.search->queries == std::vector<std::string>{"q1", "q2", "q3"});
        REQUIRE(h.prompts_containing("### Sources for 'q2':") == 1);
    }
    SECTION("plan capped at the result limit") {
        h.config.limits.max_search_results = 2;
        auto report = h.engine()->start("cited_research", "rust ownership", "c2");
        REQUIRE(report.result.final_state["content"].size() == 2);
    }
}

// --- web scout ---

TEST_CASE("Selector replies are parsed leniently", "[workflows][web_scout]") {
    REQUIRE(parse_selection("[0, 4, 2]") == std::vector<size_t>{0, 4, 2});
    REQUIRE(parse_selection("Read these: [1,3]") == std::vector<size_t>{1, 3});
    REQUIRE(parse_selection("```json\n[2]\n```") == std::vector<size_t>{2});
    REQUIRE(parse_selection("[]") == std::vector<size_t>{});
    REQUIRE_FALSE(parse_selection("none of them"));
    REQUIRE_FALSE(parse_selection("{\"a\": 1}"));
}

TEST_CASE("Web scout reads the chosen links and cites them", "[workflows][web_scout]") {
    Harness h(
        [](const CompletionRequest& r) -> std::string {
            std::string p = prompt_of(r);
            if (has(p, "Generate 2 distinct search queries")) return "```json\n[\"a\", \"b\"]\n```";
            if (has(p, "indices of the top")) return "[3, 0, 9]";
            if (has(p, "Research Assistant")) return "  Summary [1] [2]  ";
            return "unexpected";
        },
        sample_results(4));

    auto report = h.engine()->start("web_scout", "state of the art", "w1");
    const State& s = report.result.final_state;

    REQUIRE(s["queries"] == State({"a", "b"}));
    REQUIRE(s["results"].size() == 4); // same hits for both queries, deduplicated
    REQUIRE(h.fetcher->fetched == std::vector<std::string>{"https://example.com/3", "https://example.com/0"});
    REQUIRE(s["pages"].size() == 2);
    REQUIRE(s["pages"][0]["content"] == "content of https://example.com/3");
    REQUIRE(report.artifact == "Summary [1] [2]");
    REQUIRE(report.artifact_name == "scout_report");
    // indices shown to the selector start at 0, sources cited from 1
    REQUIRE(h.prompts_containing("0. Result 0 (https://example.com/0)") == 1);
    REQUIRE(h.prompts_containing("--- SOURCE [1] ---\nURL: https://example.com/3") == 1);
}

TEST_CASE("Web scout falls back when selection fails", "[workflows][web_scout]") {
    Harness h(
        [](const CompletionRequest& r) -> std::string {
            std::string p = prompt_of(r);
            if (has(p, "Generate 2 distinct")) return "no json at all";
            if (has(p, "indices of the top")) return "I would read the first ones";
            return "summary";
        },
        sample_results(5));

    auto report = h.engine()->start("web_scout", "objective text", "w2");
    const State& s = report.result.final_state;
    REQUIRE(s["queries"] == State({"objective text"}));
    REQUIRE(h.fetcher->fetched.size() == 3);
    REQUIRE(h.fetcher->fetched.front() == "https://example.com/0");
}

TEST_CASE("Web scout without search results reports no data", "[workflows][web_scout]") {
    Harness h([](const CompletionRequest&) { return std::string("[\"q\"]"); });

    auto report = h.engine()->start("web_scout", "obscure", "w3");
    REQUIRE(report.artifact == "No relevant data found to read.");
    REQUIRE(h.fetcher->fetched.empty());
    REQUIRE(h.llm->requests().size() == 1);
}

// --- engine ---

namespace {

// "shout" upper-cases the input; fails while *failures > 0.
void register_shout(WorkflowEngine& engine, int* failures) {
    engine.catalog().register_workflow("shout", "test workflow", [failures](const WorkflowServices&) {
        Workflow wf;
        wf.name = "shout";
        wf.input_field = "text";
        wf.artifact_field = "loud";
        wf.artifact_name = "shout";
        wf.schema = std::make_shared<StateSchema>();
        wf.schema->overwrite("text", "").overwrite("loud", "");

        GraphBuilder builder;
        builder.add_stage("shout", [failures](const State& s) -> State {
            if (*failures > 0) {
                --*failures;
                throw ExternalServiceError("backend down");
            }
            std::string text = get_string(s, "text");
            std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::toupper(c); });
            return {{"loud", text}};
        });
        builder.set_entry("shout").add_edge("shout", kTerminal);
        wf.graph = builder.build();
        return wf;
    });
}

} // namespace

TEST_CASE("Engine starts, resumes and lists sessions", "[workflows][engine]") {
    Harness h([](const CompletionRequest&) { return std::string(); });
    auto engine = h.engine();
    int failures = 1;
    register_shout(*engine, &failures);

    auto first = engine->start("shout", "hello", "e1");
    REQUIRE_FALSE(first.result.success);
    REQUIRE(first.result.stage_pointer == "shout");
    REQUIRE(first.artifact.empty());
    REQUIRE(first.trace.size() == 1);
    REQUIRE(first.trace[0]["status"] == "failed");

    auto second = engine->resume("e1");
    REQUIRE(second.result.success);
    REQUIRE(second.result.resumed);
    REQUIRE(second.workflow == "shout");
    REQUIRE(second.artifact == "HELLO");

    // finished session: the default policy leaves it untouched
    auto third = engine->run_or_resume("shout", "ignored", "e1");
    REQUIRE(third.result.message == "Session already completed");
    REQUIRE(third.artifact == "HELLO");
    REQUIRE(third.trace.empty());

    auto sessions = engine->sessions();
    REQUIRE(sessions.size() == 1);
    REQUIRE(sessions[0].workflow == "shout");

    REQUIRE(engine->prune("e1"));
    REQUIRE_THROWS_AS(engine->resume("e1"), SessionNotFound);
}

TEST_CASE("Engine starts a session that does not exist yet", "[workflows][engine]") {
    Harness h([](const CompletionRequest&) { return std::string(); });
    auto engine = h.engine();
    int failures = 0;
    register_shout(*engine, &failures);

    auto report = engine->run_or_resume("shout", "new one", "fresh");
    REQUIRE(report.result.success);
    REQUIRE_FALSE(report.result.resumed);
    REQUIRE(report.artifact == "NEW ONE");

    auto generated = engine->start("shout", "x");
    REQUIRE(generated.result.session_id.size() == 8);
    REQUIRE_THROWS_AS(engine->start("shout", "again", "fresh"), WorkflowError);
    REQUIRE_THROWS_AS(engine->start("missing_workflow", "x"), WorkflowError);
}
