// workflows/coding_workflow.h
#ifndef AGENTGRAPH_WORKFLOWS_CODING_WORKFLOW_H
#define AGENTGRAPH_WORKFLOWS_CODING_WORKFLOW_H

#include "workflows/workflow.h"
#include <cstdint>
#include <string_view>

namespace agentgraph {

// tester -> coder -> dependency_manager -> executor -> verifier -> {done | retry: coder | give_up}
enum class VerifyRoute : uint8_t { DONE, RETRY, GIVE_UP };

std::string_view to_string(VerifyRoute route);

inline constexpr std::string_view kScriptName = "temp_sandbox_script.py";
inline constexpr std::string_view kTestName = "temp_generated_tests.py";
inline constexpr std::string_view kPlotName = "output_plot.png";

Workflow build_coding_workflow(const WorkflowServices& services);

} // namespace agentgraph

#endif // AGENTGRAPH_WORKFLOWS_CODING_WORKFLOW_H
