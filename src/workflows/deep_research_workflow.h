// workflows/deep_research_workflow.h
#ifndef AGENTGRAPH_WORKFLOWS_DEEP_RESEARCH_WORKFLOW_H
#define AGENTGRAPH_WORKFLOWS_DEEP_RESEARCH_WORKFLOW_H

#include "workflows/workflow.h"
#include <cstdint>
#include <string_view>

namespace agentgraph {

// Inner loop, evaluated after refiner
enum class SectionRoute : uint8_t { LOOP, DONE };
// Outer loop, evaluated after section_compiler
enum class PlanRoute : uint8_t { NEXT_SECTION, FINALIZE };

std::string_view to_string(SectionRoute route);
std::string_view to_string(PlanRoute route);

// Section-by-section report with a bounded refine loop per section.
Workflow build_deep_research_workflow(const WorkflowServices& services);

} // namespace agentgraph

#endif // AGENTGRAPH_WORKFLOWS_DEEP_RESEARCH_WORKFLOW_H
