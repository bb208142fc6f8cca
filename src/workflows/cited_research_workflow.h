// workflows/cited_research_workflow.h
#ifndef AGENTGRAPH_WORKFLOWS_CITED_RESEARCH_WORKFLOW_H
#define AGENTGRAPH_WORKFLOWS_CITED_RESEARCH_WORKFLOW_H

#include "workflows/workflow.h"
#include <cstdint>
#include <string_view>

namespace agentgraph {

enum class ResearchRoute : uint8_t { RESEARCH, WRITE };

std::string_view to_string(ResearchRoute route);

// planner -> researcher (one query per pass, until the plan is empty) -> writer
Workflow build_cited_research_workflow(const WorkflowServices& services);

} // namespace agentgraph

#endif // AGENTGRAPH_WORKFLOWS_CITED_RESEARCH_WORKFLOW_H
