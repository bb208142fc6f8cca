// workflows/web_scout_workflow.h
#ifndef AGENTGRAPH_WORKFLOWS_WEB_SCOUT_WORKFLOW_H
#define AGENTGRAPH_WORKFLOWS_WEB_SCOUT_WORKFLOW_H

#include "workflows/workflow.h"
#include <optional>
#include <string>
#include <vector>

namespace agentgraph {

// Indices chosen by the selector reply ("[0, 4, 2]", possibly wrapped in prose).
// nullopt when the reply holds no parsable integer list.
std::optional<std::vector<size_t>> parse_selection(const std::string& reply);

// generate_queries -> search_metadata -> select_links -> read_pages -> synthesize
Workflow build_web_scout_workflow(const WorkflowServices& services);

} // namespace agentgraph

#endif // AGENTGRAPH_WORKFLOWS_WEB_SCOUT_WORKFLOW_H
