// workflows/quorum_workflow.h
#ifndef AGENTGRAPH_WORKFLOWS_QUORUM_WORKFLOW_H
#define AGENTGRAPH_WORKFLOWS_QUORUM_WORKFLOW_H

#include "workflows/workflow.h"
#include <cstdint>
#include <string_view>

namespace agentgraph {

enum class QuorumRoute : uint8_t { CRITIQUE, DONE };

std::string_view to_string(QuorumRoute route);

// drafter -> quorum -> refiner -> {critique: quorum | done}
Workflow build_quorum_workflow(const WorkflowServices& services);

} // namespace agentgraph

#endif // AGENTGRAPH_WORKFLOWS_QUORUM_WORKFLOW_H
