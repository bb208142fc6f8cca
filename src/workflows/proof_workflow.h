// workflows/proof_workflow.h
#ifndef AGENTGRAPH_WORKFLOWS_PROOF_WORKFLOW_H
#define AGENTGRAPH_WORKFLOWS_PROOF_WORKFLOW_H

#include "workflows/workflow.h"
#include <cstdint>
#include <string_view>

namespace agentgraph {

// arbiter -> {done | fix_syntax: formalizer | fix_logic: theorist | give_up}
enum class ArbiterRoute : uint8_t { DONE, FIX_SYNTAX, FIX_LOGIC, GIVE_UP };

std::string_view to_string(ArbiterRoute route);

inline constexpr std::string_view kLeanFile = "proof_attempt.lean";

Workflow build_proof_workflow(const WorkflowServices& services);

} // namespace agentgraph

#endif // AGENTGRAPH_WORKFLOWS_PROOF_WORKFLOW_H
