// workflows/catalog.cpp
#include "workflows/catalog.h"
#include "agentgraph/core/errors.h"
#include "workflows/cited_research_workflow.h"
#include "workflows/coding_workflow.h"
#include "workflows/deep_research_workflow.h"
#include "workflows/proof_workflow.h"
#include "workflows/quorum_workflow.h"
#include "workflows/web_scout_workflow.h"

namespace agentgraph {

WorkflowCatalog::WorkflowCatalog() {
    register_workflow("coding", "Test-driven coding loop with execution and visual verification",
                      build_coding_workflow);
    register_workflow("proof", "Informal sketch, Lean4 formalization and classifier-driven repair",
                      build_proof_workflow);
    register_workflow("deep_research", "Outline, per-section research/write/critique loops, final edit",
                      build_deep_research_workflow);
    register_workflow("quorum", "Draft, reviewer panel critique and refinement rounds", build_quorum_workflow);
    register_workflow("cited_research", "Query plan, one researched note per query, cited report",
                      build_cited_research_workflow);
    register_workflow("web_scout", "Search, pick the best links, read them and write a cited summary",
                      build_web_scout_workflow);
}

void WorkflowCatalog::register_workflow(const std::string& name, std::string description, WorkflowFactory factory) {
    if (!entries_.emplace(name, Entry{std::move(description), std::move(factory)}).second) {
        throw GraphError("Workflow already registered: " + name);
    }
}

std::vector<std::string> WorkflowCatalog::names() const {
    std::vector<std::string> out;
    for (const auto& [name, _] : entries_) {
        out.push_back(name);
    }
    return out;
}

const WorkflowCatalog::Entry& WorkflowCatalog::entry(const std::string& name) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        throw WorkflowError("Unknown workflow: " + name);
    }
    return it->second;
}

const std::string& WorkflowCatalog::description(const std::string& name) const {
    return entry(name).description;
}

Workflow WorkflowCatalog::build(const std::string& name, const WorkflowServices& services) const {
    return entry(name).factory(services);
}

} // namespace agentgraph
