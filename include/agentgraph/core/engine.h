#ifndef AGENTGRAPH_CORE_ENGINE_H
#define AGENTGRAPH_CORE_ENGINE_H

#include "agentgraph/core/result.h"
#include "common/config/engine_config.h"
#include "modules/checkpoint/checkpoint_store.h"
#include "workflows/catalog.h"
#include "workflows/workflow.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace agentgraph {

struct RunReport {
    ExecutionResult result;
    std::string workflow;
    std::string artifact_name; // output file prefix
    std::string artifact;      // artifact field of the final state, as text
    nlohmann::json trace;      // stage records of this call only
};

// Facade: catalog + collaborators + checkpoint store.
class WorkflowEngine {
public:
    // Real collaborators (curl, ollama/llama, search chain, posix runner, file checkpoints).
    static std::unique_ptr<WorkflowEngine> from_config(ConfigPtr config);
    static std::unique_ptr<WorkflowEngine> from_config_file(const std::string& path);

    WorkflowEngine(WorkflowServices services, std::shared_ptr<BlobStore> blobs);

    // New session; an empty id gets a generated one. Throws WorkflowError if the id exists.
    RunReport start(const std::string& workflow, const std::string& objective, std::string session_id = "");
    // Throws SessionNotFound.
    RunReport resume(const std::string& session_id);
    // Resumes when the session exists, starts it otherwise.
    RunReport run_or_resume(const std::string& workflow, const std::string& objective, const std::string& session_id);

    std::vector<Checkpoint> sessions() const;
    bool prune(const std::string& session_id);

    WorkflowCatalog& catalog() { return catalog_; }
    const WorkflowCatalog& catalog() const { return catalog_; }
    const EngineConfig& config() const { return *services_.config; }

private:
    WorkflowServices services_;
    std::shared_ptr<BlobStore> blobs_;
    CheckpointStore checkpoints_;
    WorkflowCatalog catalog_;

    RunReport execute(const std::string& workflow, const std::string& session_id,
                      const std::string* objective);
};

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_ENGINE_H
