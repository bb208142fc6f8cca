// modules/executor/graph_executor.h
#ifndef AGENTGRAPH_MODULES_EXECUTOR_GRAPH_EXECUTOR_H
#define AGENTGRAPH_MODULES_EXECUTOR_GRAPH_EXECUTOR_H

#include "agentgraph/core/result.h"
#include "agentgraph/core/state.h"
#include "modules/checkpoint/checkpoint_store.h"
#include "modules/executor/execution_session.h"
#include "modules/governor/retry_governor.h"
#include "modules/graph/graph_definition.h"
#include "modules/state/state_store.h"
#include "modules/trace/trace_exporter.h"
#include <memory>
#include <string>
#include <vector>

namespace agentgraph {

struct ExecutorOptions {
    int max_steps = 500; // 每次 start/resume 调用内最多执行的阶段数
    TerminalResumePolicy terminal_policy = TerminalResumePolicy::NO_OP;
};

// Drives one session through a compiled graph: run stage, merge, route, checkpoint, repeat.
class GraphExecutor {
public:
    GraphExecutor(const CompiledGraph& graph,
                  std::shared_ptr<const StateSchema> schema,
                  const RetryGovernor& governor,
                  CheckpointStore& checkpoints,
                  ExecutorOptions options = {});

    // New session. Throws WorkflowError when the id already has a checkpoint,
    // SessionLocked when another run holds it, SchemaViolation on undeclared inputs.
    ExecutionResult start(const std::string& session_id, const State& inputs, const std::string& workflow = "");

    // Continues from the stored pointer. Throws SessionNotFound / SessionLocked.
    ExecutionResult resume(const std::string& session_id);

    const TraceExporter& get_trace_exporter() const { return session_.get_trace_exporter(); }
    std::vector<TraceRecord> get_last_traces() const { return session_.get_trace_exporter().get_traces(); }

private:
    const CompiledGraph& graph_;
    std::shared_ptr<const StateSchema> schema_;
    const RetryGovernor& governor_;
    CheckpointStore& checkpoints_;
    ExecutorOptions options_;
    ExecutionSession session_;

    ExecutionResult run_loop(Checkpoint checkpoint, bool resumed);
    static ExecutionResult make_result(const Checkpoint& cp, bool success, std::string message, bool resumed);
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_EXECUTOR_GRAPH_EXECUTOR_H
