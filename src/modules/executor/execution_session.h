// modules/executor/execution_session.h
#ifndef AGENTGRAPH_MODULES_EXECUTOR_EXECUTION_SESSION_H
#define AGENTGRAPH_MODULES_EXECUTOR_EXECUTION_SESSION_H

#include "agentgraph/core/stage.h"
#include "agentgraph/core/state.h"
#include "modules/governor/retry_governor.h"
#include "modules/state/state_store.h"
#include "modules/trace/trace_exporter.h"
#include <memory>
#include <string>

namespace agentgraph {

// ExecutionSession 封装单个阶段的执行：计数器重置、合并、计数、Trace
class ExecutionSession {
public:
    ExecutionSession(std::shared_ptr<const StateSchema> schema, const RetryGovernor& governor);

    struct StageOutcome {
        State new_state;
        bool success = false;
        std::string message;
    };

    // Runs one stage against `state`. On failure new_state is `state` unchanged.
    // SchemaViolation propagates to the caller.
    StageOutcome execute_stage(Stage& stage, const State& state);

    // Applies the loop-back bookkeeping of a taken route.
    State apply_route(const StageId& from, const std::string& label, const State& state) const;

    TraceExporter& get_trace_exporter() { return trace_exporter_; }
    const TraceExporter& get_trace_exporter() const { return trace_exporter_; }
    const StateSchema& schema() const { return *schema_; }

    // Current value of every loop counter, for traces and logs.
    nlohmann::json counters(const State& state) const;

private:
    std::shared_ptr<const StateSchema> schema_;
    const RetryGovernor& governor_;
    TraceExporter trace_exporter_;
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_EXECUTOR_EXECUTION_SESSION_H
