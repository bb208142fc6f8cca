// modules/executor/graph_executor.cpp
#include "modules/executor/graph_executor.h"
#include "agentgraph/core/errors.h"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace agentgraph {

GraphExecutor::GraphExecutor(const CompiledGraph& graph,
                             std::shared_ptr<const StateSchema> schema,
                             const RetryGovernor& governor,
                             CheckpointStore& checkpoints,
                             ExecutorOptions options)
    : graph_(graph),
      schema_(std::move(schema)),
      governor_(governor),
      checkpoints_(checkpoints),
      options_(options),
      session_(schema_, governor_) {}

ExecutionResult GraphExecutor::make_result(const Checkpoint& cp, bool success, std::string message, bool resumed) {
    ExecutionResult result;
    result.success = success;
    result.message = std::move(message);
    result.final_state = cp.state;
    result.session_id = cp.session_id;
    result.stage_pointer = cp.stage_pointer;
    result.last_stage = cp.last_stage;
    result.seq = cp.seq;
    result.exhausted_scopes = cp.exhausted_scopes;
    result.resumed = resumed;
    return result;
}

ExecutionResult GraphExecutor::start(const std::string& session_id, const State& inputs, const std::string& workflow) {
    SessionLock lock = checkpoints_.acquire(session_id);
    if (checkpoints_.exists(session_id)) {
        throw WorkflowError("Session already exists: " + session_id);
    }

    Checkpoint cp;
    cp.session_id = session_id;
    cp.workflow = workflow;
    cp.state = schema_->initial_state(inputs);
    cp.stage_pointer = graph_.entry();
    cp.last_stage = kStart;
    cp.seq = 0;
    checkpoints_.save(cp); // seq 0: 尚未执行任何阶段

    session_.get_trace_exporter().set_session(session_id);
    spdlog::info("[{}] session started at '{}'", session_id, cp.stage_pointer);
    return run_loop(std::move(cp), false);
}

ExecutionResult GraphExecutor::resume(const std::string& session_id) {
    SessionLock lock = checkpoints_.acquire(session_id);
    Checkpoint cp = checkpoints_.load(session_id);
    cp.state = schema_->conform(cp.state);
    session_.get_trace_exporter().set_session(session_id);

    if (cp.stage_pointer == kTerminal) {
        if (options_.terminal_policy == TerminalResumePolicy::NO_OP || cp.last_stage == kStart) {
            spdlog::info("[{}] session already terminal, nothing to resume", session_id);
            return make_result(cp, true, "Session already completed", true);
        }
        // reenter_loop: 重新执行最后完成的阶段并沿其出边继续
        spdlog::info("[{}] re-entering at '{}'", session_id, cp.last_stage);
        cp.stage_pointer = cp.last_stage;
        cp.exhausted_scopes.clear();
    } else if (!graph_.has_stage(cp.stage_pointer)) {
        throw GraphError("Checkpoint of " + session_id + " points at unknown stage: " + cp.stage_pointer);
    } else {
        spdlog::info("[{}] resuming at '{}' (seq {})", session_id, cp.stage_pointer, cp.seq);
    }
    return run_loop(std::move(cp), true);
}

ExecutionResult GraphExecutor::run_loop(Checkpoint cp, bool resumed) {
    int steps = 0;

    while (cp.stage_pointer != kTerminal) {
        if (steps >= options_.max_steps) {
            std::string msg = "Execution stopped: step limit (" + std::to_string(options_.max_steps) +
                              ") reached before '" + cp.stage_pointer + "'";
            spdlog::warn("[{}] {}", cp.session_id, msg);
            return make_result(cp, false, std::move(msg), resumed);
        }
        ++steps;

        const StageId current = cp.stage_pointer;
        Stage& stage = graph_.stage(current);

        // 1. 执行阶段（失败时检查点保持不变，恢复时会重跑该阶段）
        auto outcome = session_.execute_stage(stage, cp.state);
        if (!outcome.success) {
            return make_result(cp, false, outcome.message, resumed);
        }
        State state = std::move(outcome.new_state);

        // 2. 路由
        RouteDecision decision = graph_.route(current, state);
        if (decision.label) {
            state = session_.apply_route(current, *decision.label, state);
            for (auto& scope : governor_.exhausted_by(current, *decision.label)) {
                spdlog::warn("[{}] loop scope '{}' exhausted, terminating with best-effort result",
                             cp.session_id, scope);
                if (std::find(cp.exhausted_scopes.begin(), cp.exhausted_scopes.end(), scope) ==
                    cp.exhausted_scopes.end()) {
                    cp.exhausted_scopes.push_back(std::move(scope));
                }
            }
            spdlog::info("[{}] {} -[{}]-> {}", cp.session_id, current, *decision.label, decision.next);
        } else {
            spdlog::info("[{}] {} -> {}", cp.session_id, current, decision.next);
        }

        // 3. 检查点：记录下一个指针
        cp.state = std::move(state);
        cp.last_stage = current;
        cp.stage_pointer = decision.next;
        ++cp.seq;
        checkpoints_.save(cp);

        session_.get_trace_exporter().on_routed(current, decision.label, decision.next, cp.seq,
                                                session_.counters(cp.state));
    }

    spdlog::info("[{}] session reached terminal after {} step(s)", cp.session_id, steps);
    return make_result(cp, true, "Execution completed", resumed);
}

} // namespace agentgraph
