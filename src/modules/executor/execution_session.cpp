// modules/executor/execution_session.cpp
#include "modules/executor/execution_session.h"
#include "agentgraph/core/errors.h"
#include <spdlog/spdlog.h>

namespace agentgraph {

ExecutionSession::ExecutionSession(std::shared_ptr<const StateSchema> schema, const RetryGovernor& governor)
    : schema_(std::move(schema)), governor_(governor) {}

ExecutionSession::StageOutcome ExecutionSession::execute_stage(Stage& stage, const State& state) {
    StageOutcome result;
    result.new_state = state;
    result.success = true;
    result.message = "Stage executed successfully";

    // 1. 进入作用域时重置计数器
    State entered = StateStore::apply(*schema_, state, governor_.on_stage_entered(stage.id, state));

    // 2. 记录 Trace 开始
    trace_exporter_.on_stage_start(stage.id);
    spdlog::debug("stage {} started", stage.id);

    // 3. 执行阶段并合并
    State next;
    try {
        State partial = stage.run(entered);
        next = StateStore::apply(*schema_, entered, partial);
        next = StateStore::apply(*schema_, next, governor_.on_stage_completed(stage.id, next));
    } catch (const SchemaViolation& e) {
        trace_exporter_.on_stage_end(stage.id, "failed", std::string(e.what()), state, state);
        throw;
    } catch (const std::exception& e) {
        result.success = false;
        result.message = "Stage '" + stage.id + "' failed: " + e.what();
    }

    // 4. 记录 Trace 结束
    if (result.success) {
        result.new_state = std::move(next);
        trace_exporter_.on_stage_end(stage.id, "success", std::nullopt, state, result.new_state);
        spdlog::debug("stage {} finished", stage.id);
    } else {
        trace_exporter_.on_stage_end(stage.id, "failed", result.message, state, state);
        spdlog::error("{}", result.message);
    }
    return result;
}

State ExecutionSession::apply_route(const StageId& from, const std::string& label, const State& state) const {
    return StateStore::apply(*schema_, state, governor_.on_route_taken(from, label, state));
}

nlohmann::json ExecutionSession::counters(const State& state) const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& scope : governor_.scopes()) {
        out[scope.name] = {
            {"value", governor_.counter(scope.name, state)},
            {"bound", governor_.bound(scope.name, state)}
        };
    }
    return out;
}

} // namespace agentgraph
