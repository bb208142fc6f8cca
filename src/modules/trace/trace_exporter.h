// modules/trace/trace_exporter.h
#ifndef AGENTGRAPH_MODULES_TRACE_TRACE_EXPORTER_H
#define AGENTGRAPH_MODULES_TRACE_TRACE_EXPORTER_H

#include "agentgraph/core/state.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agentgraph {

struct TraceRecord {
    std::string session_id;
    StageId stage;
    uint64_t seq = 0; // checkpoint sequence written after this stage
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::string status; // "running", "success", "failed"
    std::optional<std::string> error;
    nlohmann::json context_delta; // 执行前后状态的变化
    std::optional<std::string> route_label;
    std::optional<StageId> next_stage;
    nlohmann::json counters; // loop counters after the stage
};

class TraceExporter {
public:
    void set_session(std::string session_id) { session_id_ = std::move(session_id); }

    void on_stage_start(const StageId& stage);

    void on_stage_end(
        const StageId& stage,
        const std::string& status,
        const std::optional<std::string>& error,
        const nlohmann::json& initial_state,
        const nlohmann::json& final_state
    );

    // Fills in the routing decision and sequence number of the latest record of `stage`.
    void on_routed(const StageId& stage, const std::optional<std::string>& label,
                   const StageId& next, uint64_t seq, nlohmann::json counters);

    const std::vector<TraceRecord>& get_traces() const { return traces_; }
    void clear_traces() { traces_.clear(); }

    nlohmann::json to_json() const;

    static nlohmann::json calculate_context_delta(const nlohmann::json& initial, const nlohmann::json& final);

private:
    std::vector<TraceRecord> traces_;
    std::string session_id_;

    TraceRecord* find_latest(const StageId& stage);
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_TRACE_TRACE_EXPORTER_H
