// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"
#include <algorithm>

namespace agentgraph {

namespace {

int64_t to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

void TraceExporter::on_stage_start(const StageId& stage) {
    TraceRecord record;
    record.session_id = session_id_;
    record.stage = stage;
    record.start_time = std::chrono::system_clock::now();
    record.status = "running"; // updated in on_stage_end
    record.context_delta = nlohmann::json::object();
    traces_.push_back(std::move(record));
}

TraceRecord* TraceExporter::find_latest(const StageId& stage) {
    auto it = std::find_if(traces_.rbegin(), traces_.rend(),
                           [&stage](const TraceRecord& r) { return r.stage == stage; });
    return it == traces_.rend() ? nullptr : &*it;
}

void TraceExporter::on_stage_end(
    const StageId& stage,
    const std::string& status,
    const std::optional<std::string>& error,
    const nlohmann::json& initial_state,
    const nlohmann::json& final_state) {

    TraceRecord* record = find_latest(stage);
    if (!record || record->status != "running") {
        return;
    }
    record->end_time = std::chrono::system_clock::now();
    record->status = status;
    record->error = error;
    record->context_delta = calculate_context_delta(initial_state, final_state);
}

void TraceExporter::on_routed(const StageId& stage, const std::optional<std::string>& label,
                              const StageId& next, uint64_t seq, nlohmann::json counters) {
    TraceRecord* record = find_latest(stage);
    if (!record) {
        return;
    }
    record->route_label = label;
    record->next_stage = next;
    record->seq = seq;
    record->counters = std::move(counters);
}

nlohmann::json TraceExporter::to_json() const {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& tr : traces_) {
        nlohmann::json tj;
        tj["session_id"] = tr.session_id;
        tj["stage"] = tr.stage;
        tj["seq"] = tr.seq;
        tj["status"] = tr.status;
        tj["start_ms"] = to_millis(tr.start_time);
        tj["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(tr.end_time - tr.start_time).count();
        tj["context_delta"] = tr.context_delta;
        if (tr.error) tj["error"] = *tr.error;
        if (tr.route_label) tj["route"] = *tr.route_label;
        if (tr.next_stage) tj["next"] = *tr.next_stage;
        if (!tr.counters.is_null()) tj["counters"] = tr.counters;
        out.push_back(std::move(tj));
    }
    return out;
}

nlohmann::json TraceExporter::calculate_context_delta(const nlohmann::json& initial, const nlohmann::json& final) {
    // 顶层字段比较；append 字段只记录新增的尾部
    nlohmann::json delta = nlohmann::json::object();
    if (!final.is_object()) {
        return delta;
    }
    for (auto it = final.begin(); it != final.end(); ++it) {
        const std::string& key = it.key();
        auto prev = initial.is_object() ? initial.find(key) : initial.end();
        if (initial.is_object() && prev != initial.end()) {
            if (*prev == it.value()) continue;
            if (prev->is_array() && it->is_array() && it->size() > prev->size() &&
                std::equal(prev->begin(), prev->end(), it->begin())) {
                nlohmann::json tail = nlohmann::json::array();
                for (size_t i = prev->size(); i < it->size(); ++i) {
                    tail.push_back((*it)[i]);
                }
                delta[key] = {{"appended", tail}};
                continue;
            }
        }
        delta[key] = it.value();
    }
    return delta;
}

} // namespace agentgraph
