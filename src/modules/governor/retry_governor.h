// modules/governor/retry_governor.h
#ifndef AGENTGRAPH_MODULES_GOVERNOR_RETRY_GOVERNOR_H
#define AGENTGRAPH_MODULES_GOVERNOR_RETRY_GOVERNOR_H

#include "agentgraph/core/state.h"
#include "modules/state/state_store.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace agentgraph {

struct RouteRef {
    StageId from;
    std::string label;
};

// A named bounded counter. The counter lives in the state record (overwrite field)
// so it is merged and checkpointed like any other field.
struct LoopScope {
    std::string name;
    std::string counter_field;
    int64_t max_iterations = 0;               // constant bound
    std::optional<std::string> bound_field;   // bound = length of this list field
    std::optional<StageId> reset_on_entry;    // counter := 0 when this stage starts
    std::optional<StageId> count_after;       // counter += 1 when this stage completes
    std::vector<RouteRef> count_on_routes;    // counter += 1 when one of these routes is taken
    std::vector<RouteRef> exhaustion_routes;  // taking one marks the scope exhausted
};

// Verdict of a flat bounded retry loop
enum class RetryVerdict : uint8_t {
    DONE,      // body succeeded
    REPAIR,    // failed, budget left: loop back
    EXHAUSTED  // failed, bound reached: terminate with the best-effort artifact
};

std::string_view to_string(RetryVerdict verdict);

// RetryGovernor 管理所有循环作用域的计数器
class RetryGovernor {
public:
    RetryGovernor& add_scope(LoopScope scope);

    const LoopScope& scope(const std::string& name) const;
    const std::vector<LoopScope>& scopes() const { return scopes_; }

    // Declares every counter as an overwrite field defaulting to 0.
    void declare_fields(StateSchema& schema) const;

    int64_t counter(const std::string& scope_name, const State& state) const;
    int64_t bound(const std::string& scope_name, const State& state) const;
    bool has_remaining(const std::string& scope_name, const State& state) const;

    RetryVerdict retry_verdict(const std::string& scope_name, const State& state, bool succeeded) const;

    // Hooks called by the executor; each returns a partial update (possibly empty).
    State on_stage_entered(const StageId& stage, const State& state) const;
    State on_stage_completed(const StageId& stage, const State& state) const;
    State on_route_taken(const StageId& from, const std::string& label, const State& state) const;

    // Scopes whose exhaustion route matches (from, label).
    std::vector<std::string> exhausted_by(const StageId& from, const std::string& label) const;

private:
    std::vector<LoopScope> scopes_;

    static int64_t read_counter(const LoopScope& scope, const State& state);
    static bool matches(const std::vector<RouteRef>& routes, const StageId& from, const std::string& label);
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_GOVERNOR_RETRY_GOVERNOR_H
