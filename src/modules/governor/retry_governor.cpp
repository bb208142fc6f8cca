// modules/governor/retry_governor.cpp
#include "modules/governor/retry_governor.h"
#include "agentgraph/core/errors.h"
#include <algorithm>

namespace agentgraph {

std::string_view to_string(RetryVerdict verdict) {
    switch (verdict) {
        case RetryVerdict::DONE: return "done";
        case RetryVerdict::REPAIR: return "repair";
        case RetryVerdict::EXHAUSTED: return "exhausted";
    }
    return "unknown";
}

RetryGovernor& RetryGovernor::add_scope(LoopScope scope) {
    if (scope.name.empty() || scope.counter_field.empty()) {
        throw GraphError("Loop scope needs a name and a counter field");
    }
    if (scope.max_iterations < 0) {
        throw GraphError("Loop scope '" + scope.name + "' has a negative bound");
    }
    for (const auto& existing : scopes_) {
        if (existing.name == scope.name) {
            throw GraphError("Duplicate loop scope: " + scope.name);
        }
        if (existing.counter_field == scope.counter_field) {
            throw GraphError("Loop scopes '" + existing.name + "' and '" + scope.name +
                             "' share counter field " + scope.counter_field);
        }
    }
    scopes_.push_back(std::move(scope));
    return *this;
}

const LoopScope& RetryGovernor::scope(const std::string& name) const {
    auto it = std::find_if(scopes_.begin(), scopes_.end(),
                           [&name](const LoopScope& s) { return s.name == name; });
    if (it == scopes_.end()) {
        throw GraphError("Unknown loop scope: " + name);
    }
    return *it;
}

void RetryGovernor::declare_fields(StateSchema& schema) const {
    for (const auto& s : scopes_) {
        schema.overwrite(s.counter_field, 0);
    }
}

int64_t RetryGovernor::read_counter(const LoopScope& scope, const State& state) {
    auto it = state.find(scope.counter_field);
    if (it == state.end() || !it->is_number_integer()) {
        return 0;
    }
    return it->get<int64_t>();
}

int64_t RetryGovernor::counter(const std::string& scope_name, const State& state) const {
    return read_counter(scope(scope_name), state);
}

int64_t RetryGovernor::bound(const std::string& scope_name, const State& state) const {
    const LoopScope& s = scope(scope_name);
    if (s.bound_field) {
        auto it = state.find(*s.bound_field);
        if (it == state.end() || !it->is_array()) {
            return 0;
        }
        return static_cast<int64_t>(it->size());
    }
    return s.max_iterations;
}

bool RetryGovernor::has_remaining(const std::string& scope_name, const State& state) const {
    return counter(scope_name, state) < bound(scope_name, state);
}

RetryVerdict RetryGovernor::retry_verdict(const std::string& scope_name, const State& state, bool succeeded) const {
    if (succeeded) {
        return RetryVerdict::DONE;
    }
    // 达到上限后无论结果如何都终止
    return has_remaining(scope_name, state) ? RetryVerdict::REPAIR : RetryVerdict::EXHAUSTED;
}

State RetryGovernor::on_stage_entered(const StageId& stage, const State& state) const {
    State partial = State::object();
    for (const auto& s : scopes_) {
        if (s.reset_on_entry && *s.reset_on_entry == stage && read_counter(s, state) != 0) {
            partial[s.counter_field] = 0;
        }
    }
    return partial;
}

State RetryGovernor::on_stage_completed(const StageId& stage, const State& state) const {
    State partial = State::object();
    for (const auto& s : scopes_) {
        if (s.count_after && *s.count_after == stage) {
            partial[s.counter_field] = read_counter(s, state) + 1;
        }
    }
    return partial;
}

bool RetryGovernor::matches(const std::vector<RouteRef>& routes, const StageId& from, const std::string& label) {
    return std::any_of(routes.begin(), routes.end(),
                       [&](const RouteRef& r) { return r.from == from && r.label == label; });
}

State RetryGovernor::on_route_taken(const StageId& from, const std::string& label, const State& state) const {
    State partial = State::object();
    for (const auto& s : scopes_) {
        if (matches(s.count_on_routes, from, label)) {
            partial[s.counter_field] = read_counter(s, state) + 1;
        }
    }
    return partial;
}

std::vector<std::string> RetryGovernor::exhausted_by(const StageId& from, const std::string& label) const {
    std::vector<std::string> names;
    for (const auto& s : scopes_) {
        if (matches(s.exhaustion_routes, from, label)) {
            names.push_back(s.name);
        }
    }
    return names;
}

} // namespace agentgraph
