// modules/state/state_store.h
#ifndef AGENTGRAPH_MODULES_STATE_STATE_STORE_H
#define AGENTGRAPH_MODULES_STATE_STATE_STORE_H

#include "agentgraph/core/state.h"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace agentgraph {

struct FieldSpec {
    MergePolicy policy = MergePolicy::OVERWRITE;
    Value default_value; // append 字段默认为 []
};

// Statically declared record layout: one entry per field, policy fixed at declaration.
class StateSchema {
public:
    // Redeclaring a field with a different policy raises SchemaViolation.
    StateSchema& declare(const std::string& field, MergePolicy policy, Value default_value = nullptr);
    StateSchema& overwrite(const std::string& field, Value default_value = nullptr);
    StateSchema& append(const std::string& field);

    bool has_field(const std::string& field) const;
    MergePolicy policy_of(const std::string& field) const;
    const std::map<std::string, FieldSpec>& fields() const { return fields_; }
    std::vector<std::string> field_names() const;

    // Defaults overlaid with caller inputs (inputs are merged like any partial update).
    State initial_state(const State& inputs = State::object()) const;

    // Checks a restored record: every key declared, append fields hold arrays.
    // Fields missing from the record are filled with their defaults.
    State conform(const State& restored) const;

private:
    std::map<std::string, FieldSpec> fields_;
};

// StateStore 持有当前状态并按字段策略合并阶段输出
class StateStore {
public:
    explicit StateStore(std::shared_ptr<const StateSchema> schema);
    StateStore(std::shared_ptr<const StateSchema> schema, State initial);

    // Pure merge: next = current with partial applied field by field.
    static State apply(const StateSchema& schema, const State& current, const State& partial);

    // Merges into the held record and returns it.
    const State& merge(const State& partial);
    void reset(State state);

    const State& current() const { return current_; }
    const StateSchema& schema() const { return *schema_; }
    std::shared_ptr<const StateSchema> schema_ptr() const { return schema_; }

private:
    std::shared_ptr<const StateSchema> schema_;
    State current_;

    static void merge_append(Value& target, const Value& source);
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_STATE_STATE_STORE_H
