// modules/state/state_store.cpp
#include "modules/state/state_store.h"
#include "agentgraph/core/errors.h"

namespace agentgraph {

// --- StateSchema ---

StateSchema& StateSchema::declare(const std::string& field, MergePolicy policy, Value default_value) {
    if (field.empty()) {
        throw SchemaViolation("State field name must not be empty");
    }
    auto it = fields_.find(field);
    if (it != fields_.end() && it->second.policy != policy) {
        throw SchemaViolation("Field '" + field + "' already declared as " +
                              std::string(to_string(it->second.policy)) + ", cannot redeclare as " +
                              std::string(to_string(policy)));
    }

    FieldSpec spec;
    spec.policy = policy;
    if (policy == MergePolicy::APPEND_ORDERED) {
        spec.default_value = default_value.is_array() ? std::move(default_value) : Value::array();
    } else {
        spec.default_value = std::move(default_value);
    }
    fields_[field] = std::move(spec);
    return *this;
}

StateSchema& StateSchema::overwrite(const std::string& field, Value default_value) {
    return declare(field, MergePolicy::OVERWRITE, std::move(default_value));
}

StateSchema& StateSchema::append(const std::string& field) {
    return declare(field, MergePolicy::APPEND_ORDERED, Value::array());
}

bool StateSchema::has_field(const std::string& field) const {
    return fields_.count(field) > 0;
}

MergePolicy StateSchema::policy_of(const std::string& field) const {
    auto it = fields_.find(field);
    if (it == fields_.end()) {
        throw SchemaViolation("Undeclared state field: " + field);
    }
    return it->second.policy;
}

std::vector<std::string> StateSchema::field_names() const {
    std::vector<std::string> names;
    names.reserve(fields_.size());
    for (const auto& [name, _] : fields_) {
        names.push_back(name);
    }
    return names;
}

State StateSchema::initial_state(const State& inputs) const {
    State state = State::object();
    for (const auto& [name, spec] : fields_) {
        state[name] = spec.default_value;
    }
    if (inputs.is_null() || inputs.empty()) {
        return state;
    }
    return StateStore::apply(*this, state, inputs);
}

State StateSchema::conform(const State& restored) const {
    if (!restored.is_object()) {
        throw SchemaViolation("Restored state is not an object");
    }
    State state = State::object();
    for (const auto& [name, spec] : fields_) {
        auto it = restored.find(name);
        if (it == restored.end()) {
            state[name] = spec.default_value;
            continue;
        }
        if (spec.policy == MergePolicy::APPEND_ORDERED && !it->is_array()) {
            throw SchemaViolation("Append field '" + name + "' restored as non-array");
        }
        state[name] = *it;
    }
    for (auto it = restored.begin(); it != restored.end(); ++it) {
        if (!has_field(it.key())) {
            throw SchemaViolation("Restored state contains undeclared field: " + it.key());
        }
    }
    return state;
}

// --- StateStore ---

StateStore::StateStore(std::shared_ptr<const StateSchema> schema)
    : schema_(std::move(schema)) {
    current_ = schema_->initial_state();
}

StateStore::StateStore(std::shared_ptr<const StateSchema> schema, State initial)
    : schema_(std::move(schema)), current_(std::move(initial)) {}

State StateStore::apply(const StateSchema& schema, const State& current, const State& partial) {
    if (partial.is_null()) {
        return current.is_object() ? current : State::object(); // 空更新
    }
    if (!partial.is_object()) {
        throw SchemaViolation("Partial update must be an object, got: " + std::string(partial.type_name()));
    }

    State next = current.is_object() ? current : State::object();
    for (auto it = partial.begin(); it != partial.end(); ++it) {
        const std::string& key = it.key();
        MergePolicy policy = schema.policy_of(key); // 未声明字段 -> SchemaViolation

        if (policy == MergePolicy::OVERWRITE) {
            next[key] = it.value();
        } else {
            merge_append(next[key], it.value());
        }
    }
    return next;
}

void StateStore::merge_append(Value& target, const Value& source) {
    if (!target.is_array()) {
        target = Value::array();
    }
    if (source.is_array()) {
        for (const auto& item : source) {
            target.push_back(item);
        }
    } else {
        target.push_back(source); // 单个值视为长度为 1 的序列
    }
}

const State& StateStore::merge(const State& partial) {
    current_ = apply(*schema_, current_, partial);
    return current_;
}

void StateStore::reset(State state) {
    current_ = schema_->conform(state);
}

} // namespace agentgraph
