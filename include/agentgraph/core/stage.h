#ifndef AGENTGRAPH_CORE_STAGE_H
#define AGENTGRAPH_CORE_STAGE_H

#include "agentgraph/core/state.h"
#include <functional>
#include <memory>
#include <string>

namespace agentgraph {

// Base Stage: reads the full state, returns only the fields it changes.
struct Stage {
    StageId id;

    explicit Stage(StageId id) : id(std::move(id)) {}
    virtual ~Stage() = default;

    [[nodiscard]] virtual State run(const State& state) = 0;
};

// Stage backed by a callable; what every bundled workflow uses.
struct FunctionStage : public Stage {
    using Fn = std::function<State(const State&)>;

    FunctionStage(StageId id, Fn fn) : Stage(std::move(id)), fn_(std::move(fn)) {}

    [[nodiscard]] State run(const State& state) override {
        State partial = fn_(state);
        if (partial.is_null()) {
            return State::object(); // {} 表示无变化
        }
        return partial;
    }

private:
    Fn fn_;
};

inline std::unique_ptr<Stage> make_stage(StageId id, FunctionStage::Fn fn) {
    return std::make_unique<FunctionStage>(std::move(id), std::move(fn));
}

} // namespace agentgraph

#endif // AGENTGRAPH_CORE_STAGE_H
