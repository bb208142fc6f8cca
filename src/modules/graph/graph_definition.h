// modules/graph/graph_definition.h
#ifndef AGENTGRAPH_MODULES_GRAPH_GRAPH_DEFINITION_H
#define AGENTGRAPH_MODULES_GRAPH_GRAPH_DEFINITION_H

#include "agentgraph/core/stage.h"
#include "agentgraph/core/state.h"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace agentgraph {

// Outgoing edge of a stage. Conditional edges keep their label set closed:
// every label the router may produce is a key of `targets`.
struct Edge {
    using Router = std::function<std::string(const State&)>;

    StageId from;
    bool conditional = false;
    StageId to;                              // static edge target
    Router router;                           // conditional edge only
    std::map<std::string, StageId> targets;  // label -> stage or kTerminal
};

// 路由结果
struct RouteDecision {
    StageId next;
    std::optional<std::string> label; // only for conditional edges
};

class CompiledGraph {
public:
    const StageId& entry() const { return entry_; }
    bool has_stage(const StageId& id) const { return stages_.count(id) > 0; }
    Stage& stage(const StageId& id) const;
    const Edge& edge_from(const StageId& id) const;
    std::vector<StageId> stage_ids() const;

    // Evaluates the outgoing edge of `from` against the latest state.
    // Throws UnknownRoute when a router yields an undeclared label.
    RouteDecision route(const StageId& from, const State& state) const;

private:
    friend class GraphBuilder;
    StageId entry_;
    std::unordered_map<StageId, std::unique_ptr<Stage>> stages_;
    std::unordered_map<StageId, Edge> edges_;
    std::vector<StageId> order_; // insertion order, for listing
};

// Builds a graph once per workflow; build() validates it and hands out an immutable graph.
class GraphBuilder {
public:
    GraphBuilder& add_stage(std::unique_ptr<Stage> stage);
    GraphBuilder& add_stage(const StageId& id, FunctionStage::Fn fn);
    GraphBuilder& set_entry(const StageId& id);
    GraphBuilder& add_edge(const StageId& from, const StageId& to);

    // Type-erased form: labels are plain strings.
    GraphBuilder& add_conditional_edge(const StageId& from, Edge::Router router,
                                       std::map<std::string, StageId> targets);

    // Enum form: `to_string(Route)` must be visible by ADL.
    template <typename Route>
    GraphBuilder& add_conditional_edge(const StageId& from,
                                       std::function<Route(const State&)> router,
                                       const std::map<Route, StageId>& targets) {
        std::map<std::string, StageId> labelled;
        for (const auto& [route, target] : targets) {
            labelled.emplace(std::string(to_string(route)), target);
        }
        return add_conditional_edge(
            from,
            [router = std::move(router)](const State& state) { return std::string(to_string(router(state))); },
            std::move(labelled));
    }

    // Throws GraphError on a dangling target, a stage without an outgoing edge,
    // a missing entry or a duplicate definition.
    std::unique_ptr<CompiledGraph> build();

private:
    std::unique_ptr<CompiledGraph> graph_ = std::make_unique<CompiledGraph>();
    void check_not_built() const;
    void add_outgoing(Edge edge);
};

} // namespace agentgraph

#endif // AGENTGRAPH_MODULES_GRAPH_GRAPH_DEFINITION_H
