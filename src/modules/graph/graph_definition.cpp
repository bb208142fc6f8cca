// modules/graph/graph_definition.cpp
#include "modules/graph/graph_definition.h"
#include "agentgraph/core/errors.h"

namespace agentgraph {

Stage& CompiledGraph::stage(const StageId& id) const {
    auto it = stages_.find(id);
    if (it == stages_.end()) {
        throw GraphError("Stage not found in graph: " + id);
    }
    return *it->second;
}

const Edge& CompiledGraph::edge_from(const StageId& id) const {
    auto it = edges_.find(id);
    if (it == edges_.end()) {
        throw GraphError("Stage has no outgoing edge: " + id);
    }
    return it->second;
}

std::vector<StageId> CompiledGraph::stage_ids() const {
    return order_;
}

RouteDecision CompiledGraph::route(const StageId& from, const State& state) const {
    const Edge& edge = edge_from(from);
    if (!edge.conditional) {
        return {edge.to, std::nullopt};
    }

    std::string label = edge.router(state);
    auto it = edge.targets.find(label);
    if (it == edge.targets.end()) {
        std::string declared;
        for (const auto& [known, _] : edge.targets) {
            if (!declared.empty()) declared += ", ";
            declared += known;
        }
        throw UnknownRoute("Router of '" + from + "' returned '" + label + "', declared: [" + declared + "]");
    }
    return {it->second, label};
}

// --- GraphBuilder ---

void GraphBuilder::check_not_built() const {
    if (!graph_) {
        throw GraphError("GraphBuilder already consumed by build()");
    }
}

GraphBuilder& GraphBuilder::add_stage(std::unique_ptr<Stage> stage) {
    check_not_built();
    if (!stage) {
        throw GraphError("Cannot add a null stage");
    }
    const StageId id = stage->id;
    if (id.empty() || id == kStart || id == kTerminal) {
        throw GraphError("Invalid stage id: '" + id + "'");
    }
    if (!graph_->stages_.emplace(id, std::move(stage)).second) {
        throw GraphError("Duplicate stage: " + id);
    }
    graph_->order_.push_back(id);
    return *this;
}

GraphBuilder& GraphBuilder::add_stage(const StageId& id, FunctionStage::Fn fn) {
    return add_stage(make_stage(id, std::move(fn)));
}

GraphBuilder& GraphBuilder::set_entry(const StageId& id) {
    check_not_built();
    graph_->entry_ = id;
    return *this;
}

void GraphBuilder::add_outgoing(Edge edge) {
    check_not_built();
    // 每个阶段只有一条出边（静态或条件）
    if (graph_->edges_.count(edge.from) > 0) {
        throw GraphError("Stage already has an outgoing edge: " + edge.from);
    }
    graph_->edges_.emplace(edge.from, std::move(edge));
}

GraphBuilder& GraphBuilder::add_edge(const StageId& from, const StageId& to) {
    Edge edge;
    edge.from = from;
    edge.to = to;
    add_outgoing(std::move(edge));
    return *this;
}

GraphBuilder& GraphBuilder::add_conditional_edge(const StageId& from, Edge::Router router,
                                                 std::map<std::string, StageId> targets) {
    if (!router) {
        throw GraphError("Conditional edge of '" + from + "' has no router");
    }
    if (targets.empty()) {
        throw GraphError("Conditional edge of '" + from + "' declares no outcomes");
    }
    Edge edge;
    edge.from = from;
    edge.conditional = true;
    edge.router = std::move(router);
    edge.targets = std::move(targets);
    add_outgoing(std::move(edge));
    return *this;
}

std::unique_ptr<CompiledGraph> GraphBuilder::build() {
    check_not_built();
    CompiledGraph& g = *graph_;

    if (g.entry_.empty()) {
        throw GraphError("Graph has no entry stage");
    }
    if (!g.has_stage(g.entry_)) {
        throw GraphError("Entry stage not defined: " + g.entry_);
    }

    auto check_target = [&g](const StageId& from, const StageId& to) {
        if (to != kTerminal && !g.has_stage(to)) {
            throw GraphError("Edge " + from + " -> " + to + " targets an undefined stage");
        }
    };

    for (const auto& [from, edge] : g.edges_) {
        if (!g.has_stage(from)) {
            throw GraphError("Edge declared from undefined stage: " + from);
        }
        if (edge.conditional) {
            for (const auto& [label, to] : edge.targets) {
                check_target(from, to);
            }
        } else {
            check_target(from, edge.to);
        }
    }
    for (const auto& id : g.order_) {
        if (g.edges_.count(id) == 0) {
            throw GraphError("Stage has no outgoing edge: " + id);
        }
    }

    return std::move(graph_);
}

} // namespace agentgraph
