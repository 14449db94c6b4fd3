#include "query/graph_query.hpp"

#include <algorithm>
#include <deque>
#include <sstream>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace zpdes {

namespace {

void reportCycles(const Graph& graph, const std::set<std::string>& region,
                  const std::string& origin, DiagnosticSink& sink) {
    for (const auto& cycle : GraphQuery::findActivationCycles(graph, &region)) {
        sink.recordOnce(DiagnosticKind::GraphIntegrityWarning, cycle.front(),
                        "activation cycle reached from " + origin + ": " +
                            GraphQuery::describePath(cycle));
    }
}

// Parent objective an activity bridges to, or null.
const std::string* bridgeTarget(const Graph& graph, const std::string& unit_id) {
    const Unit* unit = graph.getUnit(unit_id);
    if (!unit || !unit->isActivity()) return nullptr;
    const std::string& objective = unit->objective_id;
    if (objective.empty() || objective == unit_id || !graph.hasUnit(objective)) return nullptr;
    return &objective;
}

} // namespace

// ─── Filtering ────────────────────────────────────────────────

Graph GraphQuery::filterByObjectives(const Graph& graph,
                                     const std::set<std::string>& objective_ids) {
    if (objective_ids.empty()) {
        return Graph(graph.moduleId(), {}, {});
    }

    // Selection may name objectives by id or by code.
    auto selected = [&](const std::string& objective_id) {
        if (objective_id.empty()) return false;
        if (objective_ids.count(objective_id)) return true;
        const Unit* objective = graph.getUnit(objective_id);
        return objective && !objective->code.empty() && objective_ids.count(objective->code) > 0;
    };

    std::unordered_set<std::string> keep;
    graph.forEachUnit([&](const Unit& unit) {
        if (unit.module_id == graph.moduleId() && selected(unit.owningObjective())) {
            keep.insert(unit.id);
        }
    });
    return graph.extractSubgraph(keep);
}

// ─── Closures ─────────────────────────────────────────────────

ClosureResult GraphQuery::closure(const Graph& graph, const std::string& unit_id,
                                  Direction direction, bool bridge_objectives) {
    ClosureResult result;
    DiagnosticSink sink;
    if (!graph.hasUnit(unit_id)) {
        sink.record(DiagnosticKind::UnresolvedReference, unit_id,
                    "unit not in graph of module " + graph.moduleId());
        result.diagnostics = sink.take();
        return result;
    }

    std::set<std::string> visited{unit_id};
    std::deque<std::string> queue{unit_id};
    while (!queue.empty()) {
        std::string current = queue.front();
        queue.pop_front();

        const std::vector<size_t> indices = direction == Direction::Incoming
                                                ? graph.getIncoming(current)
                                                : graph.getOutgoing(current);
        for (size_t index : indices) {
            const Dependency& edge = graph.getEdge(index);
            if (!edge.isActivation()) continue;
            const std::string& next =
                direction == Direction::Incoming ? edge.from_id : edge.to_id;
            if (visited.insert(next).second) queue.push_back(next);
        }

        // Each unit is dequeued once, so each activity bridges at most once.
        if (bridge_objectives) {
            const std::string* objective = bridgeTarget(graph, current);
            if (objective && visited.insert(*objective).second) queue.push_back(*objective);
        }
    }

    reportCycles(graph, visited, unit_id, sink);
    visited.erase(unit_id);
    result.unit_ids = std::move(visited);
    result.diagnostics = sink.take();
    return result;
}

ClosureResult GraphQuery::ancestors(const Graph& graph, const std::string& unit_id) {
    return closure(graph, unit_id, Direction::Incoming, true);
}

ClosureResult GraphQuery::descendants(const Graph& graph, const std::string& unit_id) {
    return closure(graph, unit_id, Direction::Outgoing, false);
}

FocusResult GraphQuery::focusNeighborhood(const Graph& graph, const std::string& unit_id) {
    FocusResult result;
    ClosureResult up = ancestors(graph, unit_id);
    ClosureResult down = descendants(graph, unit_id);

    DiagnosticSink sink;
    for (const auto& d : up.diagnostics) sink.recordOnce(d.kind, d.subject, d.message);
    for (const auto& d : down.diagnostics) sink.recordOnce(d.kind, d.subject, d.message);
    result.diagnostics = sink.take();

    if (!graph.hasUnit(unit_id)) return result;

    result.unit_ids.insert(unit_id);
    result.unit_ids.insert(up.unit_ids.begin(), up.unit_ids.end());
    result.unit_ids.insert(down.unit_ids.begin(), down.unit_ids.end());

    for (const Dependency& edge : graph.edges()) {
        if (result.unit_ids.count(edge.from_id) && result.unit_ids.count(edge.to_id)) {
            result.edges.push_back(edge);
        }
    }
    return result;
}

// ─── Prerequisite chain ───────────────────────────────────────

ChainResult GraphQuery::prerequisiteChain(const Graph& graph, const std::set<std::string>& seeds) {
    ChainResult result;
    DiagnosticSink sink;

    std::deque<std::pair<std::string, int>> queue;
    for (const auto& seed : seeds) {
        if (graph.hasUnit(seed)) {
            queue.emplace_back(seed, 0);
        } else {
            sink.recordOnce(DiagnosticKind::UnresolvedReference, seed,
                            "unit not in graph of module " + graph.moduleId());
        }
    }

    std::set<std::string> visited;
    std::unordered_set<std::string> seen_edges;
    while (!queue.empty()) {
        auto [target, depth] = queue.front();
        queue.pop_front();
        if (!visited.insert(target).second) continue;

        for (size_t index : graph.getIncoming(target)) {
            const Dependency& edge = graph.getEdge(index);
            if (!edge.isActivation() || !seen_edges.insert(edge.edge_id).second) continue;
            result.links.push_back({edge, depth + 1});
            if (!visited.count(edge.from_id)) queue.emplace_back(edge.from_id, depth + 1);
        }

        // No inferred link where a declared objective -> activity edge exists.
        if (const std::string* objective = bridgeTarget(graph, target)) {
            if (!graph.findEdge(*objective, target, DependencyKind::Activation)) {
                Dependency bridge(*objective, target, DependencyKind::Activation);
                bridge.is_inferred = true;
                bridge.edge_id = graph.moduleId() + ":bridge:" + *objective + "->" + target;
                if (seen_edges.insert(bridge.edge_id).second) {
                    result.links.push_back({std::move(bridge), depth + 1});
                }
            }
            if (!visited.count(*objective)) queue.emplace_back(*objective, depth + 1);
        }
    }

    std::stable_sort(result.links.begin(), result.links.end(),
                     [](const ChainLink& a, const ChainLink& b) {
                         return std::tie(a.depth, a.edge.to_id, a.edge.from_id) <
                                std::tie(b.depth, b.edge.to_id, b.edge.from_id);
                     });

    reportCycles(graph, visited, "prerequisite chain", sink);
    result.diagnostics = sink.take();
    return result;
}

// ─── Integrity ────────────────────────────────────────────────

std::vector<std::vector<std::string>> GraphQuery::findActivationCycles(
    const Graph& graph, const std::set<std::string>* within) {
    enum class Color { White, Gray, Black };
    struct Frame {
        std::string id;
        std::vector<size_t> out;
        size_t next = 0;
    };

    auto in_scope = [&](const std::string& id) { return !within || within->count(id) > 0; };

    std::unordered_map<std::string, Color> color;
    std::vector<std::vector<std::string>> cycles;

    for (const std::string& root : graph.getUnitIds()) {
        if (!in_scope(root) || color[root] != Color::White) continue;

        std::vector<Frame> stack;
        color[root] = Color::Gray;
        stack.push_back({root, graph.getOutgoing(root), 0});

        while (!stack.empty()) {
            Frame& top = stack.back();
            if (top.next == top.out.size()) {
                color[top.id] = Color::Black;
                stack.pop_back();
                continue;
            }
            const Dependency& edge = graph.getEdge(top.out[top.next++]);
            if (!edge.isActivation() || !in_scope(edge.to_id)) continue;

            Color c = color[edge.to_id];
            if (c == Color::Gray) {
                // Back edge: the cycle is the stack suffix starting at to_id.
                auto start = std::find_if(stack.begin(), stack.end(), [&](const Frame& f) {
                    return f.id == edge.to_id;
                });
                std::vector<std::string> cycle;
                for (auto it = start; it != stack.end(); ++it) cycle.push_back(it->id);
                cycle.push_back(edge.to_id);
                cycles.push_back(std::move(cycle));
            } else if (c == Color::White) {
                color[edge.to_id] = Color::Gray;
                stack.push_back({edge.to_id, graph.getOutgoing(edge.to_id), 0});
            }
        }
    }
    return cycles;
}

std::string GraphQuery::describePath(const std::vector<std::string>& ids) {
    std::ostringstream oss;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i) oss << " -> ";
        oss << ids[i];
    }
    return oss.str();
}

} // namespace zpdes
