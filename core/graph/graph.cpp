#include "graph/graph.hpp"
#include <stdexcept>

namespace zpdes {

Graph::Graph(std::string module_id, std::vector<Unit> units, std::vector<Dependency> edges)
    : module_id_(std::move(module_id)) {
    for (auto& unit : units) {
        std::string id = unit.id;
        if (id.empty()) {
            throw std::runtime_error("Unit with empty id in module " + module_id_);
        }
        if (!units_.emplace(id, std::move(unit)).second) {
            throw std::runtime_error("Unit ID already exists: " + id);
        }
        outgoing_[id];  // ensure entry exists
        incoming_[id];
    }

    edges_.reserve(edges.size());
    for (auto& edge : edges) {
        if (edge.from_id == edge.to_id)
            throw std::runtime_error("Self-loop on unit: " + edge.from_id);
        if (!units_.count(edge.from_id))
            throw std::runtime_error("Source unit not found: " + edge.from_id);
        if (!units_.count(edge.to_id))
            throw std::runtime_error("Target unit not found: " + edge.to_id);

        size_t index = edges_.size();
        outgoing_[edge.from_id].push_back(index);
        incoming_[edge.to_id].push_back(index);
        edges_.push_back(std::move(edge));
    }
}

// ─── Units ─────────────────────────────────────────────────────

const Unit* Graph::getUnit(const std::string& id) const {
    auto it = units_.find(id);
    return it != units_.end() ? &it->second : nullptr;
}

std::vector<std::string> Graph::getUnitIds() const {
    std::vector<std::string> ids;
    ids.reserve(units_.size());
    for (const auto& [id, _] : units_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<Unit> Graph::units() const {
    std::vector<Unit> out;
    out.reserve(units_.size());
    for (const auto& [_, unit] : units_) {
        out.push_back(unit);
    }
    return out;
}

size_t Graph::ghostCount() const {
    size_t count = 0;
    for (const auto& [_, unit] : units_) {
        if (unit.is_ghost) ++count;
    }
    return count;
}

// ─── Edges ─────────────────────────────────────────────────────

const Dependency* Graph::findEdge(const std::string& from_id, const std::string& to_id,
                                  DependencyKind kind) const {
    auto it = outgoing_.find(from_id);
    if (it == outgoing_.end()) return nullptr;
    for (size_t index : it->second) {
        const Dependency& e = edges_[index];
        if (e.to_id == to_id && e.kind == kind) return &e;
    }
    return nullptr;
}

// ─── Adjacency queries ────────────────────────────────────────

std::vector<size_t> Graph::getOutgoing(const std::string& unit_id) const {
    auto it = outgoing_.find(unit_id);
    if (it == outgoing_.end()) return {};
    return it->second;
}

std::vector<size_t> Graph::getIncoming(const std::string& unit_id) const {
    auto it = incoming_.find(unit_id);
    if (it == incoming_.end()) return {};
    return it->second;
}

// ─── Subgraph extraction ──────────────────────────────────────

Graph Graph::extractSubgraph(const std::unordered_set<std::string>& unit_ids) const {
    std::vector<Unit> kept_units;
    for (const auto& [id, unit] : units_) {
        if (unit_ids.count(id)) kept_units.push_back(unit);
    }
    std::vector<Dependency> kept_edges;
    for (const Dependency& edge : edges_) {
        if (unit_ids.count(edge.from_id) && unit_ids.count(edge.to_id)) {
            kept_edges.push_back(edge);
        }
    }
    return Graph(module_id_, std::move(kept_units), std::move(kept_edges));
}

// ─── Iteration ─────────────────────────────────────────────────

void Graph::forEachUnit(std::function<void(const Unit&)> fn) const {
    for (const auto& [_, unit] : units_) {
        fn(unit);
    }
}

} // namespace zpdes
