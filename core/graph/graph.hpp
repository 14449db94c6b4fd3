#pragma once

#include "graph/unit.hpp"
#include "graph/dependency.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace zpdes {

// ─── Graph ─────────────────────────────────────────────────────
// One module's unlock-dependency graph. Flat unit table keyed by id,
// edges stored in a vector and referenced by index from the adjacency
// lists. Immutable once constructed: filtered or annotated views are
// new Graph values built from this one.

class Graph {
public:
    Graph() = default;

    /// Throws std::runtime_error on a duplicate unit id, a self-loop, or an
    /// edge endpoint with no unit.
    Graph(std::string module_id, std::vector<Unit> units, std::vector<Dependency> edges);

    const std::string& moduleId() const { return module_id_; }

    // ── Units ──
    const Unit* getUnit(const std::string& id) const;
    bool hasUnit(const std::string& id) const { return units_.count(id) > 0; }
    std::vector<std::string> getUnitIds() const;
    std::vector<Unit> units() const;
    size_t unitCount() const { return units_.size(); }
    size_t ghostCount() const;

    // ── Edges ──
    const std::vector<Dependency>& edges() const { return edges_; }
    const Dependency& getEdge(size_t index) const { return edges_.at(index); }
    size_t edgeCount() const { return edges_.size(); }
    const Dependency* findEdge(const std::string& from_id, const std::string& to_id,
                               DependencyKind kind) const;

    // ── Adjacency queries (edge indices) ──
    std::vector<size_t> getOutgoing(const std::string& unit_id) const;
    std::vector<size_t> getIncoming(const std::string& unit_id) const;

    // ── Subgraph extraction ──
    /// Units in `unit_ids` plus the edges whose both endpoints survive.
    Graph extractSubgraph(const std::unordered_set<std::string>& unit_ids) const;

    // ── Iteration ──
    void forEachUnit(std::function<void(const Unit&)> fn) const;

    bool operator==(const Graph& other) const {
        return module_id_ == other.module_id_ && units_ == other.units_ &&
               edges_ == other.edges_;
    }
    bool operator!=(const Graph& other) const { return !(*this == other); }

private:
    std::string module_id_;
    std::map<std::string, Unit> units_;
    std::vector<Dependency> edges_;

    // Adjacency lists: unit id → indices into edges_
    std::unordered_map<std::string, std::vector<size_t>> outgoing_;
    std::unordered_map<std::string, std::vector<size_t>> incoming_;
};

} // namespace zpdes
