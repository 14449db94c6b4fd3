#pragma once

#include "graph/graph.hpp"
#include "diagnostics/diagnostic.hpp"

#include <set>
#include <string>
#include <vector>

namespace zpdes {

/// Transitive closure result. Never contains the queried unit itself.
struct ClosureResult {
    std::set<std::string> unit_ids;
    std::vector<Diagnostic> diagnostics;

    bool contains(const std::string& id) const { return unit_ids.count(id) > 0; }
    size_t size() const { return unit_ids.size(); }
};

/// Units and edges to highlight around a focal unit.
struct FocusResult {
    std::set<std::string> unit_ids;
    std::vector<Dependency> edges;
    std::vector<Diagnostic> diagnostics;
};

/// One edge of a prerequisite chain, `depth` hops away from the seeds.
struct ChainLink {
    Dependency edge;
    int depth = 0;
};

struct ChainResult {
    std::vector<ChainLink> links;
    std::vector<Diagnostic> diagnostics;
};

// ─── GraphQuery ────────────────────────────────────────────────
// Read-only queries over a built Graph. Closures follow activation
// edges only. Ancestor traversal bridges every visited activity to its
// parent objective, since objective-level rules gate the activities
// beneath them. Traversals track visited units, so cycles terminate and
// are reported as GraphIntegrityWarning diagnostics.

class GraphQuery {
public:
    /// Units owned by one of `objective_ids` (an objective owns itself),
    /// plus the edges between them. Empty selection → empty graph.
    static Graph filterByObjectives(const Graph& graph, const std::set<std::string>& objective_ids);

    /// Everything that must be mastered before `unit_id`.
    static ClosureResult ancestors(const Graph& graph, const std::string& unit_id);

    /// Everything `unit_id` transitively unlocks.
    static ClosureResult descendants(const Graph& graph, const std::string& unit_id);

    /// {unit} ∪ ancestors ∪ descendants, and every edge inside that set.
    static FocusResult focusNeighborhood(const Graph& graph, const std::string& unit_id);

    /// Incoming activation edges reachable backwards from `seeds`, with
    /// bridging links as inferred edges; sorted by (depth, to, from).
    static ChainResult prerequisiteChain(const Graph& graph, const std::set<std::string>& seeds);

    /// Cycles among activation edges, each as a closed path of unit ids
    /// (first id repeated at the end). Optionally restricted to `within`.
    static std::vector<std::vector<std::string>> findActivationCycles(
        const Graph& graph, const std::set<std::string>* within = nullptr);

    /// "a -> b -> a"
    static std::string describePath(const std::vector<std::string>& ids);

private:
    enum class Direction { Incoming, Outgoing };

    static ClosureResult closure(const Graph& graph, const std::string& unit_id,
                                 Direction direction, bool bridge_objectives);
};

} // namespace zpdes
