#pragma once

#include "graph/unit.hpp"
#include "graph/dependency.hpp"
#include <vector>

namespace zpdes {

/// Pre-resolved topology shipped by an upstream step, same shape as a
/// built Graph. When present and non-empty it replaces rule parsing.
struct TopologySnapshot {
    std::vector<Unit> units;
    std::vector<Dependency> edges;

    bool empty() const { return units.empty() && edges.empty(); }
};

} // namespace zpdes
