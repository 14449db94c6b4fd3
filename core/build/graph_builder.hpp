#pragma once

#include "graph/graph.hpp"
#include "graph/topology_snapshot.hpp"
#include "diagnostics/diagnostic.hpp"
#include "rules/code_resolver.hpp"
#include "rules/requirement_parser.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace zpdes {

/// Hierarchy catalog entry for a real unit.
struct CatalogEntry {
    std::string id;
    UnitKind kind = UnitKind::Activity;
    std::string code;
    std::string label;
    std::string objective_id;   // parent objective of an activity
};

/// Unit id → catalog entry.
using Catalog = std::unordered_map<std::string, CatalogEntry>;

/// Source code → {metric name → value}, matched against edge source codes.
using Enrichment = std::map<std::string, std::map<std::string, double>>;

/// Builder configuration parameters.
struct BuildOptions {
    ParseMode parse_mode = ParseMode::Lenient;
    bool detect_cycles = true;           // scan activation edges for cycles after build
    bool derive_initially_open = true;   // units with no incoming activation are open
};

/// Optional inputs of a build. Null pointers mean "not supplied".
struct BuildSources {
    const TopologySnapshot* topology = nullptr;
    const Enrichment* enrichment = nullptr;
    const Catalog* catalog = nullptr;
};

/// A built graph and everything noteworthy that happened while building it.
struct BuildResult {
    Graph graph;
    std::vector<Diagnostic> diagnostics;
};

// ─── GraphBuilder ──────────────────────────────────────────────
// Turns a module's RuleSpecs into a Graph. References that do not
// resolve become ghost units instead of being dropped. Edges are keyed
// by (from, to, kind); repeats keep the stricter threshold. Stateless
// between calls.

class GraphBuilder {
public:
    explicit GraphBuilder(BuildOptions options = {}) : options_(options) {}

    const BuildOptions& options() const { return options_; }

    BuildResult build(const std::string& module_id,
                      const std::vector<RuleSpec>& rule_specs,
                      const CodeResolver& resolver,
                      const BuildSources& sources = {}) const;

    /// Parses every payload of the module, then builds. In Strict mode the
    /// first malformed token aborts with RuleImportError.
    BuildResult buildFromRules(const std::string& module_id,
                               const ModuleRules& rules,
                               const CodeResolver& resolver,
                               const BuildSources& sources = {}) const;

private:
    BuildOptions options_;
};

} // namespace zpdes
