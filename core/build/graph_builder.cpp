#include "build/graph_builder.hpp"
#include "diagnostics/errors.hpp"
#include "query/graph_query.hpp"
#include "rules/code_shape.hpp"
#include "util/logging.hpp"

#include <set>
#include <sstream>
#include <tuple>

namespace zpdes {

namespace {

std::string describe(const std::optional<Threshold>& threshold) {
    if (!threshold) return "none";
    std::ostringstream oss;
    oss << toString(threshold->metric) << " " << threshold->value;
    return oss.str();
}

// ─── BuildContext ──────────────────────────────────────────────
// Mutable scratch state of a single build. Units are keyed by id so a
// unit referenced as both target and source collapses to one entry;
// the first insertion decides whether it is a ghost.

class BuildContext {
public:
    BuildContext(std::string module_id, const CodeResolver& resolver,
                 const Catalog* catalog, DiagnosticSink& sink)
        : module_id_(std::move(module_id)), resolver_(resolver),
          catalog_(catalog), sink_(sink) {}

    std::string resolveReference(const std::string& ref);
    void addSnapshotUnit(Unit unit);
    void ensureEndpoint(const std::string& id);
    void addEdge(Dependency edge);
    void markOpen(const std::string& id);
    void deriveInitiallyOpen();
    void applyEnrichment(const Enrichment& enrichment);

    Graph finish();

private:
    void ensureRealUnit(const std::string& id, const std::string& code_hint);
    void ensureGhostUnit(const std::string& code);
    std::string parentObjectiveFor(const std::string& code) const;

    std::string module_id_;
    const CodeResolver& resolver_;
    const Catalog* catalog_;
    DiagnosticSink& sink_;

    std::map<std::string, Unit> units_;
    std::vector<Dependency> edges_;
    std::map<std::tuple<std::string, std::string, DependencyKind>, size_t> edge_index_;
};

std::string BuildContext::resolveReference(const std::string& ref) {
    std::string code = trim(ref);
    std::vector<std::string> candidates = resolver_.resolveCode(code);
    if (!candidates.empty()) {
        const std::string& chosen = candidates.front();
        if (candidates.size() > 1) {
            std::ostringstream oss;
            oss << "code maps to " << candidates.size() << " ids (";
            for (size_t i = 0; i < candidates.size(); ++i) {
                if (i) oss << ", ";
                oss << candidates[i];
            }
            oss << "); using " << chosen;
            sink_.recordOnce(DiagnosticKind::AmbiguousCodeResolution, code, oss.str());
        }
        ensureRealUnit(chosen, code);
        return chosen;
    }

    // Rule sources may key by id instead of code.
    if (resolver_.isKnownId(code) || (catalog_ && catalog_->count(code))) {
        ensureRealUnit(code, "");
        return code;
    }

    sink_.recordOnce(DiagnosticKind::UnresolvedReference, code,
                     "no unit id for '" + code + "' in module " + module_id_ +
                         "; ghost unit created");
    ensureGhostUnit(code);
    return code;
}

std::string BuildContext::parentObjectiveFor(const std::string& code) const {
    std::string objective_code = objectiveCodeOf(code);
    if (objective_code.empty()) return "";
    std::vector<std::string> ids = resolver_.resolveCode(objective_code);
    return ids.empty() ? objective_code : ids.front();
}

void BuildContext::ensureRealUnit(const std::string& id, const std::string& code_hint) {
    if (units_.count(id)) return;

    Unit unit(id, UnitKind::Activity, module_id_);
    const CatalogEntry* entry = nullptr;
    if (catalog_) {
        auto it = catalog_->find(id);
        if (it != catalog_->end()) entry = &it->second;
    }

    if (entry && !entry->code.empty()) {
        unit.code = entry->code;
    } else if (auto preferred = resolver_.preferredCode(id)) {
        unit.code = *preferred;
    } else {
        unit.code = code_hint;
    }

    if (entry) {
        unit.kind = entry->kind;
        unit.label = entry->label;
        unit.objective_id = entry->objective_id;
    } else {
        unit.kind = unitKindFromCode(unit.displayCode());
        if (unit.isActivity()) unit.objective_id = parentObjectiveFor(unit.code);
    }
    if (unit.isObjective()) unit.objective_id.clear();

    units_.emplace(id, std::move(unit));
}

void BuildContext::ensureGhostUnit(const std::string& code) {
    if (units_.count(code)) return;
    Unit unit(code, unitKindFromCode(code), module_id_);
    unit.code = code;
    unit.is_ghost = true;
    if (unit.isActivity()) unit.objective_id = parentObjectiveFor(code);
    units_.emplace(code, std::move(unit));
}

void BuildContext::addSnapshotUnit(Unit unit) {
    if (unit.id.empty()) {
        sink_.record(DiagnosticKind::GraphIntegrityWarning, unit.code,
                     "topology unit without id skipped");
        return;
    }
    if (units_.count(unit.id)) {
        sink_.record(DiagnosticKind::GraphIntegrityWarning, unit.id,
                     "duplicate unit in topology snapshot; first entry kept");
        return;
    }
    if (unit.module_id.empty()) unit.module_id = module_id_;
    unit.overlay.reset();
    std::string id = unit.id;
    units_.emplace(id, std::move(unit));
}

// Snapshot edges name ids, never codes, so the endpoint keeps its id.
void BuildContext::ensureEndpoint(const std::string& id) {
    if (units_.count(id)) return;
    if (resolver_.isKnownId(id) || (catalog_ && catalog_->count(id))) {
        ensureRealUnit(id, "");
        return;
    }
    sink_.recordOnce(DiagnosticKind::UnresolvedReference, id,
                     "topology edge endpoint '" + id + "' has no unit in module " +
                         module_id_ + "; ghost unit created");
    ensureGhostUnit(id);
}

void BuildContext::addEdge(Dependency edge) {
    if (edge.from_id == edge.to_id) {
        sink_.record(DiagnosticKind::SelfLoopRejected, edge.from_id,
                     std::string(toString(edge.kind)) + " edge from a unit to itself dropped");
        return;
    }

    auto key = std::make_tuple(edge.from_id, edge.to_id, edge.kind);
    auto it = edge_index_.find(key);
    if (it != edge_index_.end()) {
        Dependency& existing = edges_[it->second];
        if (existing.threshold != edge.threshold) {
            bool replace = isStricter(edge.threshold, existing.threshold);
            std::string kept = describe(replace ? edge.threshold : existing.threshold);
            sink_.record(DiagnosticKind::GraphIntegrityWarning, existing.edge_id,
                         "duplicate edge with thresholds " + describe(existing.threshold) +
                             " and " + describe(edge.threshold) + "; keeping " + kept);
            if (replace) existing.threshold = edge.threshold;
        }
        return;
    }

    if (edge.edge_id.empty()) {
        edge.edge_id = module_id_ + ":" + toString(edge.kind) + ":" + edge.from_id + "->" +
                       edge.to_id;
    }
    edge_index_.emplace(key, edges_.size());
    edges_.push_back(std::move(edge));
}

void BuildContext::markOpen(const std::string& id) {
    auto it = units_.find(id);
    if (it != units_.end()) it->second.initially_open = true;
}

void BuildContext::deriveInitiallyOpen() {
    std::set<std::string> gated;
    for (const Dependency& edge : edges_) {
        if (edge.isActivation()) gated.insert(edge.to_id);
    }
    for (auto& [id, unit] : units_) {
        if (!unit.is_ghost && !gated.count(id)) unit.initially_open = true;
    }
}

void BuildContext::applyEnrichment(const Enrichment& enrichment) {
    for (const auto& [raw_code, metrics] : enrichment) {
        std::string code = trim(raw_code);
        bool matched = false;
        for (Dependency& edge : edges_) {
            const std::string& source = edge.source_code.empty()
                                            ? units_.at(edge.from_id).displayCode()
                                            : edge.source_code;
            if (source != code) continue;
            for (const auto& [metric, value] : metrics) {
                edge.enrichment[metric] = value;
            }
            matched = true;
        }
        if (!matched) {
            sink_.record(DiagnosticKind::UnusedEnrichment, code,
                         "enrichment matches no edge source in module " + module_id_);
        }
    }
}

Graph BuildContext::finish() {
    std::vector<Unit> units;
    units.reserve(units_.size());
    for (auto& [_, unit] : units_) {
        units.push_back(std::move(unit));
    }
    units_.clear();
    edge_index_.clear();
    return Graph(module_id_, std::move(units), std::move(edges_));
}

BuildResult buildWithSink(const BuildOptions& options, const std::string& module_id,
                          const std::vector<RuleSpec>& rule_specs,
                          const CodeResolver& resolver, const BuildSources& sources,
                          DiagnosticSink& sink) {
    BuildContext ctx(module_id, resolver, sources.catalog, sink);

    bool from_topology = sources.topology && !sources.topology->empty();
    if (from_topology) {
        log::logger()->debug("Module {}: using topology snapshot, {} rule specs ignored",
                             module_id, rule_specs.size());
        for (const Unit& unit : sources.topology->units) {
            ctx.addSnapshotUnit(unit);
        }
        for (Dependency edge : sources.topology->edges) {
            if (trim(edge.from_id).empty() || trim(edge.to_id).empty()) {
                sink.record(DiagnosticKind::GraphIntegrityWarning, edge.edge_id,
                            "topology edge '" + edge.from_id + "' -> '" + edge.to_id +
                                "' has an empty endpoint; skipped");
                continue;
            }
            ctx.ensureEndpoint(edge.from_id);
            ctx.ensureEndpoint(edge.to_id);
            edge.is_inferred = false;
            ctx.addEdge(std::move(edge));
        }
    } else {
        // Targets first, then requirement sources.
        std::vector<std::string> target_ids;
        target_ids.reserve(rule_specs.size());
        for (const RuleSpec& spec : rule_specs) {
            if (trim(spec.target_id).empty()) {
                if (options.parse_mode == ParseMode::Strict) {
                    throw RuleImportError("", "rule without target");
                }
                sink.record(DiagnosticKind::TokenParseError, "",
                            "rule without target skipped in module " + module_id);
                target_ids.emplace_back();
                continue;
            }
            target_ids.push_back(ctx.resolveReference(spec.target_id));
        }

        for (size_t i = 0; i < rule_specs.size(); ++i) {
            const RuleSpec& spec = rule_specs[i];
            const std::string& target = target_ids[i];
            if (target.empty()) continue;
            if (spec.initially_open) ctx.markOpen(target);
            for (const Requirement& req : spec.requirements) {
                if (trim(req.source_code).empty()) {
                    if (options.parse_mode == ParseMode::Strict) {
                        throw RuleImportError(spec.target_id, "requirement with empty code");
                    }
                    sink.record(DiagnosticKind::TokenParseError, spec.target_id,
                                "requirement with empty code dropped in module " + module_id);
                    continue;
                }
                std::string source = ctx.resolveReference(req.source_code);
                Dependency edge(source, target, spec.kind, req.threshold);
                edge.source_code = trim(req.source_code);
                ctx.addEdge(std::move(edge));
            }
        }
        if (options.derive_initially_open) ctx.deriveInitiallyOpen();
    }

    if (sources.enrichment) ctx.applyEnrichment(*sources.enrichment);

    BuildResult result{ctx.finish(), {}};

    if (options.detect_cycles) {
        for (const auto& cycle : GraphQuery::findActivationCycles(result.graph)) {
            sink.record(DiagnosticKind::GraphIntegrityWarning, cycle.front(),
                        "activation cycle: " + GraphQuery::describePath(cycle));
        }
    }

    log::logger()->info("Built graph for module {}: {} units ({} ghost), {} edges, {} diagnostics",
                        module_id, result.graph.unitCount(), result.graph.ghostCount(),
                        result.graph.edgeCount(), sink.diagnostics().size());
    result.diagnostics = sink.take();
    return result;
}

} // namespace

BuildResult GraphBuilder::build(const std::string& module_id,
                                const std::vector<RuleSpec>& rule_specs,
                                const CodeResolver& resolver,
                                const BuildSources& sources) const {
    DiagnosticSink sink;
    return buildWithSink(options_, module_id, rule_specs, resolver, sources, sink);
}

BuildResult GraphBuilder::buildFromRules(const std::string& module_id,
                                         const ModuleRules& rules,
                                         const CodeResolver& resolver,
                                         const BuildSources& sources) const {
    DiagnosticSink sink;
    std::vector<RuleSpec> specs;
    specs.reserve(rules.size() * 2);
    for (const auto& [target, payload] : rules) {
        ParsedRule parsed = parseRulePayload(target, payload, options_.parse_mode, sink);
        specs.push_back(std::move(parsed.activation));
        if (!parsed.deactivation.requirements.empty()) {
            specs.push_back(std::move(parsed.deactivation));
        }
    }
    return buildWithSink(options_, module_id, specs, resolver, sources, sink);
}

} // namespace zpdes
