// PyBind11 bindings for the zpdes rule-graph core.
// Exposes the data model, parser, resolver, builder, queries and overlays.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DZPDES_BUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>

#include "graph/graph.hpp"
#include "graph/topology_snapshot.hpp"
#include "diagnostics/diagnostic.hpp"
#include "diagnostics/errors.hpp"
#include "rules/code_resolver.hpp"
#include "rules/code_shape.hpp"
#include "rules/requirement_parser.hpp"
#include "build/graph_builder.hpp"
#include "build/module_support.hpp"
#include "query/graph_query.hpp"
#include "overlay/overlay_merger.hpp"
#include "util/logging.hpp"

#include <optional>

namespace py = pybind11;

PYBIND11_MODULE(zpdes_bindings, m) {
    m.doc() = "ZPDES rule-graph C++ core bindings";

    // ── Exceptions ──
    py::register_exception<zpdes::TokenParseError>(m, "TokenParseError", PyExc_ValueError);
    py::register_exception<zpdes::RuleImportError>(m, "RuleImportError", PyExc_ValueError);
    py::register_exception<zpdes::UnsupportedModuleError>(m, "UnsupportedModuleError",
                                                          PyExc_LookupError);

    // ── Enums ──
    py::enum_<zpdes::UnitKind>(m, "UnitKind")
        .value("ACTIVITY", zpdes::UnitKind::Activity)
        .value("OBJECTIVE", zpdes::UnitKind::Objective);

    py::enum_<zpdes::DependencyKind>(m, "DependencyKind")
        .value("ACTIVATION", zpdes::DependencyKind::Activation)
        .value("DEACTIVATION", zpdes::DependencyKind::Deactivation);

    py::enum_<zpdes::ThresholdMetric>(m, "ThresholdMetric")
        .value("SUCCESS_RATE", zpdes::ThresholdMetric::SuccessRate)
        .value("LEVEL", zpdes::ThresholdMetric::Level);

    py::enum_<zpdes::DiagnosticKind>(m, "DiagnosticKind")
        .value("TOKEN_PARSE_ERROR", zpdes::DiagnosticKind::TokenParseError)
        .value("AMBIGUOUS_CODE_RESOLUTION", zpdes::DiagnosticKind::AmbiguousCodeResolution)
        .value("UNRESOLVED_REFERENCE", zpdes::DiagnosticKind::UnresolvedReference)
        .value("UNSUPPORTED_MODULE", zpdes::DiagnosticKind::UnsupportedModule)
        .value("GRAPH_INTEGRITY_WARNING", zpdes::DiagnosticKind::GraphIntegrityWarning)
        .value("SELF_LOOP_REJECTED", zpdes::DiagnosticKind::SelfLoopRejected)
        .value("UNUSED_ENRICHMENT", zpdes::DiagnosticKind::UnusedEnrichment);

    py::enum_<zpdes::ParseMode>(m, "ParseMode")
        .value("LENIENT", zpdes::ParseMode::Lenient)
        .value("STRICT", zpdes::ParseMode::Strict);

    // ── Threshold ──
    py::class_<zpdes::Threshold>(m, "Threshold")
        .def(py::init<>())
        .def(py::init<zpdes::ThresholdMetric, double>())
        .def_readwrite("metric", &zpdes::Threshold::metric)
        .def_readwrite("value", &zpdes::Threshold::value)
        .def(py::self == py::self);

    // ── OverlayMetrics ──
    py::class_<zpdes::OverlayMetrics>(m, "OverlayMetrics")
        .def(py::init<>())
        .def_readwrite("attempts", &zpdes::OverlayMetrics::attempts)
        .def_readwrite("success_rate", &zpdes::OverlayMetrics::success_rate)
        .def_readwrite("repeat_attempt_rate", &zpdes::OverlayMetrics::repeat_attempt_rate);

    // ── Unit ──
    py::class_<zpdes::Unit>(m, "Unit")
        .def(py::init<>())
        .def(py::init<std::string, zpdes::UnitKind, std::string>())
        .def_readwrite("id", &zpdes::Unit::id)
        .def_readwrite("kind", &zpdes::Unit::kind)
        .def_readwrite("module_id", &zpdes::Unit::module_id)
        .def_readwrite("code", &zpdes::Unit::code)
        .def_readwrite("label", &zpdes::Unit::label)
        .def_readwrite("objective_id", &zpdes::Unit::objective_id)
        .def_readwrite("is_ghost", &zpdes::Unit::is_ghost)
        .def_readwrite("initially_open", &zpdes::Unit::initially_open)
        .def_readwrite("overlay", &zpdes::Unit::overlay)
        .def("owning_objective", &zpdes::Unit::owningObjective);

    // ── Dependency ──
    py::class_<zpdes::Dependency>(m, "Dependency")
        .def(py::init<>())
        .def_readwrite("edge_id", &zpdes::Dependency::edge_id)
        .def_readwrite("from_id", &zpdes::Dependency::from_id)
        .def_readwrite("to_id", &zpdes::Dependency::to_id)
        .def_readwrite("kind", &zpdes::Dependency::kind)
        .def_readwrite("threshold", &zpdes::Dependency::threshold)
        .def_readwrite("is_inferred", &zpdes::Dependency::is_inferred)
        .def_readwrite("source_code", &zpdes::Dependency::source_code)
        .def_readwrite("enrichment", &zpdes::Dependency::enrichment);

    // ── Graph ──
    py::class_<zpdes::Graph>(m, "Graph")
        .def(py::init<>())
        .def(py::init<std::string, std::vector<zpdes::Unit>, std::vector<zpdes::Dependency>>(),
             py::arg("module_id"), py::arg("units"), py::arg("edges"))
        .def("module_id", &zpdes::Graph::moduleId)
        .def("get_unit", &zpdes::Graph::getUnit, py::return_value_policy::reference_internal)
        .def("has_unit", &zpdes::Graph::hasUnit)
        .def("get_unit_ids", &zpdes::Graph::getUnitIds)
        .def("units", &zpdes::Graph::units)
        .def("edges", &zpdes::Graph::edges)
        .def("unit_count", &zpdes::Graph::unitCount)
        .def("edge_count", &zpdes::Graph::edgeCount)
        .def("ghost_count", &zpdes::Graph::ghostCount);

    py::class_<zpdes::TopologySnapshot>(m, "TopologySnapshot")
        .def(py::init<>())
        .def_readwrite("units", &zpdes::TopologySnapshot::units)
        .def_readwrite("edges", &zpdes::TopologySnapshot::edges);

    // ── Diagnostic ──
    py::class_<zpdes::Diagnostic>(m, "Diagnostic")
        .def(py::init<>())
        .def_readwrite("kind", &zpdes::Diagnostic::kind)
        .def_readwrite("subject", &zpdes::Diagnostic::subject)
        .def_readwrite("message", &zpdes::Diagnostic::message);

    // ── Rules ──
    py::class_<zpdes::Requirement>(m, "Requirement")
        .def(py::init<>())
        .def_readwrite("source_code", &zpdes::Requirement::source_code)
        .def_readwrite("threshold", &zpdes::Requirement::threshold);

    py::class_<zpdes::RuleSpec>(m, "RuleSpec")
        .def(py::init<>())
        .def_readwrite("target_id", &zpdes::RuleSpec::target_id)
        .def_readwrite("kind", &zpdes::RuleSpec::kind)
        .def_readwrite("requirements", &zpdes::RuleSpec::requirements)
        .def_readwrite("initially_open", &zpdes::RuleSpec::initially_open);

    py::class_<zpdes::RulePayload>(m, "RulePayload")
        .def(py::init<>())
        .def_readwrite("activation_requirements", &zpdes::RulePayload::activation_requirements)
        .def_readwrite("deactivation_requirements", &zpdes::RulePayload::deactivation_requirements)
        .def_readwrite("initially_open", &zpdes::RulePayload::initially_open);

    m.def("parse_requirement", &zpdes::parseRequirement, py::arg("token"));
    m.def("parse_requirement_list", &zpdes::parseRequirementList, py::arg("text"));
    // Returns (activation, deactivation, diagnostics).
    m.def("parse_rule_payload", [](const std::string& target, const zpdes::RulePayload& raw,
                                   bool strict) {
        zpdes::DiagnosticSink sink;
        zpdes::ParsedRule parsed = zpdes::parseRulePayload(
            target, raw, strict ? zpdes::ParseMode::Strict : zpdes::ParseMode::Lenient, sink);
        return py::make_tuple(parsed.activation, parsed.deactivation, sink.take());
    }, py::arg("target"), py::arg("raw"), py::arg("strict") = false);
    m.def("unit_kind_from_code", &zpdes::unitKindFromCode);
    m.def("objective_code_of", &zpdes::objectiveCodeOf);

    py::class_<zpdes::CodeResolver>(m, "CodeResolver")
        .def(py::init<>())
        .def(py::init<const zpdes::CodeToIds&, const zpdes::IdToCodes&>(),
             py::arg("code_to_id"), py::arg("id_to_codes") = zpdes::IdToCodes{})
        .def_static("from_code_table", &zpdes::CodeResolver::fromCodeTable)
        .def("resolve_code", &zpdes::CodeResolver::resolveCode)
        .def("codes_for", &zpdes::CodeResolver::codesFor)
        .def("preferred_code", &zpdes::CodeResolver::preferredCode);

    // ── Build ──
    py::class_<zpdes::CatalogEntry>(m, "CatalogEntry")
        .def(py::init<>())
        .def_readwrite("id", &zpdes::CatalogEntry::id)
        .def_readwrite("kind", &zpdes::CatalogEntry::kind)
        .def_readwrite("code", &zpdes::CatalogEntry::code)
        .def_readwrite("label", &zpdes::CatalogEntry::label)
        .def_readwrite("objective_id", &zpdes::CatalogEntry::objective_id);

    py::class_<zpdes::BuildOptions>(m, "BuildOptions")
        .def(py::init<>())
        .def_readwrite("parse_mode", &zpdes::BuildOptions::parse_mode)
        .def_readwrite("detect_cycles", &zpdes::BuildOptions::detect_cycles)
        .def_readwrite("derive_initially_open", &zpdes::BuildOptions::derive_initially_open);

    py::class_<zpdes::BuildResult>(m, "BuildResult")
        .def_readonly("graph", &zpdes::BuildResult::graph)
        .def_readonly("diagnostics", &zpdes::BuildResult::diagnostics);

    m.def("build_graph", [](const std::string& module_id,
                            const zpdes::ModuleRules& rules,
                            const zpdes::CodeResolver& resolver,
                            const std::optional<zpdes::TopologySnapshot>& topology,
                            const std::optional<zpdes::Enrichment>& enrichment,
                            const std::optional<zpdes::Catalog>& catalog,
                            const zpdes::BuildOptions& options) {
        zpdes::BuildSources sources;
        if (topology) sources.topology = &*topology;
        if (enrichment) sources.enrichment = &*enrichment;
        if (catalog) sources.catalog = &*catalog;
        return zpdes::GraphBuilder(options).buildFromRules(module_id, rules, resolver, sources);
    }, py::arg("module_id"), py::arg("rules"), py::arg("resolver"),
       py::arg("topology") = py::none(), py::arg("enrichment") = py::none(),
       py::arg("catalog") = py::none(), py::arg("options") = zpdes::BuildOptions{});

    m.def("supported_modules", &zpdes::supportedModules,
          py::arg("rule_module_ids"), py::arg("catalog_module_ids"),
          py::arg("observed_module_ids") = py::none());
    m.def("require_supported_module", &zpdes::requireSupportedModule);

    // ── Queries ──
    py::class_<zpdes::ClosureResult>(m, "ClosureResult")
        .def_readonly("unit_ids", &zpdes::ClosureResult::unit_ids)
        .def_readonly("diagnostics", &zpdes::ClosureResult::diagnostics);

    py::class_<zpdes::FocusResult>(m, "FocusResult")
        .def_readonly("unit_ids", &zpdes::FocusResult::unit_ids)
        .def_readonly("edges", &zpdes::FocusResult::edges)
        .def_readonly("diagnostics", &zpdes::FocusResult::diagnostics);

    py::class_<zpdes::ChainLink>(m, "ChainLink")
        .def_readonly("edge", &zpdes::ChainLink::edge)
        .def_readonly("depth", &zpdes::ChainLink::depth);

    py::class_<zpdes::ChainResult>(m, "ChainResult")
        .def_readonly("links", &zpdes::ChainResult::links)
        .def_readonly("diagnostics", &zpdes::ChainResult::diagnostics);

    m.def("filter_by_objectives", &zpdes::GraphQuery::filterByObjectives);
    m.def("ancestors", &zpdes::GraphQuery::ancestors);
    m.def("descendants", &zpdes::GraphQuery::descendants);
    m.def("focus_neighborhood", &zpdes::GraphQuery::focusNeighborhood);
    m.def("prerequisite_chain", &zpdes::GraphQuery::prerequisiteChain);
    m.def("find_activation_cycles", [](const zpdes::Graph& graph) {
        return zpdes::GraphQuery::findActivationCycles(graph);
    });

    // ── Overlays ──
    py::class_<zpdes::DailyActivityRow>(m, "DailyActivityRow")
        .def(py::init<>())
        .def_readwrite("date_utc", &zpdes::DailyActivityRow::date_utc)
        .def_readwrite("module_id", &zpdes::DailyActivityRow::module_id)
        .def_readwrite("objective_id", &zpdes::DailyActivityRow::objective_id)
        .def_readwrite("activity_id", &zpdes::DailyActivityRow::activity_id)
        .def_readwrite("attempts", &zpdes::DailyActivityRow::attempts)
        .def_readwrite("success_rate", &zpdes::DailyActivityRow::success_rate)
        .def_readwrite("repeat_attempt_rate", &zpdes::DailyActivityRow::repeat_attempt_rate);

    m.def("merge_overlays", &zpdes::OverlayMerger::mergeOverlays);
    m.def("aggregate_daily_metrics", &zpdes::OverlayMerger::aggregateDailyMetrics);

    m.def("set_log_level", [](const std::string& level) {
        zpdes::log::setLevel(spdlog::level::from_str(level));
    });
}
