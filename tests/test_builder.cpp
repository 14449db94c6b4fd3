#include <gtest/gtest.h>
#include "build/graph_builder.hpp"
#include "build/module_support.hpp"
#include "diagnostics/errors.hpp"
#include "query/graph_query.hpp"

using namespace zpdes;

namespace {

RulePayload payload(std::vector<std::string> activation, bool open = false) {
    RulePayload p;
    p.activation_requirements = std::move(activation);
    p.initially_open = open;
    return p;
}

CodeResolver simpleResolver() {
    return CodeResolver::fromCodeTable({{"A1", "A1"}, {"A2", "A2"}, {"A3", "A3"}, {"O2", "O2"}});
}

} // namespace

// ─── Basic Build ──────────────────────────────────────────────

TEST(GraphBuilderTest, ThreeUnitChain) {
    ModuleRules rules{
        {"A1", payload({}, true)},
        {"A2", payload({"A1@60%"})},
        {"O2", payload({"A2"})},
    };
    GraphBuilder builder;
    BuildResult result = builder.buildFromRules("M1", rules, simpleResolver());
    const Graph& g = result.graph;

    EXPECT_EQ(g.unitCount(), 3);
    EXPECT_EQ(g.edgeCount(), 2);
    EXPECT_TRUE(result.diagnostics.empty());

    const Dependency* gate = g.findEdge("A1", "A2", DependencyKind::Activation);
    ASSERT_NE(gate, nullptr);
    ASSERT_TRUE(gate->threshold.has_value());
    EXPECT_EQ(gate->threshold->metric, ThresholdMetric::SuccessRate);
    EXPECT_DOUBLE_EQ(gate->threshold->value, 0.60);
    EXPECT_EQ(gate->source_code, "A1");
    EXPECT_FALSE(gate->is_inferred);
    EXPECT_EQ(gate->edge_id, "M1:activation:A1->A2");

    EXPECT_TRUE(g.getUnit("O2")->isObjective());
    EXPECT_TRUE(g.getUnit("A1")->initially_open);
    EXPECT_FALSE(g.getUnit("A2")->initially_open);

    ClosureResult up = GraphQuery::ancestors(g, "O2");
    EXPECT_EQ(up.unit_ids, (std::set<std::string>{"A1", "A2"}));
    ClosureResult down = GraphQuery::descendants(g, "A1");
    EXPECT_EQ(down.unit_ids, (std::set<std::string>{"A2", "O2"}));
}

TEST(GraphBuilderTest, DeactivationEdgesDoNotGate) {
    RulePayload p;
    p.deactivation_requirements = {"A1#2"};
    ModuleRules rules{{"A1", payload({})}, {"A3", p}};

    BuildResult result = GraphBuilder().buildFromRules("M1", rules, simpleResolver());
    const Dependency* edge = result.graph.findEdge("A1", "A3", DependencyKind::Deactivation);
    ASSERT_NE(edge, nullptr);
    EXPECT_EQ(edge->threshold->metric, ThresholdMetric::Level);
    EXPECT_DOUBLE_EQ(edge->threshold->value, 2.0);
    EXPECT_TRUE(result.graph.getUnit("A3")->initially_open);
}

// ─── Unresolved and Ambiguous References ─────────────────────

TEST(GraphBuilderTest, UnknownCodeBecomesGhost) {
    ModuleRules rules{
        {"A2", payload({"A99"})},
        {"A3", payload({"A99@50%"})},
    };
    BuildResult result = GraphBuilder().buildFromRules("M1", rules, simpleResolver());

    const Unit* ghost = result.graph.getUnit("A99");
    ASSERT_NE(ghost, nullptr);
    EXPECT_TRUE(ghost->is_ghost);
    EXPECT_FALSE(ghost->initially_open);
    EXPECT_EQ(result.graph.ghostCount(), 1);
    EXPECT_EQ(result.graph.edgeCount(), 2);
    EXPECT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::UnresolvedReference), 1);
}

TEST(GraphBuilderTest, GhostReusedAcrossReferences) {
    ModuleRules rules{
        {"A1", payload({"A99"})},
        {"A2", payload({" A99 ", "A99#1"})},
        {"A3", payload({"A99@50%"})},
    };
    BuildResult result = GraphBuilder().buildFromRules("M1", rules, simpleResolver());

    EXPECT_EQ(result.graph.ghostCount(), 1);
    EXPECT_EQ(result.graph.unitCount(), 4);
    EXPECT_TRUE(result.graph.getUnit("A99")->is_ghost);
    EXPECT_EQ(result.graph.getOutgoing("A99").size(), 3);
    EXPECT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::UnresolvedReference), 1);
}

TEST(GraphBuilderTest, IdAndCodeReferencesShareOneUnit) {
    // "Y" is not a code, but it is the id behind code "Z".
    CodeToIds table{{"Z", {"Y"}}, {"A2", {"A2"}}, {"A3", {"A3"}}};
    CodeResolver resolver(table);
    ModuleRules rules{{"A2", payload({"Y"})}, {"A3", payload({"Z"})}};

    BuildResult result = GraphBuilder().buildFromRules("M1", rules, resolver);
    EXPECT_EQ(result.graph.unitCount(), 3);
    ASSERT_TRUE(result.graph.hasUnit("Y"));
    EXPECT_FALSE(result.graph.getUnit("Y")->is_ghost);
    EXPECT_EQ(result.graph.getUnit("Y")->code, "Z");
    EXPECT_EQ(result.graph.getOutgoing("Y").size(), 2);
    EXPECT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::UnresolvedReference), 0);
}

TEST(GraphBuilderTest, AmbiguousCodeTakesFirstId) {
    CodeToIds table{{"X", {"id-b", "id-a"}}, {"A2", {"A2"}}};
    CodeResolver resolver(table);
    ModuleRules rules{{"A2", payload({"X"})}};

    BuildResult result = GraphBuilder().buildFromRules("M1", rules, resolver);
    EXPECT_NE(result.graph.findEdge("id-a", "A2", DependencyKind::Activation), nullptr);
    EXPECT_FALSE(result.graph.hasUnit("id-b"));
    EXPECT_EQ(result.graph.getUnit("id-a")->code, "X");
    EXPECT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::AmbiguousCodeResolution), 1);
}

TEST(GraphBuilderTest, AmbiguityReportedOncePerCode) {
    CodeToIds table{{"X", {"id-b", "id-a"}}, {"A2", {"A2"}}, {"A3", {"A3"}}};
    CodeResolver resolver(table);
    ModuleRules rules{{"A2", payload({"X"})}, {"A3", payload({"X@50%"})}};

    BuildResult result = GraphBuilder().buildFromRules("M1", rules, resolver);
    EXPECT_EQ(result.graph.getOutgoing("id-a").size(), 2);
    EXPECT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::AmbiguousCodeResolution), 1);
}

TEST(GraphBuilderTest, SelfLoopRejected) {
    ModuleRules rules{{"A2", payload({"A2", "A1"})}};
    BuildResult result = GraphBuilder().buildFromRules("M1", rules, simpleResolver());
    EXPECT_EQ(result.graph.edgeCount(), 1);
    EXPECT_EQ(result.graph.findEdge("A2", "A2", DependencyKind::Activation), nullptr);
    EXPECT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::SelfLoopRejected), 1);
}

TEST(GraphBuilderTest, DuplicateEdgeKeepsStricterThreshold) {
    std::vector<RuleSpec> specs(2);
    specs[0].target_id = "A2";
    specs[0].requirements = {{"A1", Threshold::successRate(0.6)}};
    specs[1].target_id = "A2";
    specs[1].requirements = {{"A1", Threshold::successRate(0.8)}};

    BuildResult result = GraphBuilder().build("M1", specs, simpleResolver());
    ASSERT_EQ(result.graph.edgeCount(), 1);
    EXPECT_DOUBLE_EQ(result.graph.edges()[0].threshold->value, 0.8);
    EXPECT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::GraphIntegrityWarning), 1);
}

TEST(GraphBuilderTest, IdenticalRepeatIsSilent) {
    ModuleRules rules{{"A2", payload({"A1@60%", "A1@60%"})}};
    BuildResult result = GraphBuilder().buildFromRules("M1", rules, simpleResolver());
    EXPECT_EQ(result.graph.edgeCount(), 1);
    EXPECT_TRUE(result.diagnostics.empty());
}

// ─── Parse Modes ──────────────────────────────────────────────

TEST(GraphBuilderTest, LenientDropsMalformedRequirement) {
    ModuleRules rules{{"A2", payload({"A1@60%", "A3@120%"})}};
    BuildResult result = GraphBuilder().buildFromRules("M1", rules, simpleResolver());
    EXPECT_EQ(result.graph.edgeCount(), 1);
    EXPECT_FALSE(result.graph.hasUnit("A3"));
    EXPECT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::TokenParseError), 1);
}

TEST(GraphBuilderTest, StrictModeAbortsImport) {
    BuildOptions options;
    options.parse_mode = ParseMode::Strict;
    ModuleRules rules{{"A2", payload({"A1@60%", "A3@120%"})}};
    EXPECT_THROW(GraphBuilder(options).buildFromRules("M1", rules, simpleResolver()),
                 RuleImportError);
}

TEST(GraphBuilderTest, EmptyTargetHandledPerMode) {
    std::vector<RuleSpec> specs(1);
    specs[0].requirements = {{"A1", std::nullopt}};

    BuildResult result = GraphBuilder().build("M1", specs, simpleResolver());
    EXPECT_EQ(result.graph.edgeCount(), 0);
    EXPECT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::TokenParseError), 1);

    BuildOptions options;
    options.parse_mode = ParseMode::Strict;
    EXPECT_THROW(GraphBuilder(options).build("M1", specs, simpleResolver()), RuleImportError);
}

TEST(GraphBuilderTest, OverflowingPercentDroppedInLenientMode) {
    ModuleRules rules{{"A2", payload({"A1@60%", "A3@1" + std::string(400, '0') + "%"})}};
    BuildResult result = GraphBuilder().buildFromRules("M1", rules, simpleResolver());
    EXPECT_EQ(result.graph.edgeCount(), 1);
    EXPECT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::TokenParseError), 1);
}

TEST(GraphBuilderTest, EmptyRequirementCodeHandledPerMode) {
    std::vector<RuleSpec> specs(1);
    specs[0].target_id = "A2";
    specs[0].requirements = {{"  ", std::nullopt}, {"A1", std::nullopt}};

    BuildResult result = GraphBuilder().build("M1", specs, simpleResolver());
    EXPECT_EQ(result.graph.unitCount(), 2);
    EXPECT_EQ(result.graph.edgeCount(), 1);
    EXPECT_FALSE(result.graph.hasUnit(""));
    EXPECT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::TokenParseError), 1);

    BuildOptions options;
    options.parse_mode = ParseMode::Strict;
    EXPECT_THROW(GraphBuilder(options).build("M1", specs, simpleResolver()), RuleImportError);
}

// ─── Catalog and Enrichment ───────────────────────────────────

TEST(GraphBuilderTest, CatalogSuppliesLabelsAndHierarchy) {
    CodeResolver resolver = CodeResolver::fromCodeTable(
        {{"M1O1", "obj-1"}, {"M1O1A1", "act-1"}, {"M1O1A2", "act-2"}});
    Catalog catalog;
    catalog["obj-1"] = {"obj-1", UnitKind::Objective, "M1O1", "Fractions", ""};
    catalog["act-1"] = {"act-1", UnitKind::Activity, "M1O1A1", "Halves", "obj-1"};

    ModuleRules rules{{"M1O1A2", payload({"M1O1A1"})}};
    BuildSources sources;
    sources.catalog = &catalog;
    BuildResult result = GraphBuilder().buildFromRules("M1", rules, resolver, sources);

    const Unit* first = result.graph.getUnit("act-1");
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first->label, "Halves");
    EXPECT_EQ(first->objective_id, "obj-1");

    // Not in the catalog: code and parent objective come from the code shape.
    const Unit* second = result.graph.getUnit("act-2");
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->code, "M1O1A2");
    EXPECT_TRUE(second->isActivity());
    EXPECT_EQ(second->objective_id, "obj-1");
    EXPECT_FALSE(second->is_ghost);
}

TEST(GraphBuilderTest, EnrichmentAttachesToMatchingEdges) {
    ModuleRules rules{{"A2", payload({"A1@60%"})}, {"A3", payload({"A1"})}};
    Enrichment enrichment{
        {"A1", {{"sr", 0.7}, {"lvl", 2.0}}},
        {"ZZ", {{"sr", 0.5}}},
    };
    BuildSources sources;
    sources.enrichment = &enrichment;
    BuildResult result = GraphBuilder().buildFromRules("M1", rules, simpleResolver(), sources);

    for (const Dependency& edge : result.graph.edges()) {
        EXPECT_DOUBLE_EQ(edge.enrichment.at("sr"), 0.7);
        EXPECT_DOUBLE_EQ(edge.enrichment.at("lvl"), 2.0);
    }
    ASSERT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::UnusedEnrichment), 1);
}

// ─── Topology Snapshot ────────────────────────────────────────

TEST(GraphBuilderTest, SnapshotReplacesRuleParsing) {
    TopologySnapshot snapshot;
    Unit u1("u1", UnitKind::Activity, "M1");
    u1.initially_open = true;
    snapshot.units = {u1, Unit("u2", UnitKind::Activity, "M1")};
    Dependency inferred("u1", "u2", DependencyKind::Activation);
    inferred.is_inferred = true;
    snapshot.edges = {inferred, Dependency("u2", "u9", DependencyKind::Activation)};

    ModuleRules rules{{"A2", payload({"A1"})}};
    BuildSources sources;
    sources.topology = &snapshot;
    BuildResult result = GraphBuilder().buildFromRules("M1", rules, simpleResolver(), sources);
    const Graph& g = result.graph;

    EXPECT_FALSE(g.hasUnit("A2"));
    EXPECT_EQ(g.unitCount(), 3);
    EXPECT_TRUE(g.getUnit("u9")->is_ghost);
    EXPECT_TRUE(g.getUnit("u1")->initially_open);
    for (const Dependency& edge : g.edges()) {
        EXPECT_FALSE(edge.is_inferred);
    }
    EXPECT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::UnresolvedReference), 1);
}

TEST(GraphBuilderTest, SnapshotSkipsEmptyEndpointsAndSelfLoops) {
    TopologySnapshot snapshot;
    snapshot.units = {Unit("u1", UnitKind::Activity, "M1"), Unit("u2", UnitKind::Activity, "M1")};
    snapshot.edges = {
        Dependency("", "u1", DependencyKind::Activation),
        Dependency("u1", "u1", DependencyKind::Activation),
        Dependency("u1", "u2", DependencyKind::Activation),
    };
    BuildSources sources;
    sources.topology = &snapshot;
    BuildResult result = GraphBuilder().build("M1", {}, simpleResolver(), sources);

    EXPECT_EQ(result.graph.unitCount(), 2);
    EXPECT_FALSE(result.graph.hasUnit(""));
    ASSERT_EQ(result.graph.edgeCount(), 1);
    EXPECT_EQ(result.graph.edges()[0].to_id, "u2");
    EXPECT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::GraphIntegrityWarning), 1);
    EXPECT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::SelfLoopRejected), 1);
}

// ─── Integrity ────────────────────────────────────────────────

TEST(GraphBuilderTest, ActivationCycleReported) {
    ModuleRules rules{{"A1", payload({"A2"})}, {"A2", payload({"A1"})}};
    BuildResult result = GraphBuilder().buildFromRules("M1", rules, simpleResolver());
    EXPECT_EQ(result.graph.edgeCount(), 2);
    ASSERT_EQ(countDiagnostics(result.diagnostics, DiagnosticKind::GraphIntegrityWarning), 1);
    EXPECT_NE(result.diagnostics[0].message.find("activation cycle"), std::string::npos);
}

TEST(GraphBuilderTest, CycleScanCanBeDisabled) {
    BuildOptions options;
    options.detect_cycles = false;
    ModuleRules rules{{"A1", payload({"A2"})}, {"A2", payload({"A1"})}};
    BuildResult result = GraphBuilder(options).buildFromRules("M1", rules, simpleResolver());
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST(GraphBuilderTest, BuildIsDeterministic) {
    ModuleRules rules{
        {"A2", payload({"A1@60%", "A99"})},
        {"O2", payload({"A2", "A3#1"})},
    };
    GraphBuilder builder;
    BuildResult first = builder.buildFromRules("M1", rules, simpleResolver());
    BuildResult second = builder.buildFromRules("M1", rules, simpleResolver());
    EXPECT_EQ(first.graph, second.graph);
    EXPECT_EQ(first.diagnostics, second.diagnostics);
}

// ─── Module Support ───────────────────────────────────────────

TEST(ModuleSupportTest, IntersectionSortedByNumber) {
    std::set<std::string> rules{"M1", "M10", "M2", "M7"};
    std::set<std::string> catalog{"M1", "M2", "M10", "M3"};
    EXPECT_EQ(supportedModules(rules, catalog),
              (std::vector<std::string>{"M1", "M2", "M10"}));
}

TEST(ModuleSupportTest, ObservedSetNarrowsWhenNonEmpty) {
    std::set<std::string> rules{"M1", "M2", "M10"};
    std::set<std::string> catalog{"M1", "M2", "M10"};
    EXPECT_EQ(supportedModules(rules, catalog, std::set<std::string>{"M10", "M2"}),
              (std::vector<std::string>{"M2", "M10"}));
    EXPECT_EQ(supportedModules(rules, catalog, std::set<std::string>{}),
              (std::vector<std::string>{"M1", "M2", "M10"}));
}

TEST(ModuleSupportTest, UnsupportedModuleThrows) {
    std::vector<std::string> supported{"M1", "M2"};
    EXPECT_NO_THROW(requireSupportedModule("M2", supported));
    try {
        requireSupportedModule("M3", supported);
        FAIL() << "expected UnsupportedModuleError";
    } catch (const UnsupportedModuleError& e) {
        EXPECT_EQ(e.moduleId(), "M3");
        EXPECT_EQ(e.diagnostic().kind, DiagnosticKind::UnsupportedModule);
    }
}
