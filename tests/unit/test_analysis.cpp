#include <gtest/gtest.h>
#include "analysis/forward_impact.hpp"
#include "analysis/graph_queries.hpp"
#include "analysis/repair_path.hpp"
#include "analysis/root_cause.hpp"
#include "scoring/comprehension.hpp"
#include <algorithm>
#include <limits>

using namespace cee;

namespace {

constexpr Timestamp kNow = 1700000000000;

ConceptNode make_node(const std::string& id) {
    ConceptNode node;
    node.id = id;
    node.title = id;
    node.section_id = "s1";
    return node;
}

ConceptEdge prerequisite(const std::string& from, const std::string& to) {
    ConceptEdge edge;
    edge.from = from;
    edge.to = to;
    edge.type = ConceptEdgeType::PREREQUISITE;
    edge.weight = 0.8;
    edge.transfer_coefficient = 0.7;
    return edge;
}

ConceptEntanglementGraph build_graph(const std::vector<std::string>& ids,
                                     const std::vector<std::pair<std::string, std::string>>& links) {
    std::vector<ConceptNode> nodes;
    for (const auto& id : ids) nodes.push_back(make_node(id));
    std::vector<ConceptEdge> edges;
    for (const auto& [from, to] : links) edges.push_back(prerequisite(from, to));
    return add_concepts(create_empty_graph("js-101", std::nullopt, kNow), nodes, edges, kNow);
}

void set_comprehension(ConceptEntanglementGraph& graph, const ConceptId& id,
                       double score, double confidence) {
    auto& e = graph.entanglements[id];
    e.comprehension_score = score;
    e.confidence = confidence;
    e.state = score_to_entanglement_state(score, confidence, e.cascade_failures);
}

std::vector<ConceptId> ids_of(const std::vector<RootCause>& causes) {
    std::vector<ConceptId> ids;
    for (const auto& c : causes) ids.push_back(c.concept_id);
    return ids;
}

} // namespace

// closures -> callbacks -> async-await, closures collapsed, callbacks struggling
class AnalysisTest : public ::testing::Test {
protected:
    ConceptEntanglementGraph graph;

    void SetUp() override {
        graph = build_graph({"closures", "callbacks", "async-await"},
                            {{"closures", "callbacks"}, {"callbacks", "async-await"}});
        set_comprehension(graph, "closures", 20, 0.9);
        set_comprehension(graph, "callbacks", 45, 0.8);
    }
};

TEST_F(AnalysisTest, ScenarioStates) {
    EXPECT_EQ(graph.find_entanglement("closures")->state, EntanglementState::COLLAPSED);
    EXPECT_EQ(graph.find_entanglement("callbacks")->state, EntanglementState::STRUGGLING);
    EXPECT_EQ(graph.find_entanglement("async-await")->state, EntanglementState::UNKNOWN);
}

// ==========================================
// Root Cause Tests
// ==========================================

TEST_F(AnalysisTest, RootCauseFindsDeepestCollapse) {
    auto result = find_root_cause(graph, "async-await", kDefaultMaxDepth, kNow);

    EXPECT_EQ(result.trigger_concept_id, "async-await");
    EXPECT_EQ(result.analysis_timestamp, kNow);
    ASSERT_EQ(result.root_causes.size(), 2);

    const auto& top = result.root_causes[0];
    EXPECT_EQ(top.concept_id, "closures");
    EXPECT_EQ(top.severity, RootCauseSeverity::CRITICAL);
    EXPECT_NEAR(top.confidence, 0.57, 1e-9);

    const auto& second = result.root_causes[1];
    EXPECT_EQ(second.concept_id, "callbacks");
    EXPECT_EQ(second.severity, RootCauseSeverity::MAJOR);
    EXPECT_NEAR(second.confidence, 0.52, 1e-9);
    EXPECT_LT(second.confidence, top.confidence);
}

TEST_F(AnalysisTest, RootCauseChainRunsRootToTrigger) {
    auto result = find_root_cause(graph, "async-await", kDefaultMaxDepth, kNow);
    std::vector<ConceptId> expected = {"closures", "callbacks", "async-await"};
    EXPECT_EQ(result.causation_chain, expected);
}

TEST_F(AnalysisTest, RootCauseEvidence) {
    graph.entanglements["closures"].attempts = 8;
    auto result = find_root_cause(graph, "async-await", kDefaultMaxDepth, kNow);

    const auto& evidence = result.root_causes[0].evidence;
    ASSERT_EQ(evidence.size(), 3);
    EXPECT_EQ(evidence[0], "This concept has collapsed - needs complete review");
    EXPECT_EQ(evidence[1], "Low comprehension score: 20%");
    EXPECT_EQ(evidence[2], "Multiple attempts (8) with limited progress");
}

TEST_F(AnalysisTest, RootCauseDepthLimit) {
    auto result = find_root_cause(graph, "async-await", 0, kNow);
    ASSERT_EQ(result.root_causes.size(), 1);
    EXPECT_EQ(result.root_causes[0].concept_id, "callbacks");
}

TEST_F(AnalysisTest, RootCauseWithoutProblems) {
    set_comprehension(graph, "closures", 90, 1.0);
    set_comprehension(graph, "callbacks", 75, 1.0);

    auto result = find_root_cause(graph, "async-await", kDefaultMaxDepth, kNow);
    EXPECT_TRUE(result.root_causes.empty());
    ASSERT_EQ(result.causation_chain.size(), 1);
    EXPECT_EQ(result.causation_chain[0], "async-await");
}

TEST_F(AnalysisTest, RootCauseUnknownTrigger) {
    auto result = find_root_cause(graph, "missing", kDefaultMaxDepth, kNow);
    EXPECT_TRUE(result.root_causes.empty());
    EXPECT_EQ(result.causation_chain, std::vector<ConceptId>{"missing"});
}

TEST(RootCauseShapes, DiamondReportsSharedRootOnce) {
    auto graph = build_graph({"a", "b", "c", "d"},
                             {{"a", "b"}, {"a", "c"}, {"b", "d"}, {"c", "d"}});
    set_comprehension(graph, "a", 10, 1.0);

    auto result = find_root_cause(graph, "d", kDefaultMaxDepth, kNow);
    auto ids = ids_of(result.root_causes);
    EXPECT_EQ(std::count(ids.begin(), ids.end(), "a"), 1);
    EXPECT_EQ(result.causation_chain.front(), "a");
    EXPECT_EQ(result.causation_chain.back(), "d");
}

TEST(RootCauseShapes, DirectPrerequisiteKeepsBestConfidence) {
    // c is reached first through b, then again as a direct prerequisite of t
    auto graph = build_graph({"c", "b", "t"}, {{"b", "t"}, {"c", "b"}, {"c", "t"}});
    set_comprehension(graph, "b", 90, 1.0);
    set_comprehension(graph, "c", 20, 1.0);

    auto result = find_root_cause(graph, "t", 5, kNow);
    ASSERT_EQ(result.root_causes.size(), 1);
    EXPECT_EQ(result.root_causes[0].concept_id, "c");
    // 0.8 * 0.4 + 1.0 * 0.3
    EXPECT_NEAR(result.root_causes[0].confidence, 0.62, 1e-9);
    EXPECT_EQ(result.causation_chain, (std::vector<ConceptId>{"c", "t"}));
}

TEST(RootCauseShapes, LargestDepthDoesNotOverflow) {
    auto graph = build_graph({"a", "b"}, {{"a", "b"}});
    set_comprehension(graph, "a", 20, 1.0);

    auto result = find_root_cause(graph, "b", std::numeric_limits<int>::max(), kNow);
    ASSERT_EQ(result.root_causes.size(), 1);
    // depth factor is 1.0 at the trigger's own prerequisites
    EXPECT_NEAR(result.root_causes[0].confidence, 0.62, 1e-9);
}

TEST(RootCauseShapes, CycleTerminates) {
    auto graph = build_graph({"x", "y"}, {{"x", "y"}, {"y", "x"}});
    set_comprehension(graph, "x", 20, 1.0);
    set_comprehension(graph, "y", 40, 1.0);

    auto result = find_root_cause(graph, "x", 50, kNow);
    EXPECT_LE(result.root_causes.size(), 2);
}

// ==========================================
// Forward Impact Tests
// ==========================================

TEST_F(AnalysisTest, ForwardImpactDecreasesAlongChain) {
    auto result = analyze_forward_impact(graph, "closures");

    EXPECT_EQ(result.source_concept_id, "closures");
    ASSERT_EQ(result.affected_concepts.size(), 2);
    EXPECT_EQ(result.total_at_risk, 2);

    const auto& first = result.affected_concepts[0];
    const auto& second = result.affected_concepts[1];
    EXPECT_EQ(first.concept_id, "callbacks");
    EXPECT_EQ(first.path_length, 1);
    EXPECT_NEAR(first.estimated_score_reduction, 44.8, 1e-9);
    EXPECT_EQ(first.impact_level, ImpactLevel::HIGH);

    EXPECT_EQ(second.concept_id, "async-await");
    EXPECT_EQ(second.path_length, 2);
    EXPECT_NEAR(second.estimated_score_reduction, 35.84, 1e-9);
    EXPECT_LT(second.estimated_score_reduction, first.estimated_score_reduction);

    EXPECT_TRUE(result.critical_path_affected.empty());
}

TEST_F(AnalysisTest, ForwardImpactDepthLimit) {
    auto result = analyze_forward_impact(graph, "closures", 0);
    ASSERT_EQ(result.affected_concepts.size(), 1);
    EXPECT_EQ(result.affected_concepts[0].concept_id, "callbacks");
}

TEST_F(AnalysisTest, ForwardImpactLevels) {
    set_comprehension(graph, "closures", 75, 1.0);

    // gap 25: 25 * 0.7 * 0.8 = 14, then 11.2
    auto result = analyze_forward_impact(graph, "closures");
    ASSERT_EQ(result.affected_concepts.size(), 2);
    EXPECT_EQ(result.affected_concepts[0].impact_level, ImpactLevel::LOW);
    EXPECT_EQ(result.affected_concepts[1].impact_level, ImpactLevel::LOW);

    set_comprehension(graph, "closures", 60, 1.0);
    result = analyze_forward_impact(graph, "closures");
    EXPECT_EQ(result.affected_concepts[0].impact_level, ImpactLevel::MEDIUM);
}

TEST_F(AnalysisTest, ForwardImpactUnknownSource) {
    auto result = analyze_forward_impact(graph, "missing");
    EXPECT_TRUE(result.affected_concepts.empty());
    EXPECT_EQ(result.total_at_risk, 0);
}

TEST(ForwardImpactShapes, DiamondReportsEachDependentOnce) {
    auto graph = build_graph({"a", "b", "c", "d"},
                             {{"a", "b"}, {"a", "c"}, {"b", "d"}, {"c", "d"}});
    set_comprehension(graph, "a", 0, 1.0);

    auto result = analyze_forward_impact(graph, "a");
    ASSERT_EQ(result.total_at_risk, 3);

    int d_count = 0;
    for (const auto& affected : result.affected_concepts) {
        if (affected.concept_id == "d") {
            ++d_count;
            EXPECT_EQ(affected.path_length, 2);
        }
    }
    EXPECT_EQ(d_count, 1);
}

TEST(ForwardImpactShapes, CycleTerminates) {
    auto graph = build_graph({"x", "y"}, {{"x", "y"}, {"y", "x"}});
    auto result = analyze_forward_impact(graph, "x", 100);
    ASSERT_EQ(result.affected_concepts.size(), 1);
    EXPECT_EQ(result.affected_concepts[0].concept_id, "y");
}

TEST(ForwardImpactShapes, KeystoneOnCriticalPath) {
    auto graph = build_graph({"root", "hub", "l1", "l2", "l3"},
                             {{"root", "hub"}, {"hub", "l1"}, {"hub", "l2"}, {"hub", "l3"}});
    set_comprehension(graph, "root", 0, 1.0);

    auto result = analyze_forward_impact(graph, "root");
    ASSERT_EQ(result.critical_path_affected.size(), 1);
    EXPECT_EQ(result.critical_path_affected[0], "hub");
}

// ==========================================
// Repair Path Tests
// ==========================================

TEST_F(AnalysisTest, RepairPathFromScenario) {
    auto diagnosis = find_root_cause(graph, "async-await", kDefaultMaxDepth, kNow);
    auto path = generate_repair_path(graph, "async-await", diagnosis, kNow);

    EXPECT_EQ(path.id, "repair_async-await_" + std::to_string(kNow));
    EXPECT_EQ(path.target_concept_id, "async-await");
    EXPECT_EQ(path.generated_at, kNow);
    ASSERT_EQ(path.steps.size(), 3);

    EXPECT_EQ(path.steps[0].concept_id, "closures");
    EXPECT_EQ(path.steps[0].estimated_minutes, 20);
    EXPECT_EQ(path.steps[0].priority, RepairPriority::REQUIRED);
    ASSERT_EQ(path.steps[0].activities.size(), 4);
    EXPECT_EQ(path.steps[0].activities[0].type, RepairActivityType::VIDEO);
    EXPECT_EQ(path.steps[0].activities[3].type, RepairActivityType::QUIZ);

    EXPECT_EQ(path.steps[1].concept_id, "callbacks");
    EXPECT_EQ(path.steps[1].estimated_minutes, 15);
    EXPECT_EQ(path.steps[1].activities.size(), 2);

    EXPECT_EQ(path.steps[2].concept_id, "async-await");
    EXPECT_EQ(path.steps[2].estimated_minutes, 10);
    EXPECT_EQ(path.steps[2].priority, RepairPriority::REQUIRED);

    EXPECT_EQ(path.total_estimated_minutes, 45);
    EXPECT_DOUBLE_EQ(path.expected_improvement, 40.0);

    // Not registered
    EXPECT_TRUE(graph.active_repair_paths.empty());
}

TEST_F(AnalysisTest, RepairPathTargetOnly) {
    auto diagnosis = find_root_cause(graph, "closures", kDefaultMaxDepth, kNow);
    auto path = generate_repair_path(graph, "closures", diagnosis, kNow);

    ASSERT_EQ(path.steps.size(), 1);
    EXPECT_EQ(path.steps[0].concept_id, "closures");
    EXPECT_EQ(path.total_estimated_minutes, 10);
    EXPECT_DOUBLE_EQ(path.expected_improvement, 15.0);
}

TEST(RepairPathShapes, BridgingStep) {
    auto graph = build_graph({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}});
    set_comprehension(graph, "a", 20, 1.0);   // collapsed; b stays unknown at 50

    auto diagnosis = find_root_cause(graph, "c", kDefaultMaxDepth, kNow);
    auto path = generate_repair_path(graph, "c", diagnosis, kNow);

    ASSERT_EQ(path.steps.size(), 3);
    EXPECT_EQ(path.steps[0].concept_id, "a");
    EXPECT_EQ(path.steps[1].concept_id, "b");
    EXPECT_EQ(path.steps[1].estimated_minutes, 8);
    EXPECT_EQ(path.steps[1].priority, RepairPriority::RECOMMENDED);
    EXPECT_EQ(path.steps[1].reason, "Bridges the gap between root cause and target");
    EXPECT_EQ(path.total_estimated_minutes, 38);
    EXPECT_DOUBLE_EQ(path.expected_improvement, 30.0);
}

TEST(RepairPathShapes, StrongChainConceptSkipped) {
    auto graph = build_graph({"a", "b", "c"}, {{"a", "b"}, {"b", "c"}});
    set_comprehension(graph, "a", 20, 1.0);
    graph.entanglements["b"].comprehension_score = 80;  // unknown state, but strong

    auto diagnosis = find_root_cause(graph, "c", kDefaultMaxDepth, kNow);
    auto path = generate_repair_path(graph, "c", diagnosis, kNow);

    ASSERT_EQ(path.steps.size(), 2);
    EXPECT_EQ(path.steps[0].concept_id, "a");
    EXPECT_EQ(path.steps[1].concept_id, "c");
}

TEST_F(AnalysisTest, RepairPathLifecycle) {
    auto start = start_repair_path(graph, "async-await", kDefaultMaxDepth, kNow);
    ASSERT_EQ(start.graph.active_repair_paths.size(), 1);
    EXPECT_EQ(start.graph.active_repair_paths[0].id, start.path.id);
    EXPECT_TRUE(graph.active_repair_paths.empty());

    const auto* active = find_active_repair_path(start.graph, "async-await");
    ASSERT_NE(active, nullptr);
    EXPECT_EQ(find_active_repair_path(start.graph, "closures"), nullptr);

    auto g = complete_repair_step(start.graph, start.path.id, "closures", kNow + 1);
    ASSERT_EQ(g.active_repair_paths.size(), 1);
    EXPECT_TRUE(g.active_repair_paths[0].steps[0].completed);
    EXPECT_FALSE(g.active_repair_paths[0].is_complete());

    // Unknown step is ignored
    auto same = complete_repair_step(g, start.path.id, "ghost", kNow + 2);
    EXPECT_EQ(same.metadata.last_updated, g.metadata.last_updated);

    g = complete_repair_step(g, start.path.id, "callbacks", kNow + 3);
    g = complete_repair_step(g, start.path.id, "async-await", kNow + 4);
    EXPECT_TRUE(g.active_repair_paths.empty());
}

TEST_F(AnalysisTest, DismissRepairPath) {
    auto start = start_repair_path(graph, "async-await", kDefaultMaxDepth, kNow);
    auto g = dismiss_repair_path(start.graph, start.path.id, kNow + 1);
    EXPECT_TRUE(g.active_repair_paths.empty());

    auto unchanged = dismiss_repair_path(start.graph, "repair_nothing", kNow + 1);
    EXPECT_EQ(unchanged.active_repair_paths.size(), 1);
}

// ==========================================
// Graph Query Tests
// ==========================================

TEST_F(AnalysisTest, StrugglingConceptsCollapsedFirst) {
    auto struggling = get_struggling_concepts(graph);
    ASSERT_EQ(struggling.size(), 2);
    EXPECT_EQ(struggling[0].node.id, "closures");
    EXPECT_EQ(struggling[1].node.id, "callbacks");
}

TEST(GraphQueries, StrugglingOrderedByCascadeFailures) {
    auto graph = build_graph({"a", "b", "c"}, {});
    set_comprehension(graph, "a", 40, 1.0);
    set_comprehension(graph, "b", 40, 1.0);
    set_comprehension(graph, "c", 40, 1.0);
    graph.entanglements["b"].cascade_failures = 2;

    auto struggling = get_struggling_concepts(graph);
    ASSERT_EQ(struggling.size(), 3);
    EXPECT_EQ(struggling[0].node.id, "b");
    EXPECT_EQ(struggling[1].node.id, "a");
    EXPECT_EQ(struggling[2].node.id, "c");
}

TEST(GraphQueries, KeystoneConcepts) {
    auto graph = build_graph({"hub", "mid", "l1", "l2", "l3"},
                             {{"hub", "l1"}, {"hub", "l2"}, {"hub", "l3"},
                              {"mid", "l1"}, {"mid", "l2"}});

    auto keystones = get_keystone_concepts(graph);
    ASSERT_EQ(keystones.size(), 1);
    EXPECT_EQ(keystones[0].id, "hub");

    auto relaxed = get_keystone_concepts(graph, 2);
    ASSERT_EQ(relaxed.size(), 2);
    EXPECT_EQ(relaxed[0].id, "hub");
    EXPECT_EQ(relaxed[1].id, "mid");
}

TEST_F(AnalysisTest, CriticalPathFollowsChain) {
    std::vector<ConceptId> expected = {"closures", "callbacks", "async-await"};
    EXPECT_EQ(get_critical_path(graph), expected);
}

TEST(GraphQueries, CriticalPathPicksLongest) {
    auto graph = build_graph({"a", "b", "c", "d", "e"},
                             {{"a", "b"}, {"d", "c"}, {"c", "e"}, {"e", "b"}});
    std::vector<ConceptId> expected = {"d", "c", "e", "b"};
    EXPECT_EQ(get_critical_path(graph), expected);
}

TEST(GraphQueries, CriticalPathWithCycle) {
    auto graph = build_graph({"r", "x", "y"}, {{"r", "x"}, {"x", "y"}, {"y", "x"}});
    std::vector<ConceptId> expected = {"r", "x", "y"};
    EXPECT_EQ(get_critical_path(graph), expected);
}

TEST(GraphQueries, CriticalPathEmptyGraph) {
    auto graph = create_empty_graph("course", std::nullopt, kNow);
    EXPECT_TRUE(get_critical_path(graph).empty());
}

TEST_F(AnalysisTest, GraphHealthScore) {
    auto health = calculate_graph_health(graph);

    EXPECT_EQ(health.collapsed_count, 1);
    EXPECT_EQ(health.struggling_count, 1);
    EXPECT_EQ(health.unknown_count, 1);
    // (0 + 25) / 2 known
    EXPECT_DOUBLE_EQ(health.score, 13.0);
    ASSERT_EQ(health.recommendations.size(), 1);
    EXPECT_EQ(health.recommendations[0],
              "1 concept(s) need immediate attention - review fundamentals");
}

TEST(GraphQueries, GraphHealthNothingKnown) {
    auto graph = build_graph({"a", "b"}, {{"a", "b"}});
    auto health = calculate_graph_health(graph);
    EXPECT_DOUBLE_EQ(health.score, 50.0);
    EXPECT_EQ(health.unknown_count, 2);
    EXPECT_TRUE(health.recommendations.empty());
}

TEST(GraphQueries, GraphHealthRecommendations) {
    auto graph = build_graph({"hub", "l1", "l2", "l3", "m"},
                             {{"hub", "l1"}, {"hub", "l2"}, {"hub", "l3"}});
    set_comprehension(graph, "hub", 40, 1.0);
    set_comprehension(graph, "l1", 40, 1.0);
    set_comprehension(graph, "l2", 40, 1.0);
    set_comprehension(graph, "l3", 55, 1.0);
    set_comprehension(graph, "m", 60, 1.0);

    auto health = calculate_graph_health(graph);
    EXPECT_EQ(health.struggling_count, 3);
    EXPECT_EQ(health.unstable_count, 2);
    ASSERT_EQ(health.recommendations.size(), 3);
    EXPECT_EQ(health.recommendations[0],
              "Multiple concepts in struggling state - consider a repair path");
    EXPECT_EQ(health.recommendations[1], "Critical: 1 keystone concept(s) need repair");
    EXPECT_EQ(health.recommendations[2],
              "Many concepts are unstable - consider more practice before advancing");
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
