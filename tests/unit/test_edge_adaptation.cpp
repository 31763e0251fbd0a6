#include <gtest/gtest.h>
#include "adaptation/edge_adaptation.hpp"
#include <cmath>

using namespace cee;

namespace {

constexpr Timestamp kNow = 1700000000000;

} // namespace

class EdgeAdaptationTest : public ::testing::Test {
protected:
    ConceptEntanglementGraph graph;

    void SetUp() override {
        graph = create_empty_graph("js-101", std::nullopt, kNow);

        for (const char* id : {"closures", "callbacks"}) {
            ConceptNode node;
            node.id = id;
            node.title = id;
            graph = add_concept_node(graph, node, kNow);
        }

        ConceptEdge edge;
        edge.from = "closures";
        edge.to = "callbacks";
        edge.weight = 0.8;
        edge.transfer_coefficient = 0.7;
        graph = add_concept_edge(graph, edge, kNow);
    }

    ConceptEntanglementGraph traverse(ConceptEntanglementGraph g, int times, bool success) {
        for (int i = 0; i < times; ++i) {
            g = update_edge_weights(g, "closures", "callbacks", success, kNow);
        }
        return g;
    }
};

// ==========================================
// Edge Weight Tests
// ==========================================

TEST_F(EdgeAdaptationTest, WarmupLeavesWeightsAlone) {
    auto g = traverse(graph, 2, true);

    const auto* edge = g.find_edge("closures", "callbacks");
    ASSERT_NE(edge, nullptr);
    EXPECT_EQ(edge->successful_traversals, 2);
    EXPECT_EQ(edge->difficult_traversals, 0);
    EXPECT_DOUBLE_EQ(edge->weight, 0.8);
    EXPECT_DOUBLE_EQ(edge->transfer_coefficient, 0.7);
}

TEST_F(EdgeAdaptationTest, BlendsPriorAfterWarmup) {
    auto g = traverse(graph, 3, true);

    // prior weight 3 / 6: 0.7 * 0.5 + 1.0 * 0.5
    const auto* edge = g.find_edge("closures", "callbacks");
    EXPECT_NEAR(edge->transfer_coefficient, 0.85, 1e-9);
    EXPECT_NEAR(edge->weight, 0.3 + 0.7 * 0.85, 1e-9);
}

TEST_F(EdgeAdaptationTest, MixedOutcomes) {
    auto g = traverse(graph, 2, true);
    g = traverse(g, 2, false);

    // rate 0.5, prior weight 3 / 7
    const auto* edge = g.find_edge("closures", "callbacks");
    double prior = 3.0 / 7.0;
    double expected = 0.7 * prior + 0.5 * (1.0 - prior);
    EXPECT_EQ(edge->total_traversals(), 4);
    EXPECT_NEAR(edge->transfer_coefficient, expected, 1e-9);
}

TEST_F(EdgeAdaptationTest, ConvergesTowardOne) {
    auto g = traverse(graph, 200, true);

    const auto* edge = g.find_edge("closures", "callbacks");
    EXPECT_GT(edge->transfer_coefficient, 0.99);
    EXPECT_LE(edge->transfer_coefficient, 1.0);
    EXPECT_GT(edge->weight, 0.99);
    EXPECT_LE(edge->weight, 1.0);
}

TEST_F(EdgeAdaptationTest, WeightFloorOnFailure) {
    auto g = traverse(graph, 200, false);

    const auto* edge = g.find_edge("closures", "callbacks");
    EXPECT_LT(edge->transfer_coefficient, 0.02);
    EXPECT_GE(edge->transfer_coefficient, 0.0);
    EXPECT_GE(edge->weight, 0.3);
    EXPECT_LT(edge->weight, 0.32);
}

TEST_F(EdgeAdaptationTest, CascadeCounters) {
    auto g = traverse(graph, 3, false);
    g = traverse(g, 1, true);

    const auto* source = g.find_entanglement("closures");
    EXPECT_EQ(source->cascade_failures, 3);
    EXPECT_EQ(source->cascade_successes, 1);

    const auto* target = g.find_entanglement("callbacks");
    EXPECT_EQ(target->cascade_failures, 0);
}

TEST_F(EdgeAdaptationTest, MissingEdgeIsNoOp) {
    auto g = update_edge_weights(graph, "callbacks", "closures", false, kNow + 10);
    EXPECT_EQ(g.metadata.last_updated, kNow);
    EXPECT_EQ(g.find_entanglement("callbacks")->cascade_failures, 0);
}

// ==========================================
// Transfer Pattern Tests
// ==========================================

TEST_F(EdgeAdaptationTest, FirstTransferPattern) {
    auto g = record_transfer_pattern(graph, "closures", "callbacks", 80, 48, kNow);

    const auto* pattern = find_transfer_pattern(g, "closures", "callbacks");
    ASSERT_NE(pattern, nullptr);
    EXPECT_EQ(pattern->id, "pattern_closures_callbacks");
    EXPECT_EQ(pattern->sample_size, 1);
    // 48 / (80 * 0.8)
    EXPECT_NEAR(pattern->transfer_rate, 0.75, 1e-9);
    EXPECT_DOUBLE_EQ(pattern->correlation, 0.0);
    EXPECT_EQ(pattern->last_updated, kNow);
}

TEST_F(EdgeAdaptationTest, TransferRateRunningMean) {
    auto g = record_transfer_pattern(graph, "closures", "callbacks", 80, 48, kNow);
    g = record_transfer_pattern(g, "closures", "callbacks", 50, 100, kNow + 1);

    const auto* pattern = find_transfer_pattern(g, "closures", "callbacks");
    ASSERT_EQ(g.transfer_patterns.size(), 1);
    EXPECT_EQ(pattern->sample_size, 2);
    // (0.75 + 1.0) / 2
    EXPECT_NEAR(pattern->transfer_rate, 0.875, 1e-9);
}

TEST_F(EdgeAdaptationTest, TransferRateWithZeroSource) {
    auto g = record_transfer_pattern(graph, "closures", "callbacks", 0, 0, kNow);
    EXPECT_DOUBLE_EQ(find_transfer_pattern(g, "closures", "callbacks")->transfer_rate, 0.0);

    g = record_transfer_pattern(graph, "closures", "callbacks", 0, 30, kNow);
    EXPECT_DOUBLE_EQ(find_transfer_pattern(g, "closures", "callbacks")->transfer_rate, 1.0);
}

TEST_F(EdgeAdaptationTest, CorrelationTracksScores) {
    auto g = graph;
    double from_scores[] = {20, 40, 60, 80};
    for (double s : from_scores) {
        g = record_transfer_pattern(g, "closures", "callbacks", s, s * 0.5 + 10, kNow);
    }
    EXPECT_NEAR(find_transfer_pattern(g, "closures", "callbacks")->correlation, 1.0, 1e-9);

    auto inverse = graph;
    for (double s : from_scores) {
        inverse = record_transfer_pattern(inverse, "closures", "callbacks", s, 100 - s, kNow);
    }
    EXPECT_NEAR(find_transfer_pattern(inverse, "closures", "callbacks")->correlation, -1.0, 1e-9);
}

TEST_F(EdgeAdaptationTest, PatternsPerDirection) {
    auto g = record_transfer_pattern(graph, "closures", "callbacks", 80, 60, kNow);
    g = record_transfer_pattern(g, "callbacks", "closures", 80, 60, kNow);
    EXPECT_EQ(g.transfer_patterns.size(), 2);
    EXPECT_EQ(find_transfer_pattern(g, "callbacks", "variables"), nullptr);
}

TEST_F(EdgeAdaptationTest, RecordTransferCombines) {
    auto g = record_transfer(graph, "closures", "callbacks", 70, 60, false, kNow);

    EXPECT_EQ(g.find_edge("closures", "callbacks")->difficult_traversals, 1);
    EXPECT_EQ(g.find_entanglement("closures")->cascade_failures, 1);
    ASSERT_NE(find_transfer_pattern(g, "closures", "callbacks"), nullptr);
}

TEST_F(EdgeAdaptationTest, RecordTransferWithoutEdgeStillRecordsPattern) {
    auto g = record_transfer(graph, "callbacks", "closures", 70, 60, true, kNow);
    EXPECT_EQ(g.find_entanglement("callbacks")->cascade_successes, 0);
    EXPECT_NE(find_transfer_pattern(g, "callbacks", "closures"), nullptr);
}

// ==========================================
// Main
// ==========================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
