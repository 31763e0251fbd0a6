#pragma once

#include "graph/concept_graph.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cee {

constexpr size_t kDefaultKeystoneMinDependents = 3;

struct StrugglingConcept {
    ConceptNode node;
    ConceptEntanglement entanglement;
};

/**
 * @brief Summary of learner progress over the whole graph
 */
struct GraphHealth {
    double score = 50.0;                      // 0-100, 50 when nothing is known
    int mastered_count = 0;
    int stable_count = 0;
    int unstable_count = 0;
    int struggling_count = 0;
    int collapsed_count = 0;
    int unknown_count = 0;
    std::vector<std::string> recommendations;

    nlohmann::json to_json() const;
};

/**
 * @brief Concepts in struggling or collapsed state
 *
 * Collapsed first, then by cascade failures descending, then by id.
 */
std::vector<StrugglingConcept> get_struggling_concepts(const ConceptEntanglementGraph& graph);

/**
 * @brief Nodes with at least min_dependents dependents, most dependents first
 */
std::vector<ConceptNode> get_keystone_concepts(
    const ConceptEntanglementGraph& graph,
    size_t min_dependents = kDefaultKeystoneMinDependents
);

/**
 * @brief Longest prerequisite chain starting at a node with no prerequisites
 *
 * Memoized longest downstream path. A node met again while still on the
 * recursion stack is treated as a dead end, so a cycle terminates but yields
 * a best-effort answer.
 */
std::vector<ConceptId> get_critical_path(const ConceptEntanglementGraph& graph);

GraphHealth calculate_graph_health(const ConceptEntanglementGraph& graph);

} // namespace cee
