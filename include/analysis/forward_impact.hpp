#pragma once

#include "analysis/root_cause.hpp"
#include "graph/concept_graph.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cee {

enum class ImpactLevel {
    HIGH,
    MEDIUM,
    LOW
};

std::string impact_level_to_string(ImpactLevel level);
ImpactLevel string_to_impact_level(const std::string& s);

struct AffectedConcept {
    ConceptId concept_id;
    ImpactLevel impact_level = ImpactLevel::LOW;
    double estimated_score_reduction = 0.0;   // Points lost if the gap persists
    int path_length = 0;                      // Hops from the source

    nlohmann::json to_json() const;
};

/**
 * @brief Projected downstream effect of an unresolved gap
 */
struct ForwardImpactResult {
    ConceptId source_concept_id;
    std::vector<AffectedConcept> affected_concepts;  // high, medium, low; then nearest first
    size_t total_at_risk = 0;
    std::vector<ConceptId> critical_path_affected;

    nlohmann::json to_json() const;
};

/**
 * @brief Propagate a comprehension gap forward over dependents
 * @param graph Graph to analyze
 * @param source_concept_id Concept with the gap
 * @param max_depth Deepest level that is still expanded
 *
 * Breadth-first; each dependent is reported once, at its shortest distance.
 * reduction = gap * transfer * 0.8^depth * weight, where depth is the level
 * of the concept the dependent was reached from.
 */
ForwardImpactResult analyze_forward_impact(
    const ConceptEntanglementGraph& graph,
    const ConceptId& source_concept_id,
    int max_depth = kDefaultMaxDepth
);

} // namespace cee
