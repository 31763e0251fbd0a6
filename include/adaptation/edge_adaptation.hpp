#pragma once

#include "graph/concept_graph.hpp"

namespace cee {

// Traversals required before observations move an edge
constexpr int kEdgeWarmupTraversals = 3;

// Transfer coefficient assumed before any evidence
constexpr double kTransferPrior = 0.7;

/**
 * @brief Adapt the edge from -> to after a learner moved along it
 * @param success Whether the learner succeeded on the dependent concept
 *
 * Counters always advance. Once the edge has kEdgeWarmupTraversals outcomes
 * the transfer coefficient becomes a blend of the prior and the observed
 * success rate, with the prior weighted 3 / (total + 3), and the weight is
 * set to 0.3 + 0.7 * transfer. Below that, weight and transfer are left alone.
 * The source concept's cascade counters are incremented too.
 *
 * No-op if the edge does not exist.
 */
ConceptEntanglementGraph update_edge_weights(
    const ConceptEntanglementGraph& graph,
    const ConceptId& from_concept_id,
    const ConceptId& to_concept_id,
    bool success,
    Timestamp now = current_time_ms()
);

/**
 * @brief Fold one (from, to) score observation into the transfer pattern
 */
ConceptEntanglementGraph record_transfer_pattern(
    const ConceptEntanglementGraph& graph,
    const ConceptId& from_concept_id,
    const ConceptId& to_concept_id,
    double from_score,
    double to_score,
    Timestamp now = current_time_ms()
);

/**
 * @brief update_edge_weights() followed by record_transfer_pattern()
 */
ConceptEntanglementGraph record_transfer(
    const ConceptEntanglementGraph& graph,
    const ConceptId& from_concept_id,
    const ConceptId& to_concept_id,
    double from_score,
    double to_score,
    bool success,
    Timestamp now = current_time_ms()
);

// Pattern for the pair, or nullptr
const LearningTransferPattern* find_transfer_pattern(
    const ConceptEntanglementGraph& graph,
    const ConceptId& from_concept_id,
    const ConceptId& to_concept_id
);

} // namespace cee
