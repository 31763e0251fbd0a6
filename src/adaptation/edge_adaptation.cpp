#include "adaptation/edge_adaptation.hpp"
#include <algorithm>
#include <cmath>

namespace cee {

ConceptEntanglementGraph update_edge_weights(
    const ConceptEntanglementGraph& graph,
    const ConceptId& from_concept_id,
    const ConceptId& to_concept_id,
    bool success,
    Timestamp now
) {
    const ConceptEdge* found = graph.find_edge(from_concept_id, to_concept_id);
    if (!found) {
        return graph;
    }

    ConceptEntanglementGraph result = graph;
    ConceptEdge& edge = result.edges[static_cast<size_t>(found - graph.edges.data())];

    if (success) {
        edge.successful_traversals += 1;
    } else {
        edge.difficult_traversals += 1;
    }

    int total = edge.total_traversals();
    if (total >= kEdgeWarmupTraversals) {
        double observed_rate = static_cast<double>(edge.successful_traversals) / total;
        double prior_weight = 3.0 / (total + 3.0);
        edge.transfer_coefficient = clamp_finite(
            kTransferPrior * prior_weight + observed_rate * (1.0 - prior_weight), 0.0, 1.0);
        edge.weight = clamp_finite(0.3 + 0.7 * edge.transfer_coefficient, 0.0, 1.0);
    }

    auto source = result.entanglements.find(from_concept_id);
    if (source != result.entanglements.end()) {
        if (success) {
            source->second.cascade_successes += 1;
        } else {
            source->second.cascade_failures += 1;
        }
    }

    result.metadata.last_updated = now;
    return result;
}

ConceptEntanglementGraph record_transfer_pattern(
    const ConceptEntanglementGraph& graph,
    const ConceptId& from_concept_id,
    const ConceptId& to_concept_id,
    double from_score,
    double to_score,
    Timestamp now
) {
    from_score = clamp_finite(from_score, 0.0, 100.0);
    to_score = clamp_finite(to_score, 0.0, 100.0);

    // Perfect transfer is taken to carry 80% of the source score
    double expected_to_score = from_score * 0.8;
    double transfer_rate = clamp_finite(to_score / std::max(1.0, expected_to_score), 0.0, 1.0);

    ConceptEntanglementGraph result = graph;

    auto it = std::find_if(result.transfer_patterns.begin(), result.transfer_patterns.end(),
                           [&](const LearningTransferPattern& p) {
                               return p.from_concept == from_concept_id &&
                                      p.to_concept == to_concept_id;
                           });

    if (it == result.transfer_patterns.end()) {
        LearningTransferPattern pattern;
        pattern.id = "pattern_" + from_concept_id + "_" + to_concept_id;
        pattern.from_concept = from_concept_id;
        pattern.to_concept = to_concept_id;
        result.transfer_patterns.push_back(pattern);
        it = result.transfer_patterns.end() - 1;
    }

    LearningTransferPattern& pattern = *it;
    int n = pattern.sample_size + 1;

    pattern.transfer_rate = clamp_finite(
        (pattern.transfer_rate * pattern.sample_size + transfer_rate) / n, 0.0, 1.0);

    // Welford update of means and co-moment
    double dx = from_score - pattern.mean_from;
    double dy = to_score - pattern.mean_to;
    pattern.mean_from += dx / n;
    pattern.mean_to += dy / n;
    pattern.m2_from += dx * (from_score - pattern.mean_from);
    pattern.m2_to += dy * (to_score - pattern.mean_to);
    pattern.co_moment += dx * (to_score - pattern.mean_to);

    double denom = std::sqrt(pattern.m2_from * pattern.m2_to);
    pattern.correlation = denom > 0.0 ? clamp_finite(pattern.co_moment / denom, -1.0, 1.0) : 0.0;

    pattern.sample_size = n;
    pattern.last_updated = now;

    result.metadata.last_updated = now;
    return result;
}

ConceptEntanglementGraph record_transfer(
    const ConceptEntanglementGraph& graph,
    const ConceptId& from_concept_id,
    const ConceptId& to_concept_id,
    double from_score,
    double to_score,
    bool success,
    Timestamp now
) {
    ConceptEntanglementGraph updated = update_edge_weights(graph, from_concept_id, to_concept_id,
                                                           success, now);
    return record_transfer_pattern(updated, from_concept_id, to_concept_id,
                                   from_score, to_score, now);
}

const LearningTransferPattern* find_transfer_pattern(
    const ConceptEntanglementGraph& graph,
    const ConceptId& from_concept_id,
    const ConceptId& to_concept_id
) {
    for (const auto& pattern : graph.transfer_patterns) {
        if (pattern.from_concept == from_concept_id && pattern.to_concept == to_concept_id) {
            return &pattern;
        }
    }
    return nullptr;
}

} // namespace cee
