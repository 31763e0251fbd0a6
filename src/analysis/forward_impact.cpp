#include "analysis/forward_impact.hpp"
#include <algorithm>
#include <cmath>
#include <queue>
#include <set>

namespace cee {

using json = nlohmann::json;

std::string impact_level_to_string(ImpactLevel level) {
    switch (level) {
        case ImpactLevel::HIGH: return "high";
        case ImpactLevel::MEDIUM: return "medium";
        case ImpactLevel::LOW: return "low";
        default: return "low";
    }
}

ImpactLevel string_to_impact_level(const std::string& s) {
    if (s == "high") return ImpactLevel::HIGH;
    if (s == "medium") return ImpactLevel::MEDIUM;
    return ImpactLevel::LOW;
}

json AffectedConcept::to_json() const {
    json j;
    j["concept_id"] = concept_id;
    j["impact_level"] = impact_level_to_string(impact_level);
    j["estimated_score_reduction"] = estimated_score_reduction;
    j["path_length"] = path_length;
    return j;
}

json ForwardImpactResult::to_json() const {
    json j;
    j["source_concept_id"] = source_concept_id;
    json affected = json::array();
    for (const auto& a : affected_concepts) {
        affected.push_back(a.to_json());
    }
    j["affected_concepts"] = affected;
    j["total_at_risk"] = total_at_risk;
    j["critical_path_affected"] = critical_path_affected;
    return j;
}

ForwardImpactResult analyze_forward_impact(
    const ConceptEntanglementGraph& graph,
    const ConceptId& source_concept_id,
    int max_depth
) {
    ForwardImpactResult result;
    result.source_concept_id = source_concept_id;

    const ConceptEntanglement* source = graph.find_entanglement(source_concept_id);
    double source_gap = source ? 100.0 - source->comprehension_score : 50.0;
    source_gap = clamp_finite(source_gap, 0.0, 100.0);

    struct QueueEntry {
        ConceptId id;
        int depth;
    };

    std::queue<QueueEntry> queue;
    std::set<ConceptId> reached;
    queue.push({source_concept_id, 0});
    reached.insert(source_concept_id);

    while (!queue.empty()) {
        QueueEntry current = queue.front();
        queue.pop();

        if (current.depth > max_depth) continue;

        const ConceptNode* node = graph.find_node(current.id);
        if (!node) continue;

        for (const auto& dependent_id : node->dependents) {
            if (reached.count(dependent_id)) continue;

            const ConceptNode* dependent = graph.find_node(dependent_id);
            if (!dependent) continue;
            reached.insert(dependent_id);

            const ConceptEdge* edge = graph.find_edge(current.id, dependent_id);
            double edge_weight = edge ? edge->weight : 0.5;
            double transfer = edge ? edge->transfer_coefficient : 0.7;

            double decay = std::pow(0.8, current.depth);
            double reduction = source_gap * transfer * decay * edge_weight;

            ImpactLevel level = ImpactLevel::LOW;
            if (reduction > 30) level = ImpactLevel::HIGH;
            else if (reduction > 15) level = ImpactLevel::MEDIUM;

            AffectedConcept affected;
            affected.concept_id = dependent_id;
            affected.impact_level = level;
            affected.estimated_score_reduction = clamp_finite(reduction, 0.0, 100.0);
            affected.path_length = current.depth + 1;
            result.affected_concepts.push_back(affected);

            if (dependent->dependents.size() > 2 && level == ImpactLevel::HIGH) {
                result.critical_path_affected.push_back(dependent_id);
            }

            queue.push({dependent_id, current.depth + 1});
        }
    }

    // Enum order is high, medium, low
    std::stable_sort(result.affected_concepts.begin(), result.affected_concepts.end(),
                     [](const AffectedConcept& a, const AffectedConcept& b) {
                         if (a.impact_level != b.impact_level) {
                             return static_cast<int>(a.impact_level) < static_cast<int>(b.impact_level);
                         }
                         return a.path_length < b.path_length;
                     });

    result.total_at_risk = result.affected_concepts.size();
    return result;
}

} // namespace cee
