#include "analysis/graph_queries.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace cee {

using json = nlohmann::json;

json GraphHealth::to_json() const {
    json j;
    j["score"] = score;
    j["mastered_count"] = mastered_count;
    j["stable_count"] = stable_count;
    j["unstable_count"] = unstable_count;
    j["struggling_count"] = struggling_count;
    j["collapsed_count"] = collapsed_count;
    j["unknown_count"] = unknown_count;
    j["recommendations"] = recommendations;
    return j;
}

std::vector<StrugglingConcept> get_struggling_concepts(const ConceptEntanglementGraph& graph) {
    std::vector<StrugglingConcept> results;

    for (const auto& [concept_id, entanglement] : graph.entanglements) {
        if (entanglement.state != EntanglementState::STRUGGLING &&
            entanglement.state != EntanglementState::COLLAPSED) {
            continue;
        }
        const ConceptNode* node = graph.find_node(concept_id);
        if (node) {
            results.push_back({*node, entanglement});
        }
    }

    std::sort(results.begin(), results.end(),
              [](const StrugglingConcept& a, const StrugglingConcept& b) {
                  bool a_collapsed = a.entanglement.state == EntanglementState::COLLAPSED;
                  bool b_collapsed = b.entanglement.state == EntanglementState::COLLAPSED;
                  if (a_collapsed != b_collapsed) return a_collapsed;
                  if (a.entanglement.cascade_failures != b.entanglement.cascade_failures) {
                      return a.entanglement.cascade_failures > b.entanglement.cascade_failures;
                  }
                  return a.node.id < b.node.id;
              });

    return results;
}

std::vector<ConceptNode> get_keystone_concepts(
    const ConceptEntanglementGraph& graph,
    size_t min_dependents
) {
    std::vector<ConceptNode> keystones;

    for (const auto& id : graph.sorted_node_ids()) {
        const ConceptNode& node = graph.nodes.at(id);
        if (node.dependents.size() >= min_dependents) {
            keystones.push_back(node);
        }
    }

    std::stable_sort(keystones.begin(), keystones.end(),
                     [](const ConceptNode& a, const ConceptNode& b) {
                         return a.dependents.size() > b.dependents.size();
                     });

    return keystones;
}

namespace {

struct LongestPathSearch {
    const ConceptEntanglementGraph& graph;
    std::map<ConceptId, std::vector<ConceptId>> memo;
    std::set<ConceptId> on_stack;

    const std::vector<ConceptId>& longest_from(const ConceptId& concept_id) {
        auto cached = memo.find(concept_id);
        if (cached != memo.end()) return cached->second;

        on_stack.insert(concept_id);

        std::vector<ConceptId> longest_downstream;
        const ConceptNode* node = graph.find_node(concept_id);
        if (node) {
            for (const auto& dependent_id : node->dependents) {
                if (on_stack.count(dependent_id)) continue;
                const auto& downstream = longest_from(dependent_id);
                if (downstream.size() > longest_downstream.size()) {
                    longest_downstream = downstream;
                }
            }
        }

        on_stack.erase(concept_id);

        std::vector<ConceptId> full_path;
        full_path.reserve(longest_downstream.size() + 1);
        full_path.push_back(concept_id);
        full_path.insert(full_path.end(), longest_downstream.begin(), longest_downstream.end());
        return memo[concept_id] = std::move(full_path);
    }
};

} // namespace

std::vector<ConceptId> get_critical_path(const ConceptEntanglementGraph& graph) {
    LongestPathSearch search{graph, {}, {}};
    std::vector<ConceptId> critical_path;

    for (const auto& id : graph.sorted_node_ids()) {
        if (!graph.nodes.at(id).prerequisites.empty()) continue;

        const auto& path = search.longest_from(id);
        if (path.size() > critical_path.size()) {
            critical_path = path;
        }
    }

    return critical_path;
}

GraphHealth calculate_graph_health(const ConceptEntanglementGraph& graph) {
    GraphHealth health;

    for (const auto& [id, entanglement] : graph.entanglements) {
        switch (entanglement.state) {
            case EntanglementState::MASTERED: health.mastered_count++; break;
            case EntanglementState::STABLE: health.stable_count++; break;
            case EntanglementState::UNSTABLE: health.unstable_count++; break;
            case EntanglementState::STRUGGLING: health.struggling_count++; break;
            case EntanglementState::COLLAPSED: health.collapsed_count++; break;
            case EntanglementState::UNKNOWN: health.unknown_count++; break;
        }
    }

    int total = static_cast<int>(graph.entanglements.size());
    int known_total = total - health.unknown_count;

    if (known_total > 0) {
        double points = health.mastered_count * 100.0 +
                        health.stable_count * 80.0 +
                        health.unstable_count * 50.0 +
                        health.struggling_count * 25.0;
        health.score = clamp_finite(std::round(points / known_total), 0.0, 100.0);
    }

    if (health.collapsed_count > 0) {
        health.recommendations.push_back(
            std::to_string(health.collapsed_count) +
            " concept(s) need immediate attention - review fundamentals");
    }

    if (health.struggling_count > 2) {
        health.recommendations.push_back(
            "Multiple concepts in struggling state - consider a repair path");
    }

    int struggling_keystones = 0;
    for (const auto& keystone : get_keystone_concepts(graph, kDefaultKeystoneMinDependents)) {
        const ConceptEntanglement* e = graph.find_entanglement(keystone.id);
        if (e && (e->state == EntanglementState::STRUGGLING ||
                  e->state == EntanglementState::COLLAPSED)) {
            ++struggling_keystones;
        }
    }
    if (struggling_keystones > 0) {
        health.recommendations.push_back(
            "Critical: " + std::to_string(struggling_keystones) +
            " keystone concept(s) need repair");
    }

    if (health.unstable_count > known_total * 0.3) {
        health.recommendations.push_back(
            "Many concepts are unstable - consider more practice before advancing");
    }

    return health;
}

} // namespace cee
