#include "analysis/repair_path.hpp"
#include <algorithm>
#include <set>

namespace cee {

namespace {

std::string reason_for_severity(RootCauseSeverity severity) {
    switch (severity) {
        case RootCauseSeverity::CRITICAL: return "Critical gap - this concept needs complete review";
        case RootCauseSeverity::MAJOR: return "Major gap - focused practice needed";
        default: return "Minor gap - quick review recommended";
    }
}

int minutes_for_state(EntanglementState state) {
    switch (state) {
        case EntanglementState::COLLAPSED: return 20;
        case EntanglementState::STRUGGLING: return 15;
        case EntanglementState::UNSTABLE: return 10;
        default: return 5;
    }
}

std::vector<RepairActivity> activities_for_state(EntanglementState state, const ConceptNode& node) {
    std::vector<RepairActivity> activities;

    if (state == EntanglementState::COLLAPSED) {
        activities.push_back({RepairActivityType::VIDEO,
                              "Re-watch the explanation for \"" + node.title + "\""});
        activities.push_back({RepairActivityType::REVIEW, "Review key concepts and examples"});
    }
    if (state == EntanglementState::COLLAPSED || state == EntanglementState::STRUGGLING) {
        activities.push_back({RepairActivityType::PRACTICE, "Complete guided practice exercises"});
    }
    activities.push_back({RepairActivityType::QUIZ, "Verify understanding with a short quiz"});

    return activities;
}

} // namespace

RepairPath generate_repair_path(
    const ConceptEntanglementGraph& graph,
    const ConceptId& target_concept_id,
    const RootCauseResult& root_cause,
    Timestamp now
) {
    RepairPath path;
    path.id = "repair_" + target_concept_id + "_" + std::to_string(now);
    path.target_concept_id = target_concept_id;
    path.generated_at = now;

    std::set<ConceptId> covered;

    std::vector<RootCause> causes = root_cause.root_causes;
    std::stable_sort(causes.begin(), causes.end(),
                     [](const RootCause& a, const RootCause& b) {
                         return a.confidence > b.confidence;
                     });

    // 1. Root causes
    for (const auto& cause : causes) {
        if (covered.count(cause.concept_id)) continue;

        const ConceptNode* node = graph.find_node(cause.concept_id);
        const ConceptEntanglement* e = graph.find_entanglement(cause.concept_id);
        if (!node || !e) continue;

        covered.insert(cause.concept_id);

        RepairStep step;
        step.concept_id = cause.concept_id;
        step.reason = reason_for_severity(cause.severity);
        step.estimated_minutes = minutes_for_state(e->state);
        step.priority = (cause.severity == RootCauseSeverity::CRITICAL ||
                         cause.severity == RootCauseSeverity::MAJOR)
                            ? RepairPriority::REQUIRED
                            : RepairPriority::RECOMMENDED;
        step.activities = activities_for_state(e->state, *node);
        path.steps.push_back(std::move(step));
    }

    // 2. Bridging concepts between root and target
    for (const auto& concept_id : root_cause.causation_chain) {
        if (covered.count(concept_id) || concept_id == target_concept_id) continue;

        const ConceptNode* node = graph.find_node(concept_id);
        const ConceptEntanglement* e = graph.find_entanglement(concept_id);
        if (!node || !e) continue;
        if (e->comprehension_score >= 70) continue;

        covered.insert(concept_id);

        RepairStep step;
        step.concept_id = concept_id;
        step.reason = "Bridges the gap between root cause and target";
        step.estimated_minutes = 8;
        step.priority = RepairPriority::RECOMMENDED;
        step.activities = {
            {RepairActivityType::REVIEW, "Quick review of \"" + node->title + "\""},
            {RepairActivityType::QUIZ, "Verify understanding"}
        };
        path.steps.push_back(std::move(step));
    }

    // 3. The target
    const ConceptNode* target = graph.find_node(target_concept_id);
    if (target && !covered.count(target_concept_id)) {
        RepairStep step;
        step.concept_id = target_concept_id;
        step.reason = "Your goal - ready to master this concept";
        step.estimated_minutes = 10;
        step.priority = RepairPriority::REQUIRED;
        step.activities = {
            {RepairActivityType::REVIEW, "Approach \"" + target->title + "\" with fresh understanding"},
            {RepairActivityType::PRACTICE, "Apply what you've learned"}
        };
        path.steps.push_back(std::move(step));
    }

    int required = 0;
    for (const auto& step : path.steps) {
        path.total_estimated_minutes += step.estimated_minutes;
        if (step.priority == RepairPriority::REQUIRED) ++required;
    }
    path.expected_improvement = std::min(40.0, required * 15.0);

    return path;
}

RepairPathStart start_repair_path(
    const ConceptEntanglementGraph& graph,
    const ConceptId& target_concept_id,
    int max_depth,
    Timestamp now
) {
    RootCauseResult diagnosis = find_root_cause(graph, target_concept_id, max_depth, now);

    RepairPathStart start{graph, generate_repair_path(graph, target_concept_id, diagnosis, now)};
    start.graph.active_repair_paths.push_back(start.path);
    start.graph.metadata.last_updated = now;
    return start;
}

ConceptEntanglementGraph complete_repair_step(
    const ConceptEntanglementGraph& graph,
    const std::string& repair_path_id,
    const ConceptId& concept_id,
    Timestamp now
) {
    auto path_it = std::find_if(graph.active_repair_paths.begin(), graph.active_repair_paths.end(),
                                [&](const RepairPath& p) { return p.id == repair_path_id; });
    if (path_it == graph.active_repair_paths.end()) {
        return graph;
    }

    auto step_it = std::find_if(path_it->steps.begin(), path_it->steps.end(),
                                [&](const RepairStep& s) { return s.concept_id == concept_id; });
    if (step_it == path_it->steps.end()) {
        return graph;
    }

    ConceptEntanglementGraph result = graph;
    auto index = static_cast<size_t>(path_it - graph.active_repair_paths.begin());
    auto step_index = static_cast<size_t>(step_it - path_it->steps.begin());

    RepairPath& path = result.active_repair_paths[index];
    path.steps[step_index].completed = true;

    if (path.is_complete()) {
        result.active_repair_paths.erase(result.active_repair_paths.begin() +
                                         static_cast<std::ptrdiff_t>(index));
    }

    result.metadata.last_updated = now;
    return result;
}

ConceptEntanglementGraph dismiss_repair_path(
    const ConceptEntanglementGraph& graph,
    const std::string& repair_path_id,
    Timestamp now
) {
    auto it = std::find_if(graph.active_repair_paths.begin(), graph.active_repair_paths.end(),
                           [&](const RepairPath& p) { return p.id == repair_path_id; });
    if (it == graph.active_repair_paths.end()) {
        return graph;
    }

    ConceptEntanglementGraph result = graph;
    result.active_repair_paths.erase(result.active_repair_paths.begin() +
                                     (it - graph.active_repair_paths.begin()));
    result.metadata.last_updated = now;
    return result;
}

const RepairPath* find_active_repair_path(
    const ConceptEntanglementGraph& graph,
    const ConceptId& target_concept_id
) {
    for (const auto& path : graph.active_repair_paths) {
        if (path.target_concept_id == target_concept_id) return &path;
    }
    return nullptr;
}

} // namespace cee
