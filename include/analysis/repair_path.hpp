#pragma once

#include "analysis/root_cause.hpp"
#include "graph/concept_graph.hpp"
#include <string>

namespace cee {

/**
 * @brief Build an ordered remediation plan from a root-cause diagnosis
 *
 * Steps: one per root cause (descending confidence), then bridging steps for
 * chain concepts scoring below 70, then the target itself. Each concept
 * appears at most once. The plan is not added to the graph.
 */
RepairPath generate_repair_path(
    const ConceptEntanglementGraph& graph,
    const ConceptId& target_concept_id,
    const RootCauseResult& root_cause,
    Timestamp now = current_time_ms()
);

struct RepairPathStart {
    ConceptEntanglementGraph graph;
    RepairPath path;
};

/**
 * @brief Diagnose, plan and register a repair path as active
 */
RepairPathStart start_repair_path(
    const ConceptEntanglementGraph& graph,
    const ConceptId& target_concept_id,
    int max_depth = kDefaultMaxDepth,
    Timestamp now = current_time_ms()
);

/**
 * @brief Mark one step of an active path complete
 *
 * The path leaves active_repair_paths once every step is complete. Unknown
 * path or step IDs leave the graph unchanged.
 */
ConceptEntanglementGraph complete_repair_step(
    const ConceptEntanglementGraph& graph,
    const std::string& repair_path_id,
    const ConceptId& concept_id,
    Timestamp now = current_time_ms()
);

ConceptEntanglementGraph dismiss_repair_path(
    const ConceptEntanglementGraph& graph,
    const std::string& repair_path_id,
    Timestamp now = current_time_ms()
);

// First active path aimed at the target, or nullptr
const RepairPath* find_active_repair_path(
    const ConceptEntanglementGraph& graph,
    const ConceptId& target_concept_id
);

} // namespace cee
