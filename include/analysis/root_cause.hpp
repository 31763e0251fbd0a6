#pragma once

#include "graph/concept_graph.hpp"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace cee {

constexpr int kDefaultMaxDepth = 5;

enum class RootCauseSeverity {
    CRITICAL,
    MAJOR,
    MINOR
};

std::string severity_to_string(RootCauseSeverity severity);
RootCauseSeverity string_to_severity(const std::string& s);

struct RootCause {
    ConceptId concept_id;
    double confidence = 0.0;                  // [0, 1]
    std::vector<std::string> evidence;        // May be empty
    RootCauseSeverity severity = RootCauseSeverity::MINOR;

    nlohmann::json to_json() const;
    static RootCause from_json(const nlohmann::json& j);
};

/**
 * @brief Diagnosis of the upstream concepts behind a struggle
 */
struct RootCauseResult {
    ConceptId trigger_concept_id;
    std::vector<RootCause> root_causes;       // Descending confidence
    std::vector<ConceptId> causation_chain;   // Most likely root ... trigger
    Timestamp analysis_timestamp = 0;

    nlohmann::json to_json() const;
    static RootCauseResult from_json(const nlohmann::json& j);
};

/**
 * @brief Trace prerequisite edges backward from a struggling concept
 * @param graph Graph to analyze
 * @param trigger_concept_id Concept the learner is struggling with
 * @param max_depth Deepest level whose prerequisites are examined
 * @param now Timestamp recorded on the result
 *
 * Depth-first, with one visited set for the whole call so each concept is
 * expanded at most once. A candidate reached along several paths is reported
 * once with its highest confidence. A prerequisite is a candidate when its
 * state is collapsed, struggling or unstable; the search continues through
 * it either way. Missing nodes are dead ends.
 */
RootCauseResult find_root_cause(
    const ConceptEntanglementGraph& graph,
    const ConceptId& trigger_concept_id,
    int max_depth = kDefaultMaxDepth,
    Timestamp now = current_time_ms()
);

} // namespace cee
