#include "analysis/root_cause.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>

namespace cee {

using json = nlohmann::json;

std::string severity_to_string(RootCauseSeverity severity) {
    switch (severity) {
        case RootCauseSeverity::CRITICAL: return "critical";
        case RootCauseSeverity::MAJOR: return "major";
        case RootCauseSeverity::MINOR: return "minor";
        default: return "minor";
    }
}

RootCauseSeverity string_to_severity(const std::string& s) {
    if (s == "critical") return RootCauseSeverity::CRITICAL;
    if (s == "major") return RootCauseSeverity::MAJOR;
    return RootCauseSeverity::MINOR;
}

json RootCause::to_json() const {
    json j;
    j["concept_id"] = concept_id;
    j["confidence"] = confidence;
    j["evidence"] = evidence;
    j["severity"] = severity_to_string(severity);
    return j;
}

RootCause RootCause::from_json(const json& j) {
    RootCause rc;
    rc.concept_id = j.at("concept_id").get<std::string>();
    rc.confidence = clamp_finite(j.value("confidence", 0.0), 0.0, 1.0);
    rc.evidence = j.value("evidence", std::vector<std::string>{});
    rc.severity = string_to_severity(j.value("severity", "minor"));
    return rc;
}

json RootCauseResult::to_json() const {
    json j;
    j["trigger_concept_id"] = trigger_concept_id;
    json causes = json::array();
    for (const auto& rc : root_causes) {
        causes.push_back(rc.to_json());
    }
    j["root_causes"] = causes;
    j["causation_chain"] = causation_chain;
    j["analysis_timestamp"] = analysis_timestamp;
    return j;
}

RootCauseResult RootCauseResult::from_json(const json& j) {
    RootCauseResult result;
    result.trigger_concept_id = j.at("trigger_concept_id").get<std::string>();
    if (j.contains("root_causes")) {
        for (const auto& rc_json : j["root_causes"]) {
            result.root_causes.push_back(RootCause::from_json(rc_json));
        }
    }
    result.causation_chain = j.value("causation_chain", std::vector<std::string>{});
    result.analysis_timestamp = j.value("analysis_timestamp", static_cast<Timestamp>(0));
    return result;
}

namespace {

std::string format_score(double score) {
    return std::to_string(static_cast<long long>(std::llround(score)));
}

std::vector<std::string> build_evidence(const ConceptEntanglement& e) {
    std::vector<std::string> evidence;

    if (e.state == EntanglementState::COLLAPSED) {
        evidence.push_back("This concept has collapsed - needs complete review");
    }
    if (e.cascade_failures > 2) {
        evidence.push_back("Caused " + std::to_string(e.cascade_failures) +
                           " downstream failures");
    }
    if (e.comprehension_score < 40) {
        evidence.push_back("Low comprehension score: " + format_score(e.comprehension_score) + "%");
    }
    if (e.attempts > 5 && e.comprehension_score < 60) {
        evidence.push_back("Multiple attempts (" + std::to_string(e.attempts) +
                           ") with limited progress");
    }

    return evidence;
}

RootCauseSeverity severity_for_state(EntanglementState state) {
    if (state == EntanglementState::COLLAPSED) return RootCauseSeverity::CRITICAL;
    if (state == EntanglementState::STRUGGLING) return RootCauseSeverity::MAJOR;
    return RootCauseSeverity::MINOR;
}

/**
 * Depth-bounded backward DFS state for one find_root_cause() call
 */
struct BackwardTracer {
    const ConceptEntanglementGraph& graph;
    int max_depth;

    std::set<ConceptId> visited;       // Expanded concepts
    std::map<ConceptId, size_t> diagnosed;  // Candidate index in root_causes
    std::vector<RootCause> root_causes;
    std::vector<ConceptId> causation_chain;
    double best_confidence = -1.0;

    void trace(const ConceptId& concept_id, int depth, std::vector<ConceptId>& path) {
        if (depth > max_depth || visited.count(concept_id)) return;
        visited.insert(concept_id);

        const ConceptNode* node = graph.find_node(concept_id);
        if (!node || !graph.find_entanglement(concept_id)) return;

        for (const auto& prereq_id : node->prerequisites) {
            const ConceptEntanglement* prereq = graph.find_entanglement(prereq_id);
            if (!prereq) continue;

            if (is_problematic(prereq->state)) {
                diagnose(*prereq, depth, path);
            }

            path.push_back(prereq_id);
            trace(prereq_id, depth + 1, path);
            path.pop_back();
        }
    }

    void diagnose(const ConceptEntanglement& prereq, int depth, const std::vector<ConceptId>& path) {
        double cascade_ratio = static_cast<double>(prereq.cascade_failures) /
                               std::max(1, prereq.attempts);
        double score_gap = 100.0 - prereq.comprehension_score;
        double depth_factor = 1.0 - static_cast<double>(depth) / (static_cast<double>(max_depth) + 1.0);
        double confidence = clamp_finite(
            cascade_ratio * 0.3 + (score_gap / 100.0) * 0.4 + depth_factor * 0.3,
            0.0, 1.0);

        // Chain runs from this candidate back to the trigger
        if (confidence > best_confidence) {
            best_confidence = confidence;
            causation_chain.assign(path.rbegin(), path.rend());
            causation_chain.insert(causation_chain.begin(), prereq.concept_id);
        }

        // A concept reached again by a shorter path keeps its best confidence
        auto it = diagnosed.find(prereq.concept_id);
        if (it != diagnosed.end()) {
            RootCause& existing = root_causes[it->second];
            existing.confidence = std::max(existing.confidence, confidence);
            return;
        }

        RootCause rc;
        rc.concept_id = prereq.concept_id;
        rc.confidence = confidence;
        rc.severity = severity_for_state(prereq.state);
        rc.evidence = build_evidence(prereq);

        diagnosed.emplace(prereq.concept_id, root_causes.size());
        root_causes.push_back(std::move(rc));
    }
};

} // namespace

RootCauseResult find_root_cause(
    const ConceptEntanglementGraph& graph,
    const ConceptId& trigger_concept_id,
    int max_depth,
    Timestamp now
) {
    BackwardTracer tracer{graph, std::max(0, max_depth)};
    tracer.causation_chain = {trigger_concept_id};

    std::vector<ConceptId> path = {trigger_concept_id};
    tracer.trace(trigger_concept_id, 0, path);

    std::stable_sort(tracer.root_causes.begin(), tracer.root_causes.end(),
                     [](const RootCause& a, const RootCause& b) {
                         return a.confidence > b.confidence;
                     });

    RootCauseResult result;
    result.trigger_concept_id = trigger_concept_id;
    result.root_causes = std::move(tracer.root_causes);
    result.causation_chain = std::move(tracer.causation_chain);
    result.analysis_timestamp = now;
    return result;
}

} // namespace cee
