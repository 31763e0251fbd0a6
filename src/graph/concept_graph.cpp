#include "graph/concept_graph.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace cee {

using json = nlohmann::json;

namespace {

// Append to an ordered set (no duplicates)
void insert_unique(std::vector<ConceptId>& ids, const ConceptId& id) {
    if (std::find(ids.begin(), ids.end(), id) == ids.end()) {
        ids.push_back(id);
    }
}

} // namespace

// ==========================================
// Enumerations
// ==========================================

std::string entanglement_state_to_string(EntanglementState state) {
    switch (state) {
        case EntanglementState::MASTERED: return "mastered";
        case EntanglementState::STABLE: return "stable";
        case EntanglementState::UNSTABLE: return "unstable";
        case EntanglementState::STRUGGLING: return "struggling";
        case EntanglementState::COLLAPSED: return "collapsed";
        case EntanglementState::UNKNOWN: return "unknown";
        default: return "unknown";
    }
}

EntanglementState string_to_entanglement_state(const std::string& s) {
    if (s == "mastered") return EntanglementState::MASTERED;
    if (s == "stable") return EntanglementState::STABLE;
    if (s == "unstable") return EntanglementState::UNSTABLE;
    if (s == "struggling") return EntanglementState::STRUGGLING;
    if (s == "collapsed") return EntanglementState::COLLAPSED;
    return EntanglementState::UNKNOWN;
}

bool is_problematic(EntanglementState state) {
    return state == EntanglementState::COLLAPSED ||
           state == EntanglementState::STRUGGLING ||
           state == EntanglementState::UNSTABLE;
}

std::string edge_type_to_string(ConceptEdgeType type) {
    switch (type) {
        case ConceptEdgeType::PREREQUISITE: return "prerequisite";
        case ConceptEdgeType::REINFORCES: return "reinforces";
        case ConceptEdgeType::RELATED: return "related";
        case ConceptEdgeType::BUILDS_UPON: return "builds-upon";
        default: return "related";
    }
}

ConceptEdgeType string_to_edge_type(const std::string& s) {
    if (s == "prerequisite") return ConceptEdgeType::PREREQUISITE;
    if (s == "reinforces") return ConceptEdgeType::REINFORCES;
    if (s == "related") return ConceptEdgeType::RELATED;
    if (s == "builds-upon" || s == "builds_upon") return ConceptEdgeType::BUILDS_UPON;
    throw std::invalid_argument("Unknown edge type: " + s);
}

std::string repair_priority_to_string(RepairPriority priority) {
    switch (priority) {
        case RepairPriority::REQUIRED: return "required";
        case RepairPriority::RECOMMENDED: return "recommended";
        case RepairPriority::OPTIONAL: return "optional";
        default: return "optional";
    }
}

RepairPriority string_to_repair_priority(const std::string& s) {
    if (s == "required") return RepairPriority::REQUIRED;
    if (s == "recommended") return RepairPriority::RECOMMENDED;
    return RepairPriority::OPTIONAL;
}

std::string activity_type_to_string(RepairActivityType type) {
    switch (type) {
        case RepairActivityType::REVIEW: return "review";
        case RepairActivityType::QUIZ: return "quiz";
        case RepairActivityType::PRACTICE: return "practice";
        case RepairActivityType::VIDEO: return "video";
        default: return "review";
    }
}

RepairActivityType string_to_activity_type(const std::string& s) {
    if (s == "quiz") return RepairActivityType::QUIZ;
    if (s == "practice") return RepairActivityType::PRACTICE;
    if (s == "video") return RepairActivityType::VIDEO;
    return RepairActivityType::REVIEW;
}

// ==========================================
// Numeric helpers
// ==========================================

double clamp_finite(double value, double lo, double hi) {
    if (std::isnan(value)) return lo;
    return std::min(hi, std::max(lo, value));
}

Timestamp current_time_ms() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count();
}

// ==========================================
// ConceptNode Implementation
// ==========================================

json ConceptNode::to_json() const {
    json j;
    j["id"] = id;
    j["title"] = title;
    j["description"] = description;
    j["section_id"] = section_id;
    j["chapter_id"] = chapter_id;
    j["course_id"] = course_id;
    j["order"] = order;
    j["difficulty"] = difficulty;
    j["xp_reward"] = xp_reward;
    j["skills"] = skills;
    j["prerequisites"] = prerequisites;
    j["dependents"] = dependents;
    j["related"] = related;
    return j;
}

ConceptNode ConceptNode::from_json(const json& j) {
    ConceptNode node;
    node.id = j.at("id").get<std::string>();
    node.title = j.value("title", node.id);
    node.description = j.value("description", "");
    node.section_id = j.value("section_id", "");
    node.chapter_id = j.value("chapter_id", "");
    node.course_id = j.value("course_id", "");
    node.order = j.value("order", 0);
    node.difficulty = clamp_finite(j.value("difficulty", 0.0), 0.0, 100.0);
    node.xp_reward = j.value("xp_reward", 0);
    node.skills = j.value("skills", std::vector<std::string>{});
    node.prerequisites = j.value("prerequisites", std::vector<std::string>{});
    node.dependents = j.value("dependents", std::vector<std::string>{});
    node.related = j.value("related", std::vector<std::string>{});
    return node;
}

// ==========================================
// ConceptEdge Implementation
// ==========================================

std::string ConceptEdge::make_id(const ConceptId& from, const ConceptId& to, ConceptEdgeType type) {
    return "edge_" + from + "_" + to + "_" + edge_type_to_string(type);
}

json ConceptEdge::to_json() const {
    json j;
    j["id"] = id;
    j["from"] = from;
    j["to"] = to;
    j["type"] = edge_type_to_string(type);
    j["weight"] = weight;
    j["transfer_coefficient"] = transfer_coefficient;
    j["successful_traversals"] = successful_traversals;
    j["difficult_traversals"] = difficult_traversals;
    if (!label.empty()) {
        j["label"] = label;
    }
    return j;
}

ConceptEdge ConceptEdge::from_json(const json& j) {
    ConceptEdge edge;
    edge.from = j.at("from").get<std::string>();
    edge.to = j.at("to").get<std::string>();
    edge.type = string_to_edge_type(j.value("type", "prerequisite"));
    edge.id = j.value("id", make_id(edge.from, edge.to, edge.type));
    edge.weight = clamp_finite(j.value("weight", 0.5), 0.0, 1.0);
    edge.transfer_coefficient = clamp_finite(j.value("transfer_coefficient", 0.7), 0.0, 1.0);
    edge.successful_traversals = std::max(0, j.value("successful_traversals", 0));
    edge.difficult_traversals = std::max(0, j.value("difficult_traversals", 0));
    edge.label = j.value("label", "");
    return edge;
}

// ==========================================
// ConceptEntanglement Implementation
// ==========================================

ConceptEntanglement ConceptEntanglement::initial(const ConceptId& concept_id) {
    ConceptEntanglement e;
    e.concept_id = concept_id;
    return e;
}

json ConceptEntanglement::to_json() const {
    json j;
    j["concept_id"] = concept_id;
    j["state"] = entanglement_state_to_string(state);
    j["comprehension_score"] = comprehension_score;
    j["confidence"] = confidence;
    j["attempts"] = attempts;
    j["time_spent_ms"] = time_spent_ms;
    json signals_json = json::array();
    for (const auto& signal : signals) {
        signals_json.push_back(signal.to_json());
    }
    j["signals"] = signals_json;
    j["last_interaction"] = last_interaction;
    j["cascade_failures"] = cascade_failures;
    j["cascade_successes"] = cascade_successes;
    return j;
}

ConceptEntanglement ConceptEntanglement::from_json(const json& j) {
    ConceptEntanglement e;
    e.concept_id = j.at("concept_id").get<std::string>();
    e.state = string_to_entanglement_state(j.value("state", "unknown"));
    e.comprehension_score = clamp_finite(j.value("comprehension_score", 50.0), 0.0, 100.0);
    e.confidence = clamp_finite(j.value("confidence", 0.0), 0.0, 1.0);
    e.attempts = j.value("attempts", 0);
    e.time_spent_ms = j.value("time_spent_ms", static_cast<int64_t>(0));
    if (j.contains("signals")) {
        for (const auto& signal_json : j["signals"]) {
            e.signals.push_back(BehaviorSignal::from_json(signal_json));
        }
    }
    e.last_interaction = j.value("last_interaction", static_cast<Timestamp>(0));
    e.cascade_failures = j.value("cascade_failures", 0);
    e.cascade_successes = j.value("cascade_successes", 0);
    return e;
}

// ==========================================
// Repair path types
// ==========================================

json RepairActivity::to_json() const {
    return json{
        {"type", activity_type_to_string(type)},
        {"description", description}
    };
}

RepairActivity RepairActivity::from_json(const json& j) {
    RepairActivity a;
    a.type = string_to_activity_type(j.value("type", "review"));
    a.description = j.value("description", "");
    return a;
}

json RepairStep::to_json() const {
    json j;
    j["concept_id"] = concept_id;
    j["reason"] = reason;
    j["estimated_minutes"] = estimated_minutes;
    j["priority"] = repair_priority_to_string(priority);
    json activities_json = json::array();
    for (const auto& activity : activities) {
        activities_json.push_back(activity.to_json());
    }
    j["activities"] = activities_json;
    j["completed"] = completed;
    return j;
}

RepairStep RepairStep::from_json(const json& j) {
    RepairStep step;
    step.concept_id = j.at("concept_id").get<std::string>();
    step.reason = j.value("reason", "");
    step.estimated_minutes = j.value("estimated_minutes", 0);
    step.priority = string_to_repair_priority(j.value("priority", "recommended"));
    if (j.contains("activities")) {
        for (const auto& activity_json : j["activities"]) {
            step.activities.push_back(RepairActivity::from_json(activity_json));
        }
    }
    step.completed = j.value("completed", false);
    return step;
}

bool RepairPath::is_complete() const {
    return std::all_of(steps.begin(), steps.end(),
                       [](const RepairStep& s) { return s.completed; });
}

json RepairPath::to_json() const {
    json j;
    j["id"] = id;
    j["target_concept_id"] = target_concept_id;
    json steps_json = json::array();
    for (const auto& step : steps) {
        steps_json.push_back(step.to_json());
    }
    j["steps"] = steps_json;
    j["total_estimated_minutes"] = total_estimated_minutes;
    j["expected_improvement"] = expected_improvement;
    j["generated_at"] = generated_at;
    return j;
}

RepairPath RepairPath::from_json(const json& j) {
    RepairPath path;
    path.id = j.at("id").get<std::string>();
    path.target_concept_id = j.at("target_concept_id").get<std::string>();
    if (j.contains("steps")) {
        for (const auto& step_json : j["steps"]) {
            path.steps.push_back(RepairStep::from_json(step_json));
        }
    }
    path.total_estimated_minutes = j.value("total_estimated_minutes", 0);
    path.expected_improvement = j.value("expected_improvement", 0.0);
    path.generated_at = j.value("generated_at", static_cast<Timestamp>(0));
    return path;
}

// ==========================================
// LearningTransferPattern Implementation
// ==========================================

json LearningTransferPattern::to_json() const {
    json j;
    j["id"] = id;
    j["from_concept"] = from_concept;
    j["to_concept"] = to_concept;
    j["transfer_rate"] = transfer_rate;
    j["sample_size"] = sample_size;
    j["correlation"] = correlation;
    j["last_updated"] = last_updated;
    j["moments"] = {
        {"mean_from", mean_from},
        {"mean_to", mean_to},
        {"m2_from", m2_from},
        {"m2_to", m2_to},
        {"co_moment", co_moment}
    };
    return j;
}

LearningTransferPattern LearningTransferPattern::from_json(const json& j) {
    LearningTransferPattern p;
    p.id = j.at("id").get<std::string>();
    p.from_concept = j.at("from_concept").get<std::string>();
    p.to_concept = j.at("to_concept").get<std::string>();
    p.transfer_rate = clamp_finite(j.value("transfer_rate", 0.0), 0.0, 1.0);
    p.sample_size = j.value("sample_size", 0);
    p.correlation = clamp_finite(j.value("correlation", 0.0), -1.0, 1.0);
    p.last_updated = j.value("last_updated", static_cast<Timestamp>(0));
    if (j.contains("moments")) {
        const auto& m = j["moments"];
        p.mean_from = m.value("mean_from", 0.0);
        p.mean_to = m.value("mean_to", 0.0);
        p.m2_from = m.value("m2_from", 0.0);
        p.m2_to = m.value("m2_to", 0.0);
        p.co_moment = m.value("co_moment", 0.0);
    }
    return p;
}

// ==========================================
// ConceptEntanglementGraph Implementation
// ==========================================

const ConceptNode* ConceptEntanglementGraph::find_node(const ConceptId& id) const {
    auto it = nodes.find(id);
    return it != nodes.end() ? &it->second : nullptr;
}

const ConceptEntanglement* ConceptEntanglementGraph::find_entanglement(const ConceptId& id) const {
    auto it = entanglements.find(id);
    return it != entanglements.end() ? &it->second : nullptr;
}

const ConceptEdge* ConceptEntanglementGraph::find_edge(const ConceptId& from, const ConceptId& to) const {
    const ConceptEdge* fallback = nullptr;
    for (const auto& edge : edges) {
        if (edge.from != from || edge.to != to) continue;
        if (edge.type == ConceptEdgeType::PREREQUISITE) return &edge;
        if (!fallback) fallback = &edge;
    }
    return fallback;
}

std::vector<ConceptId> ConceptEntanglementGraph::sorted_node_ids() const {
    std::vector<ConceptId> ids;
    ids.reserve(nodes.size());
    for (const auto& [id, node] : nodes) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

json ConceptEntanglementGraph::to_json() const {
    json j;
    j["format_version"] = kGraphFormatVersion;

    json nodes_json = json::array();
    for (const auto& id : sorted_node_ids()) {
        nodes_json.push_back(json::array({id, nodes.at(id).to_json()}));
    }
    j["nodes"] = nodes_json;

    std::vector<ConceptId> entanglement_ids;
    for (const auto& [id, e] : entanglements) {
        entanglement_ids.push_back(id);
    }
    std::sort(entanglement_ids.begin(), entanglement_ids.end());

    json entanglements_json = json::array();
    for (const auto& id : entanglement_ids) {
        entanglements_json.push_back(json::array({id, entanglements.at(id).to_json()}));
    }
    j["entanglements"] = entanglements_json;

    json edges_json = json::array();
    for (const auto& edge : edges) {
        edges_json.push_back(edge.to_json());
    }
    j["edges"] = edges_json;

    json patterns_json = json::array();
    for (const auto& pattern : transfer_patterns) {
        patterns_json.push_back(pattern.to_json());
    }
    j["transfer_patterns"] = patterns_json;

    json paths_json = json::array();
    for (const auto& path : active_repair_paths) {
        paths_json.push_back(path.to_json());
    }
    j["active_repair_paths"] = paths_json;

    json meta;
    meta["course_id"] = metadata.course_id;
    if (metadata.user_id.has_value()) {
        meta["user_id"] = metadata.user_id.value();
    }
    meta["last_updated"] = metadata.last_updated;
    meta["version"] = metadata.version;
    j["metadata"] = meta;

    return j;
}

ConceptEntanglementGraph ConceptEntanglementGraph::from_json(const json& j) {
    int format_version = j.value("format_version", kGraphFormatVersion);
    if (format_version != kGraphFormatVersion) {
        throw std::runtime_error("Unsupported graph snapshot format_version: " +
                                 std::to_string(format_version));
    }

    ConceptEntanglementGraph graph;

    if (j.contains("nodes")) {
        for (const auto& pair : j["nodes"]) {
            auto node = ConceptNode::from_json(pair.at(1));
            graph.nodes[pair.at(0).get<std::string>()] = node;
        }
    }

    if (j.contains("entanglements")) {
        for (const auto& pair : j["entanglements"]) {
            auto e = ConceptEntanglement::from_json(pair.at(1));
            graph.entanglements[pair.at(0).get<std::string>()] = e;
        }
    }

    // Every node owns an entanglement, even in hand-edited snapshots
    for (const auto& [id, node] : graph.nodes) {
        if (graph.entanglements.find(id) == graph.entanglements.end()) {
            graph.entanglements[id] = ConceptEntanglement::initial(id);
        }
    }

    if (j.contains("edges")) {
        for (const auto& edge_json : j["edges"]) {
            graph.edges.push_back(ConceptEdge::from_json(edge_json));
        }
    }

    // The mirror always follows the prerequisite edges
    for (auto& [id, node] : graph.nodes) {
        node.prerequisites.clear();
        node.dependents.clear();
    }
    for (const auto& edge : graph.edges) {
        if (edge.type != ConceptEdgeType::PREREQUISITE) continue;
        auto from = graph.nodes.find(edge.from);
        auto to = graph.nodes.find(edge.to);
        if (from != graph.nodes.end()) insert_unique(from->second.dependents, edge.to);
        if (to != graph.nodes.end()) insert_unique(to->second.prerequisites, edge.from);
    }

    if (j.contains("transfer_patterns")) {
        for (const auto& pattern_json : j["transfer_patterns"]) {
            graph.transfer_patterns.push_back(LearningTransferPattern::from_json(pattern_json));
        }
    }

    if (j.contains("active_repair_paths")) {
        for (const auto& path_json : j["active_repair_paths"]) {
            graph.active_repair_paths.push_back(RepairPath::from_json(path_json));
        }
    }

    if (j.contains("metadata")) {
        const auto& meta = j["metadata"];
        graph.metadata.course_id = meta.value("course_id", "");
        if (meta.contains("user_id") && meta["user_id"].is_string()) {
            graph.metadata.user_id = meta["user_id"].get<std::string>();
        }
        graph.metadata.last_updated = meta.value("last_updated", static_cast<Timestamp>(0));
        graph.metadata.version = meta.value("version", kGraphFormatVersion);
    }

    return graph;
}

// ==========================================
// Graph store operations
// ==========================================

ConceptEntanglementGraph create_empty_graph(
    const std::string& course_id,
    const std::optional<std::string>& user_id,
    Timestamp now
) {
    ConceptEntanglementGraph graph;
    graph.metadata.course_id = course_id;
    graph.metadata.user_id = user_id;
    graph.metadata.last_updated = now;
    graph.metadata.version = kGraphFormatVersion;
    return graph;
}

ConceptEntanglementGraph add_concept_node(
    const ConceptEntanglementGraph& graph,
    const ConceptNode& node,
    Timestamp now
) {
    ConceptEntanglementGraph result = graph;

    ConceptNode stored = node;
    stored.prerequisites.clear();
    stored.dependents.clear();

    // Rebuild the mirror from existing prerequisite edges
    for (const auto& edge : result.edges) {
        if (edge.type != ConceptEdgeType::PREREQUISITE) continue;
        if (edge.to == node.id) insert_unique(stored.prerequisites, edge.from);
        if (edge.from == node.id) insert_unique(stored.dependents, edge.to);
    }

    result.nodes[node.id] = stored;

    if (result.entanglements.find(node.id) == result.entanglements.end()) {
        result.entanglements[node.id] = ConceptEntanglement::initial(node.id);
    }

    result.metadata.last_updated = now;
    return result;
}

ConceptEntanglementGraph add_concept_edge(
    const ConceptEntanglementGraph& graph,
    const ConceptEdge& edge,
    Timestamp now
) {
    ConceptEntanglementGraph result = graph;

    ConceptEdge new_edge = edge;
    new_edge.id = ConceptEdge::make_id(edge.from, edge.to, edge.type);
    new_edge.weight = clamp_finite(edge.weight, 0.0, 1.0);
    new_edge.transfer_coefficient = clamp_finite(edge.transfer_coefficient, 0.0, 1.0);
    new_edge.successful_traversals = std::max(0, edge.successful_traversals);
    new_edge.difficult_traversals = std::max(0, edge.difficult_traversals);

    auto existing = std::find_if(result.edges.begin(), result.edges.end(),
                                 [&](const ConceptEdge& e) { return e.id == new_edge.id; });
    if (existing != result.edges.end()) {
        *existing = new_edge;
    } else {
        result.edges.push_back(new_edge);
    }

    if (new_edge.type == ConceptEdgeType::PREREQUISITE) {
        auto from_it = result.nodes.find(new_edge.from);
        if (from_it != result.nodes.end()) {
            insert_unique(from_it->second.dependents, new_edge.to);
        }
        auto to_it = result.nodes.find(new_edge.to);
        if (to_it != result.nodes.end()) {
            insert_unique(to_it->second.prerequisites, new_edge.from);
        }
    }

    result.metadata.last_updated = now;
    return result;
}

ConceptEntanglementGraph add_concepts(
    const ConceptEntanglementGraph& graph,
    const std::vector<ConceptNode>& nodes,
    const std::vector<ConceptEdge>& edges,
    Timestamp now
) {
    ConceptEntanglementGraph result = graph;
    for (const auto& node : nodes) {
        result = add_concept_node(result, node, now);
    }
    for (const auto& edge : edges) {
        result = add_concept_edge(result, edge, now);
    }
    return result;
}

void save_graph_snapshot(const ConceptEntanglementGraph& graph, const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }

    file << graph.to_json().dump(2);
    file.close();
}

ConceptEntanglementGraph load_graph_snapshot(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for reading: " + filename);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse graph snapshot " + filename + ": " + e.what());
    }
    file.close();

    try {
        return ConceptEntanglementGraph::from_json(j);
    } catch (const json::exception& e) {
        throw std::runtime_error("Malformed graph snapshot " + filename + ": " + e.what());
    }
}

} // namespace cee
