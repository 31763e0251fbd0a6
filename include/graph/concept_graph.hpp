#ifndef CONCEPT_GRAPH_HPP
#define CONCEPT_GRAPH_HPP

#include "scoring/behavior_signal.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <nlohmann/json.hpp>

namespace cee {

/**
 * @brief Unique identifier for a concept node
 */
using ConceptId = std::string;

// Snapshot format written by save_graph_snapshot
constexpr int kGraphFormatVersion = 1;

// ==========================================
// Enumerations
// ==========================================

/**
 * @brief How a concept is "entangled" with the learner's comprehension
 *
 * Derived only through score_to_entanglement_state().
 */
enum class EntanglementState {
    MASTERED,
    STABLE,
    UNSTABLE,
    STRUGGLING,
    COLLAPSED,
    UNKNOWN
};

std::string entanglement_state_to_string(EntanglementState state);
EntanglementState string_to_entanglement_state(const std::string& s);

// True for collapsed, struggling and unstable
bool is_problematic(EntanglementState state);

enum class ConceptEdgeType {
    PREREQUISITE,     // Must understand A before B
    REINFORCES,       // Understanding A helps with B
    RELATED,          // Conceptually similar but independent
    BUILDS_UPON       // Extends A with new ideas
};

std::string edge_type_to_string(ConceptEdgeType type);
ConceptEdgeType string_to_edge_type(const std::string& s);

enum class RepairPriority {
    REQUIRED,
    RECOMMENDED,
    OPTIONAL
};

std::string repair_priority_to_string(RepairPriority priority);
RepairPriority string_to_repair_priority(const std::string& s);

enum class RepairActivityType {
    REVIEW,
    QUIZ,
    PRACTICE,
    VIDEO
};

std::string activity_type_to_string(RepairActivityType type);
RepairActivityType string_to_activity_type(const std::string& s);

// ==========================================
// Numeric helpers
// ==========================================

/**
 * @brief Clamp into [lo, hi], mapping NaN to lo
 */
double clamp_finite(double value, double lo, double hi);

/**
 * @brief Current wall-clock time in milliseconds since the epoch
 */
Timestamp current_time_ms();

// ==========================================
// Graph elements
// ==========================================

/**
 * @brief A curriculum unit
 *
 * prerequisites/dependents mirror the prerequisite edges of the graph and are
 * written only by add_concept_node() and add_concept_edge().
 */
struct ConceptNode {
    ConceptId id;
    std::string title;
    std::string description;
    std::string section_id;
    std::string chapter_id;
    std::string course_id;
    int order = 0;                            // Sequence within the section
    double difficulty = 0.0;                  // 0-100
    int xp_reward = 0;
    std::vector<std::string> skills;
    std::vector<ConceptId> prerequisites;     // Ordered set
    std::vector<ConceptId> dependents;        // Ordered set
    std::vector<ConceptId> related;

    nlohmann::json to_json() const;
    static ConceptNode from_json(const nlohmann::json& j);
};

/**
 * @brief A typed, weighted relationship between two concepts
 */
struct ConceptEdge {
    std::string id;                           // edge_<from>_<to>_<type>
    ConceptId from;
    ConceptId to;
    ConceptEdgeType type = ConceptEdgeType::PREREQUISITE;
    double weight = 0.5;                      // [0, 1]
    double transfer_coefficient = 0.7;        // [0, 1]
    int successful_traversals = 0;
    int difficult_traversals = 0;
    std::string label;

    int total_traversals() const { return successful_traversals + difficult_traversals; }

    /**
     * @brief Deterministic edge ID derived from endpoints and type
     */
    static std::string make_id(const ConceptId& from, const ConceptId& to, ConceptEdgeType type);

    nlohmann::json to_json() const;
    static ConceptEdge from_json(const nlohmann::json& j);
};

/**
 * @brief Per-learner mutable state of one concept
 */
struct ConceptEntanglement {
    ConceptId concept_id;
    EntanglementState state = EntanglementState::UNKNOWN;
    double comprehension_score = 50.0;        // 0-100
    double confidence = 0.0;                  // 0-1
    int attempts = 0;
    int64_t time_spent_ms = 0;
    std::vector<BehaviorSignal> signals;      // Most recent window, oldest first
    Timestamp last_interaction = 0;
    int cascade_failures = 0;
    int cascade_successes = 0;

    static ConceptEntanglement initial(const ConceptId& concept_id);

    nlohmann::json to_json() const;
    static ConceptEntanglement from_json(const nlohmann::json& j);
};

struct RepairActivity {
    RepairActivityType type = RepairActivityType::REVIEW;
    std::string description;

    nlohmann::json to_json() const;
    static RepairActivity from_json(const nlohmann::json& j);
};

struct RepairStep {
    ConceptId concept_id;
    std::string reason;
    int estimated_minutes = 0;
    RepairPriority priority = RepairPriority::RECOMMENDED;
    std::vector<RepairActivity> activities;
    bool completed = false;

    nlohmann::json to_json() const;
    static RepairStep from_json(const nlohmann::json& j);
};

/**
 * @brief Ordered remediation plan toward a target concept
 */
struct RepairPath {
    std::string id;
    ConceptId target_concept_id;
    std::vector<RepairStep> steps;
    int total_estimated_minutes = 0;
    double expected_improvement = 0.0;        // 0-40
    Timestamp generated_at = 0;

    bool is_complete() const;

    nlohmann::json to_json() const;
    static RepairPath from_json(const nlohmann::json& j);
};

/**
 * @brief Observed transfer of understanding between two concepts
 *
 * The running moments back the online correlation estimate.
 */
struct LearningTransferPattern {
    std::string id;
    ConceptId from_concept;
    ConceptId to_concept;
    double transfer_rate = 0.0;               // Running mean, [0, 1]
    int sample_size = 0;
    double correlation = 0.0;                 // Pearson r of (from, to) scores
    Timestamp last_updated = 0;

    double mean_from = 0.0;
    double mean_to = 0.0;
    double m2_from = 0.0;
    double m2_to = 0.0;
    double co_moment = 0.0;

    nlohmann::json to_json() const;
    static LearningTransferPattern from_json(const nlohmann::json& j);
};

struct GraphMetadata {
    std::string course_id;
    std::optional<std::string> user_id;
    Timestamp last_updated = 0;
    int version = kGraphFormatVersion;
};

/**
 * @brief Aggregate root threaded through every engine operation
 *
 * Operations take a graph by const reference and return the updated value;
 * the caller decides which value to keep and when to persist it.
 */
struct ConceptEntanglementGraph {
    std::unordered_map<ConceptId, ConceptNode> nodes;
    std::unordered_map<ConceptId, ConceptEntanglement> entanglements;
    std::vector<ConceptEdge> edges;
    std::vector<LearningTransferPattern> transfer_patterns;
    std::vector<RepairPath> active_repair_paths;
    GraphMetadata metadata;

    /**
     * @brief Lookups return nullptr when absent
     */
    const ConceptNode* find_node(const ConceptId& id) const;
    const ConceptEntanglement* find_entanglement(const ConceptId& id) const;

    /**
     * @brief Find the edge from -> to, preferring the prerequisite edge
     */
    const ConceptEdge* find_edge(const ConceptId& from, const ConceptId& to) const;

    /**
     * @brief Node IDs in ascending order, for deterministic iteration
     */
    std::vector<ConceptId> sorted_node_ids() const;

    size_t num_nodes() const { return nodes.size(); }
    size_t num_edges() const { return edges.size(); }

    /**
     * @brief Encode with map fields as [id, value] pairs sorted by id
     */
    nlohmann::json to_json() const;

    /**
     * @brief Decode a snapshot
     * @throws std::runtime_error on an unsupported format_version
     */
    static ConceptEntanglementGraph from_json(const nlohmann::json& j);
};

// ==========================================
// Graph store operations
// ==========================================

ConceptEntanglementGraph create_empty_graph(
    const std::string& course_id,
    const std::optional<std::string>& user_id = std::nullopt,
    Timestamp now = current_time_ms()
);

/**
 * @brief Add or overwrite a concept node
 *
 * Ensures an entanglement entry exists; an existing entry is preserved. The
 * node's prerequisites/dependents are rebuilt from the prerequisite edges
 * already in the graph, so caller-supplied values are ignored.
 */
ConceptEntanglementGraph add_concept_node(
    const ConceptEntanglementGraph& graph,
    const ConceptNode& node,
    Timestamp now = current_time_ms()
);

/**
 * @brief Add an edge (its id field is ignored and derived)
 *
 * Re-adding an edge with the same id replaces it in place. Prerequisite edges
 * are mirrored into the endpoint nodes that exist. No cycle check is made.
 */
ConceptEntanglementGraph add_concept_edge(
    const ConceptEntanglementGraph& graph,
    const ConceptEdge& edge,
    Timestamp now = current_time_ms()
);

/**
 * @brief Add all nodes, then all edges
 */
ConceptEntanglementGraph add_concepts(
    const ConceptEntanglementGraph& graph,
    const std::vector<ConceptNode>& nodes,
    const std::vector<ConceptEdge>& edges,
    Timestamp now = current_time_ms()
);

/**
 * @brief Write a snapshot as pretty-printed JSON
 * @throws std::runtime_error if the file cannot be opened
 */
void save_graph_snapshot(const ConceptEntanglementGraph& graph, const std::string& filename);

/**
 * @brief Read a snapshot written by save_graph_snapshot
 * @throws std::runtime_error if the file cannot be read or parsed
 */
ConceptEntanglementGraph load_graph_snapshot(const std::string& filename);

} // namespace cee

#endif // CONCEPT_GRAPH_HPP
