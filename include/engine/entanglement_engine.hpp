#pragma once

#include "adaptation/edge_adaptation.hpp"
#include "analysis/forward_impact.hpp"
#include "analysis/graph_queries.hpp"
#include "analysis/repair_path.hpp"
#include "analysis/root_cause.hpp"
#include "engine/engine_config.hpp"
#include "graph/concept_graph.hpp"
#include "scoring/comprehension.hpp"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace cee {

// Invoked with the new graph after every mutation
using GraphChangeCallback = std::function<void(const ConceptEntanglementGraph& graph)>;

/**
 * @brief Single-writer owner of one learner's entanglement graph
 *
 * Every mutation replaces the held graph with the value returned by the
 * corresponding pure operation, so calls are applied strictly in order.
 * The engine does no locking; callers sharing it across threads must
 * serialize access themselves.
 */
class EntanglementEngine {
public:
    EntanglementEngine(const std::string& course_id,
                       const std::optional<std::string>& user_id = std::nullopt,
                       const EngineConfig& config = EngineConfig());

    explicit EntanglementEngine(ConceptEntanglementGraph graph,
                                const EngineConfig& config = EngineConfig());

    void set_config(const EngineConfig& config) { config_ = config; }
    const EngineConfig& config() const { return config_; }

    void set_change_callback(GraphChangeCallback cb) { change_cb_ = std::move(cb); }

    const ConceptEntanglementGraph& graph() const { return graph_; }

    // ==========================================
    // Graph construction
    // ==========================================

    void add_concept(const ConceptNode& node);
    void add_edge(const ConceptEdge& edge);
    void bulk_add(const std::vector<ConceptNode>& nodes, const std::vector<ConceptEdge>& edges);

    // ==========================================
    // Signals
    // ==========================================

    void record_signal(const ConceptId& concept_id, const BehaviorSignal& signal);

    /**
     * @brief Record a signal for every concept taught in a section
     * @return Number of concepts updated
     */
    size_t record_section_signal(const std::string& section_id, const BehaviorSignal& signal);

    // ==========================================
    // Analysis
    // ==========================================

    RootCauseResult find_root_cause(const ConceptId& concept_id) const;
    ForwardImpactResult analyze_forward_impact(const ConceptId& concept_id) const;
    RepairPath generate_repair_path(const ConceptId& concept_id) const;

    // ==========================================
    // Adaptation
    // ==========================================

    void record_transfer(const ConceptId& from_id, const ConceptId& to_id,
                         double from_score, double to_score, bool success);

    // ==========================================
    // Queries
    // ==========================================

    const ConceptEntanglement* get_entanglement(const ConceptId& concept_id) const;
    std::vector<StrugglingConcept> struggling_concepts() const;
    std::vector<ConceptNode> keystone_concepts() const;
    std::vector<ConceptId> critical_path() const;
    GraphHealth graph_health() const;

    // ==========================================
    // Repair paths
    // ==========================================

    RepairPath start_repair_path(const ConceptId& target_concept_id);
    void complete_repair_step(const std::string& repair_path_id, const ConceptId& concept_id);
    void dismiss_repair_path(const std::string& repair_path_id);
    const std::vector<RepairPath>& active_repair_paths() const { return graph_.active_repair_paths; }

    // ==========================================
    // Lifecycle
    // ==========================================

    /**
     * @brief Discard all learner state and concepts
     */
    void reset();

    /**
     * @brief Persist / restore the graph snapshot
     * @throws std::runtime_error on I/O or format errors
     */
    void save(const std::string& filename) const;
    void load(const std::string& filename);

private:
    ConceptEntanglementGraph graph_;
    EngineConfig config_;
    GraphChangeCallback change_cb_;

    void commit(ConceptEntanglementGraph updated);
};

} // namespace cee
