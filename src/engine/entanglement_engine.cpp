#include "engine/entanglement_engine.hpp"
#include <iostream>

namespace cee {

EntanglementEngine::EntanglementEngine(const std::string& course_id,
                                       const std::optional<std::string>& user_id,
                                       const EngineConfig& config)
    : graph_(create_empty_graph(course_id, user_id)), config_(config) {}

EntanglementEngine::EntanglementEngine(ConceptEntanglementGraph graph, const EngineConfig& config)
    : graph_(std::move(graph)), config_(config) {}

void EntanglementEngine::commit(ConceptEntanglementGraph updated) {
    graph_ = std::move(updated);
    if (change_cb_) {
        change_cb_(graph_);
    }
}

// ==========================================
// Graph construction
// ==========================================

void EntanglementEngine::add_concept(const ConceptNode& node) {
    commit(add_concept_node(graph_, node));
}

void EntanglementEngine::add_edge(const ConceptEdge& edge) {
    commit(add_concept_edge(graph_, edge));
}

void EntanglementEngine::bulk_add(const std::vector<ConceptNode>& nodes,
                                  const std::vector<ConceptEdge>& edges) {
    commit(add_concepts(graph_, nodes, edges));

    if (config_.verbose) {
        std::cout << "Added " << nodes.size() << " concepts and " << edges.size()
                  << " edges to course " << graph_.metadata.course_id << "\n";
    }
}

// ==========================================
// Signals
// ==========================================

void EntanglementEngine::record_signal(const ConceptId& concept_id, const BehaviorSignal& signal) {
    if (!graph_.find_entanglement(concept_id)) {
        if (config_.verbose) {
            std::cerr << "Ignoring " << signal_type_to_string(signal.type())
                      << " signal for unknown concept: " << concept_id << "\n";
        }
        return;
    }

    Timestamp now = current_time_ms();
    commit(update_concept_entanglement(graph_, concept_id, signal, now, config_.signal_window));

    if (config_.verbose) {
        const ConceptEntanglement* e = graph_.find_entanglement(concept_id);
        std::cout << "Concept " << concept_id << ": score " << e->comprehension_score
                  << ", confidence " << e->confidence
                  << ", state " << entanglement_state_to_string(e->state) << "\n";
    }
}

size_t EntanglementEngine::record_section_signal(const std::string& section_id,
                                                 const BehaviorSignal& signal) {
    ConceptEntanglementGraph updated = graph_;
    Timestamp now = current_time_ms();
    size_t count = 0;

    for (const auto& id : graph_.sorted_node_ids()) {
        if (graph_.nodes.at(id).section_id != section_id) continue;
        updated = update_concept_entanglement(updated, id, signal, now, config_.signal_window);
        ++count;
    }

    if (count > 0) {
        commit(std::move(updated));
    }

    if (config_.verbose) {
        std::cout << "Section " << section_id << ": signal recorded for "
                  << count << " concept(s)\n";
    }

    return count;
}

// ==========================================
// Analysis
// ==========================================

RootCauseResult EntanglementEngine::find_root_cause(const ConceptId& concept_id) const {
    return cee::find_root_cause(graph_, concept_id, config_.root_cause_max_depth);
}

ForwardImpactResult EntanglementEngine::analyze_forward_impact(const ConceptId& concept_id) const {
    return cee::analyze_forward_impact(graph_, concept_id, config_.forward_impact_max_depth);
}

RepairPath EntanglementEngine::generate_repair_path(const ConceptId& concept_id) const {
    Timestamp now = current_time_ms();
    RootCauseResult diagnosis = cee::find_root_cause(graph_, concept_id,
                                                     config_.root_cause_max_depth, now);
    return cee::generate_repair_path(graph_, concept_id, diagnosis, now);
}

// ==========================================
// Adaptation
// ==========================================

void EntanglementEngine::record_transfer(const ConceptId& from_id, const ConceptId& to_id,
                                         double from_score, double to_score, bool success) {
    commit(cee::record_transfer(graph_, from_id, to_id, from_score, to_score, success));

    if (config_.verbose) {
        const ConceptEdge* edge = graph_.find_edge(from_id, to_id);
        if (edge) {
            std::cout << "Edge " << edge->id << ": weight " << edge->weight
                      << ", transfer " << edge->transfer_coefficient
                      << " after " << edge->total_traversals() << " traversal(s)\n";
        } else {
            std::cerr << "No edge " << from_id << " -> " << to_id
                      << "; only the transfer pattern was recorded\n";
        }
    }
}

// ==========================================
// Queries
// ==========================================

const ConceptEntanglement* EntanglementEngine::get_entanglement(const ConceptId& concept_id) const {
    return graph_.find_entanglement(concept_id);
}

std::vector<StrugglingConcept> EntanglementEngine::struggling_concepts() const {
    return get_struggling_concepts(graph_);
}

std::vector<ConceptNode> EntanglementEngine::keystone_concepts() const {
    return get_keystone_concepts(graph_, config_.keystone_min_dependents);
}

std::vector<ConceptId> EntanglementEngine::critical_path() const {
    return get_critical_path(graph_);
}

GraphHealth EntanglementEngine::graph_health() const {
    return calculate_graph_health(graph_);
}

// ==========================================
// Repair paths
// ==========================================

RepairPath EntanglementEngine::start_repair_path(const ConceptId& target_concept_id) {
    RepairPathStart start = cee::start_repair_path(graph_, target_concept_id,
                                                   config_.root_cause_max_depth);
    commit(std::move(start.graph));

    if (config_.verbose) {
        std::cout << "Started repair path " << start.path.id << " with "
                  << start.path.steps.size() << " step(s), "
                  << start.path.total_estimated_minutes << " min\n";
    }

    return start.path;
}

void EntanglementEngine::complete_repair_step(const std::string& repair_path_id,
                                              const ConceptId& concept_id) {
    commit(cee::complete_repair_step(graph_, repair_path_id, concept_id));
}

void EntanglementEngine::dismiss_repair_path(const std::string& repair_path_id) {
    commit(cee::dismiss_repair_path(graph_, repair_path_id));
}

// ==========================================
// Lifecycle
// ==========================================

void EntanglementEngine::reset() {
    commit(create_empty_graph(graph_.metadata.course_id, graph_.metadata.user_id));
}

void EntanglementEngine::save(const std::string& filename) const {
    save_graph_snapshot(graph_, filename);

    if (config_.verbose) {
        std::cout << "Saved graph (" << graph_.num_nodes() << " concepts) to "
                  << filename << "\n";
    }
}

void EntanglementEngine::load(const std::string& filename) {
    commit(load_graph_snapshot(filename));

    if (config_.verbose) {
        std::cout << "Loaded graph (" << graph_.num_nodes() << " concepts, "
                  << graph_.num_edges() << " edges) from " << filename << "\n";
    }
}

} // namespace cee
