#include "engine/entanglement_engine.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>

using namespace cee;

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

ConceptNode make_concept(const std::string& id, const std::string& title,
                         const std::string& section, int order) {
    ConceptNode node;
    node.id = id;
    node.title = title;
    node.section_id = section;
    node.chapter_id = "ch-async";
    node.course_id = "js-101";
    node.order = order;
    return node;
}

ConceptEdge prerequisite(const std::string& from, const std::string& to, double weight) {
    ConceptEdge edge;
    edge.from = from;
    edge.to = to;
    edge.type = ConceptEdgeType::PREREQUISITE;
    edge.weight = weight;
    edge.transfer_coefficient = 0.7;
    return edge;
}

int main() {
    print_separator("Concept Entanglement Example - Asynchronous JavaScript");

    EntanglementEngine engine("js-101", std::string("learner-42"));

    int mutations = 0;
    engine.set_change_callback([&mutations](const ConceptEntanglementGraph&) { ++mutations; });

    // Curriculum: closures -> callbacks -> async-await, promises -> async-await
    std::cout << "1. Building the curriculum graph:\n";
    engine.bulk_add(
        {
            make_concept("closures", "Closures", "sec-functions", 1),
            make_concept("callbacks", "Callbacks", "sec-async", 1),
            make_concept("promises", "Promises", "sec-async", 2),
            make_concept("async-await", "Async / Await", "sec-async", 3)
        },
        {
            prerequisite("closures", "callbacks", 0.8),
            prerequisite("callbacks", "promises", 0.8),
            prerequisite("callbacks", "async-await", 0.8),
            prerequisite("promises", "async-await", 0.9)
        }
    );
    std::cout << "   " << engine.graph().num_nodes() << " concepts, "
              << engine.graph().num_edges() << " edges\n";

    // Learner struggles with closures, gets by on callbacks
    std::cout << "\n2. Recording learner behavior:\n";
    Timestamp now = current_time_ms();
    for (int i = 0; i < 3; ++i) {
        engine.record_signal("closures", BehaviorSignal::quiz(now, 1, 5));
        engine.record_signal("callbacks", BehaviorSignal::playground(now, 10, 5, 4));
    }
    engine.record_signal("closures", BehaviorSignal::error_pattern(now, 3));
    size_t watched = engine.record_section_signal("sec-async", BehaviorSignal::video(now, 80.0, 2));
    std::cout << "   Video signal applied to " << watched << " concept(s) in sec-async\n";

    for (const auto& id : engine.graph().sorted_node_ids()) {
        const auto* e = engine.get_entanglement(id);
        std::cout << "   " << std::left << std::setw(14) << id
                  << " score " << std::setw(4) << e->comprehension_score
                  << " confidence " << std::setw(4) << e->confidence
                  << " " << entanglement_state_to_string(e->state) << "\n";
    }

    print_separator("Root Cause Analysis");
    auto diagnosis = engine.find_root_cause("async-await");
    for (const auto& cause : diagnosis.root_causes) {
        std::cout << "  " << cause.concept_id << " (" << severity_to_string(cause.severity)
                  << ", confidence " << std::fixed << std::setprecision(2) << cause.confidence << ")\n";
        for (const auto& line : cause.evidence) {
            std::cout << "    - " << line << "\n";
        }
    }
    std::cout << "  Chain:";
    for (const auto& id : diagnosis.causation_chain) std::cout << " " << id;
    std::cout << "\n";

    print_separator("Forward Impact");
    auto impact = engine.analyze_forward_impact("closures");
    for (const auto& affected : impact.affected_concepts) {
        std::cout << "  " << std::setw(14) << affected.concept_id
                  << impact_level_to_string(affected.impact_level)
                  << "  -" << affected.estimated_score_reduction << " pts"
                  << "  (" << affected.path_length << " hop(s))\n";
    }

    print_separator("Repair Path");
    RepairPath path = engine.start_repair_path("async-await");
    for (const auto& step : path.steps) {
        std::cout << "  [" << repair_priority_to_string(step.priority) << "] "
                  << step.concept_id << " - " << step.estimated_minutes << " min: "
                  << step.reason << "\n";
    }
    std::cout << "  Total: " << path.total_estimated_minutes << " min, expected +"
              << path.expected_improvement << " pts\n";

    // Learner works through the first step and transfers to callbacks
    engine.complete_repair_step(path.id, path.steps.front().concept_id);
    engine.record_transfer("closures", "callbacks", 20, 45, false);

    print_separator("Graph Health");
    auto health = engine.graph_health();
    std::cout << "  Score: " << health.score << "\n";
    for (const auto& rec : health.recommendations) {
        std::cout << "  * " << rec << "\n";
    }

    const std::string output_dir = "output_json";
    std::filesystem::create_directories(output_dir);
    const std::string snapshot = output_dir + "/entanglement_graph.json";
    engine.save(snapshot);

    std::cout << "\nSaved snapshot to " << snapshot << " after " << mutations << " mutations\n";
    return 0;
}
