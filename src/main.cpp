#include "cli/cli.hpp"
#include "engine/entanglement_engine.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fs = std::filesystem;

using namespace cee;
using json = nlohmann::json;

// ============== Helper Functions ==============

// Config file if given, otherwise environment; --depth and --verbose win
EngineConfig resolve_config(const Args& args) {
    EngineConfig config = args.has("config")
        ? EngineConfig::from_json_file(args.get("config").value)
        : EngineConfig::from_environment();

    if (args.has("depth")) {
        int depth = args.get("depth").as_int();
        config.root_cause_max_depth = depth;
        config.forward_impact_max_depth = depth;
    }
    if (args.has("verbose")) {
        config.verbose = true;
    }

    std::string error;
    if (!config.validate(error)) {
        throw std::runtime_error("Invalid configuration: " + error);
    }
    return config;
}

EntanglementEngine open_engine(const Args& args) {
    EngineConfig config = resolve_config(args);
    std::string graph_path = args.require("graph");

    if (config.verbose) {
        std::cerr << "Loading graph from: " << graph_path << "\n";
    }
    return EntanglementEngine(load_graph_snapshot(graph_path), config);
}

json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
    return j;
}

std::string require_concept(const EntanglementEngine& engine, const Args& args,
                            const std::string& option) {
    std::string concept_id = args.require(option);
    if (!engine.graph().find_node(concept_id)) {
        throw std::runtime_error("Unknown concept: " + concept_id);
    }
    return concept_id;
}

void print_json(const json& j) {
    std::cout << j.dump(2) << "\n";
}

// ============== cee init ==============
int cmd_init(const Args& args) {
    EngineConfig config = resolve_config(args);
    std::string graph_path = args.require("graph");
    std::string course_id = args.require("course");

    std::optional<std::string> user_id;
    if (args.has("user")) user_id = args.get("user").value;

    if (fs::exists(graph_path) && !args.has("force")) {
        throw std::runtime_error(graph_path + " already exists (use --force to overwrite)");
    }

    EntanglementEngine engine(course_id, user_id, config);

    // Curriculum file: {"nodes": [...], "edges": [...]}
    if (args.has("curriculum")) {
        json curriculum = read_json_file(args.get("curriculum").value);
        std::vector<ConceptNode> nodes;
        std::vector<ConceptEdge> edges;
        for (const auto& n : curriculum.value("nodes", json::array())) {
            nodes.push_back(ConceptNode::from_json(n));
        }
        for (const auto& e : curriculum.value("edges", json::array())) {
            edges.push_back(ConceptEdge::from_json(e));
        }
        engine.bulk_add(nodes, edges);
    }

    engine.save(graph_path);

    json out;
    out["graph"] = graph_path;
    out["course_id"] = course_id;
    out["concepts"] = engine.graph().num_nodes();
    out["edges"] = engine.graph().num_edges();
    print_json(out);
    return 0;
}

// ============== cee stats ==============
int cmd_stats(const Args& args) {
    EntanglementEngine engine = open_engine(args);
    const auto& graph = engine.graph();

    json out;
    out["course_id"] = graph.metadata.course_id;
    out["user_id"] = graph.metadata.user_id ? json(*graph.metadata.user_id) : json(nullptr);
    out["last_updated"] = graph.metadata.last_updated;
    out["concepts"] = graph.num_nodes();
    out["edges"] = graph.num_edges();
    out["transfer_patterns"] = graph.transfer_patterns.size();
    out["active_repair_paths"] = graph.active_repair_paths.size();

    json states = json::object();
    for (const auto& [id, entanglement] : graph.entanglements) {
        std::string key = entanglement_state_to_string(entanglement.state);
        states[key] = states.value(key, 0) + 1;
    }
    out["states"] = states;

    json struggling = json::array();
    for (const auto& s : engine.struggling_concepts()) {
        json entry;
        entry["concept_id"] = s.node.id;
        entry["title"] = s.node.title;
        entry["state"] = entanglement_state_to_string(s.entanglement.state);
        entry["comprehension_score"] = s.entanglement.comprehension_score;
        entry["cascade_failures"] = s.entanglement.cascade_failures;
        struggling.push_back(entry);
    }
    out["struggling"] = struggling;

    json keystones = json::array();
    for (const auto& node : engine.keystone_concepts()) {
        keystones.push_back({{"concept_id", node.id}, {"dependents", node.dependents.size()}});
    }
    out["keystones"] = keystones;

    print_json(out);
    return 0;
}

// ============== cee root-cause ==============
int cmd_root_cause(const Args& args) {
    EntanglementEngine engine = open_engine(args);
    std::string concept_id = require_concept(engine, args, "concept");

    print_json(engine.find_root_cause(concept_id).to_json());
    return 0;
}

// ============== cee impact ==============
int cmd_impact(const Args& args) {
    EntanglementEngine engine = open_engine(args);
    std::string concept_id = require_concept(engine, args, "concept");

    print_json(engine.analyze_forward_impact(concept_id).to_json());
    return 0;
}

// ============== cee repair ==============
int cmd_repair(const Args& args) {
    EntanglementEngine engine = open_engine(args);
    std::string concept_id = require_concept(engine, args, "concept");

    if (!args.has("activate")) {
        print_json(engine.generate_repair_path(concept_id).to_json());
        return 0;
    }

    RepairPath path = engine.start_repair_path(concept_id);
    engine.save(args.require("graph"));
    print_json(path.to_json());
    return 0;
}

// ============== cee health ==============
int cmd_health(const Args& args) {
    EntanglementEngine engine = open_engine(args);
    print_json(engine.graph_health().to_json());
    return 0;
}

// ============== cee critical-path ==============
int cmd_critical_path(const Args& args) {
    EntanglementEngine engine = open_engine(args);
    auto path = engine.critical_path();

    json out;
    out["length"] = path.size();
    out["concepts"] = path;
    print_json(out);
    return 0;
}

// ============== cee signal ==============
int cmd_signal(const Args& args) {
    EntanglementEngine engine = open_engine(args);
    std::string concept_id = require_concept(engine, args, "concept");

    // A single signal object or an array of them, applied in file order
    json input = read_json_file(args.require("file"));
    std::vector<BehaviorSignal> signals;
    try {
        if (input.is_array()) {
            for (const auto& s : input) signals.push_back(BehaviorSignal::from_json(s));
        } else {
            signals.push_back(BehaviorSignal::from_json(input));
        }
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Malformed signal: ") + e.what());
    }

    for (const auto& signal : signals) {
        engine.record_signal(concept_id, signal);
    }
    engine.save(args.require("graph"));

    json out = engine.get_entanglement(concept_id)->to_json();
    out.erase("signals");
    out["signals_recorded"] = signals.size();
    print_json(out);
    return 0;
}

// ============== cee transfer ==============
int cmd_transfer(const Args& args) {
    EntanglementEngine engine = open_engine(args);
    std::string from_id = require_concept(engine, args, "from");
    std::string to_id = require_concept(engine, args, "to");
    bool success = args.get("success").as_bool();

    // Scores default to the current comprehension estimates
    double from_score = args.get("from-score").as_double(
        engine.get_entanglement(from_id)->comprehension_score);
    double to_score = args.get("to-score").as_double(
        engine.get_entanglement(to_id)->comprehension_score);

    engine.record_transfer(from_id, to_id, from_score, to_score, success);
    engine.save(args.require("graph"));

    json out;
    const ConceptEdge* edge = engine.graph().find_edge(from_id, to_id);
    out["edge"] = edge ? edge->to_json() : json(nullptr);
    const LearningTransferPattern* pattern =
        find_transfer_pattern(engine.graph(), from_id, to_id);
    out["pattern"] = pattern ? pattern->to_json() : json(nullptr);
    print_json(out);
    return 0;
}

// ============== Main ==============
int main(int argc, char** argv) {
    CLI cli("cee", "1.0.0", "Concept Entanglement Engine CLI");

    cli.add_common_arg({"graph", "g", "Graph snapshot JSON file", "", true, false});
    cli.add_common_arg({"config", "c", "Engine config JSON file (default: from environment)", "", false, false});
    cli.add_common_arg({"depth", "d", "Override root-cause and forward-impact depth", "", false, false});
    cli.add_common_arg({"verbose", "V", "Log progress to stderr/stdout", "", false, true});

    cli.register_command({
        "init",
        "Create a new graph snapshot, optionally seeded with a curriculum",
        {
            {"course", "C", "Course ID", "", true, false},
            {"user", "u", "Learner ID", "", false, false},
            {"curriculum", "f", "JSON file with \"nodes\" and \"edges\" arrays", "", false, false},
            {"force", "F", "Overwrite an existing snapshot", "", false, true}
        },
        cmd_init
    });

    cli.register_command({
        "stats",
        "Summarize concepts, states, struggling and keystone concepts",
        {},
        cmd_stats
    });

    cli.register_command({
        "root-cause",
        "Trace a struggling concept back to its weakest prerequisites",
        {
            {"concept", "k", "Concept ID", "", true, false}
        },
        cmd_root_cause
    });

    cli.register_command({
        "impact",
        "Predict which dependents are put at risk by a concept",
        {
            {"concept", "k", "Concept ID", "", true, false}
        },
        cmd_impact
    });

    cli.register_command({
        "repair",
        "Generate a repair path toward a concept",
        {
            {"concept", "k", "Concept ID", "", true, false},
            {"activate", "a", "Store the path as active and save the graph", "", false, true}
        },
        cmd_repair
    });

    cli.register_command({
        "health",
        "Score overall graph health with recommendations",
        {},
        cmd_health
    });

    cli.register_command({
        "critical-path",
        "Print the longest prerequisite chain",
        {},
        cmd_critical_path
    });

    cli.register_command({
        "signal",
        "Record behavior signal(s) for a concept and save the graph",
        {
            {"concept", "k", "Concept ID", "", true, false},
            {"file", "f", "JSON file with one signal or an array of signals", "", true, false}
        },
        cmd_signal
    });

    cli.register_command({
        "transfer",
        "Record a learning transfer between two concepts and save the graph",
        {
            {"from", "s", "Source concept ID", "", true, false},
            {"to", "t", "Target concept ID", "", true, false},
            {"success", "x", "Whether the learner succeeded on the target (true/false)", "", true, false},
            {"from-score", "", "Source score (default: current comprehension)", "", false, false},
            {"to-score", "", "Target score (default: current comprehension)", "", false, false}
        },
        cmd_transfer
    });

    return cli.run(argc, argv);
}
