#include "engine/engine_config.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace cee {

using json = nlohmann::json;

namespace {

// Counts are read signed so negative values are rejected instead of wrapping
size_t read_count(const json& j, const char* key) {
    long long value = j[key].get<long long>();
    if (value < 0) {
        throw std::runtime_error(std::string(key) + " must be non-negative, got " +
                                 std::to_string(value));
    }
    return static_cast<size_t>(value);
}

} // namespace

json EngineConfig::to_json() const {
    json j;
    j["root_cause_max_depth"] = root_cause_max_depth;
    j["forward_impact_max_depth"] = forward_impact_max_depth;
    j["keystone_min_dependents"] = keystone_min_dependents;
    j["signal_window"] = signal_window;
    j["verbose"] = verbose;
    return j;
}

EngineConfig EngineConfig::from_json(const json& j) {
    EngineConfig config;

    // "max_depth" sets both traversal bounds
    if (j.contains("max_depth")) {
        config.root_cause_max_depth = j["max_depth"];
        config.forward_impact_max_depth = j["max_depth"];
    }
    if (j.contains("root_cause_max_depth")) config.root_cause_max_depth = j["root_cause_max_depth"];
    if (j.contains("forward_impact_max_depth")) config.forward_impact_max_depth = j["forward_impact_max_depth"];
    if (j.contains("keystone_min_dependents")) config.keystone_min_dependents = read_count(j, "keystone_min_dependents");
    if (j.contains("signal_window")) config.signal_window = read_count(j, "signal_window");
    if (j.contains("verbose")) config.verbose = j["verbose"];

    return config;
}

EngineConfig EngineConfig::from_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in config file " + path + ": " + e.what());
    }

    try {
        return from_json(j);
    } catch (const json::type_error& e) {
        throw std::runtime_error("Invalid value in config file " + path + ": " + e.what());
    }
}

void EngineConfig::to_json_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }
    file << to_json().dump(2);
}

EngineConfig EngineConfig::from_environment() {
    EngineConfig config;

    const char* verbose = std::getenv("CEE_VERBOSE");
    if (verbose) {
        std::string v = verbose;
        config.verbose = (v == "1" || v == "true" || v == "yes");
    }

    const char* max_depth = std::getenv("CEE_MAX_DEPTH");
    if (max_depth) {
        try {
            int depth = std::stoi(max_depth);
            config.root_cause_max_depth = depth;
            config.forward_impact_max_depth = depth;
        } catch (const std::exception&) {
            throw std::runtime_error(std::string("CEE_MAX_DEPTH is not an integer: ") + max_depth);
        }
    }

    return config;
}

bool EngineConfig::validate(std::string& error_message) const {
    if (root_cause_max_depth < 0) {
        error_message = "root_cause_max_depth must be non-negative";
        return false;
    }

    if (forward_impact_max_depth < 0) {
        error_message = "forward_impact_max_depth must be non-negative";
        return false;
    }

    if (keystone_min_dependents < 1) {
        error_message = "keystone_min_dependents must be at least 1";
        return false;
    }

    if (signal_window < 1) {
        error_message = "signal_window must be at least 1";
        return false;
    }

    return true;
}

} // namespace cee
