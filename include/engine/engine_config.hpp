#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace cee {

// ============================================================================
// Engine Configuration
// ============================================================================

/**
 * @brief Tunables for the entanglement engine
 */
struct EngineConfig {
    // Traversal bounds
    int root_cause_max_depth = 5;           ///< Backward search depth
    int forward_impact_max_depth = 5;       ///< Forward propagation depth

    // Queries
    size_t keystone_min_dependents = 3;     ///< Dependents needed to be a keystone

    // Scoring
    size_t signal_window = 50;              ///< Signals retained per concept

    // Output
    bool verbose = false;                   ///< Verbose logging

    nlohmann::json to_json() const;
    static EngineConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load configuration from JSON file
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static EngineConfig from_json_file(const std::string& path);

    /**
     * @brief Save configuration to JSON file
     */
    void to_json_file(const std::string& path) const;

    /**
     * @brief Defaults overridden by CEE_VERBOSE and CEE_MAX_DEPTH
     */
    static EngineConfig from_environment();

    /**
     * @brief Validate configuration
     */
    bool validate(std::string& error_message) const;
};

} // namespace cee
