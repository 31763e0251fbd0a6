#pragma once

#include "graph/concept_graph.hpp"
#include "scoring/behavior_signal.hpp"
#include <cstddef>
#include <vector>

namespace cee {

// Signals retained per concept
constexpr size_t kDefaultSignalWindow = 50;

// Age at which a signal reaches the decay floor
constexpr Timestamp kSignalDecayWindowMs = 7LL * 24 * 60 * 60 * 1000;

/**
 * @brief Sub-score (0-100) and fixed weight of a single signal
 */
struct SignalScore {
    double score = 50.0;
    double weight = 0.1;
};

struct ComprehensionEstimate {
    double score = 50.0;          // 0-100, rounded to an integer value
    double confidence = 0.0;      // 0-1
};

SignalScore score_signal(const BehaviorSignal& signal);

/**
 * @brief Recency multiplier in [0.3, 1]
 *
 * Falls linearly from 1 at age 0 to 0.3 at seven days, then stays at 0.3.
 */
double signal_time_decay(const BehaviorSignal& signal, Timestamp now);

/**
 * @brief Time credited to a concept by one signal
 */
int64_t signal_time_spent_ms(const BehaviorSignal& signal);

/**
 * @brief Weighted, time-decayed average over a signal history
 *
 * Returns score 50 and confidence 0 for an empty history.
 */
ComprehensionEstimate calculate_concept_comprehension(
    const std::vector<BehaviorSignal>& signals,
    Timestamp now = current_time_ms()
);

/**
 * @brief Decision table deriving an entanglement state
 *
 * Priority: low confidence, cascade override, then score bands.
 */
EntanglementState score_to_entanglement_state(
    double score,
    double confidence,
    int cascade_failures
);

/**
 * @brief Record a signal against a concept and re-derive its state
 *
 * Returns the graph unchanged when the concept has no entanglement entry.
 * Cascade counts are left as they are.
 */
ConceptEntanglementGraph update_concept_entanglement(
    const ConceptEntanglementGraph& graph,
    const ConceptId& concept_id,
    const BehaviorSignal& signal,
    Timestamp now = current_time_ms(),
    size_t signal_window = kDefaultSignalWindow
);

} // namespace cee
