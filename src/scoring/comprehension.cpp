#include "scoring/comprehension.hpp"
#include <algorithm>
#include <cmath>
#include <type_traits>

namespace cee {

SignalScore score_signal(const BehaviorSignal& signal) {
    return std::visit([](const auto& p) -> SignalScore {
        using T = std::decay_t<decltype(p)>;

        if constexpr (std::is_same_v<T, QuizSignal>) {
            if (p.total_questions <= 0) return {50.0, 0.1};
            double accuracy = static_cast<double>(p.correct_answers) / p.total_questions * 100.0;
            double attempt_penalty = std::max(0, p.attempts_used - 1) * 10.0;
            return {clamp_finite(accuracy - attempt_penalty, 0.0, 100.0), 0.4};
        } else if constexpr (std::is_same_v<T, PlaygroundSignal>) {
            if (p.run_count <= 0) return {50.0, 0.1};
            double success_rate = static_cast<double>(p.successful_runs) / p.run_count * 100.0;
            double error_penalty = static_cast<double>(p.error_count) / p.run_count * 20.0;
            return {clamp_finite(success_rate - error_penalty, 0.0, 100.0), 0.3};
        } else if constexpr (std::is_same_v<T, SectionTimeSignal>) {
            double score = p.completion_percentage;
            score -= std::max(0, p.revisit_count - 2) * 5.0;
            return {clamp_finite(score, 0.0, 100.0), 0.15};
        } else if constexpr (std::is_same_v<T, ErrorPatternSignal>) {
            return {clamp_finite(100.0 - p.repeated_count * 25.0, 0.0, 100.0), 0.1};
        } else if constexpr (std::is_same_v<T, VideoSignal>) {
            double score = p.watched_percentage - std::min(20.0, p.rewind_count * 4.0);
            return {clamp_finite(score, 0.0, 100.0), 0.1};
        } else {
            return {p.is_backward ? 50.0 : 75.0, 0.05};
        }
    }, signal.payload);
}

double signal_time_decay(const BehaviorSignal& signal, Timestamp now) {
    double age = static_cast<double>(now) - static_cast<double>(signal.timestamp);
    double decay = 1.0 - (age / static_cast<double>(kSignalDecayWindowMs)) * 0.7;
    return clamp_finite(decay, 0.3, 1.0);
}

int64_t signal_time_spent_ms(const BehaviorSignal& signal) {
    return std::visit([](const auto& p) -> int64_t {
        using T = std::decay_t<decltype(p)>;

        if constexpr (std::is_same_v<T, QuizSignal> ||
                      std::is_same_v<T, PlaygroundSignal> ||
                      std::is_same_v<T, SectionTimeSignal>) {
            return std::max<int64_t>(0, p.time_spent_ms);
        } else if constexpr (std::is_same_v<T, VideoSignal>) {
            // Assumes a ten minute video
            double watched = clamp_finite(p.watched_percentage, 0.0, 100.0);
            return static_cast<int64_t>(watched / 100.0 * 10 * 60 * 1000);
        } else {
            return 0;
        }
    }, signal.payload);
}

ComprehensionEstimate calculate_concept_comprehension(
    const std::vector<BehaviorSignal>& signals,
    Timestamp now
) {
    ComprehensionEstimate estimate;
    if (signals.empty()) {
        return estimate;
    }

    double weighted_sum = 0.0;
    double total_weight = 0.0;

    for (const auto& signal : signals) {
        SignalScore s = score_signal(signal);
        double decay = signal_time_decay(signal, now);
        weighted_sum += s.score * s.weight * decay;
        total_weight += s.weight * decay;
    }

    double score = total_weight > 0.0 ? weighted_sum / total_weight : 50.0;
    estimate.score = clamp_finite(std::round(score), 0.0, 100.0);
    estimate.confidence = std::min(1.0, static_cast<double>(signals.size()) / 10.0);
    return estimate;
}

EntanglementState score_to_entanglement_state(
    double score,
    double confidence,
    int cascade_failures
) {
    if (!(confidence >= 0.2)) return EntanglementState::UNKNOWN;
    if (cascade_failures >= 3) return EntanglementState::COLLAPSED;
    if (score >= 85) return EntanglementState::MASTERED;
    if (score >= 70) return EntanglementState::STABLE;
    if (score >= 50) return EntanglementState::UNSTABLE;
    if (score >= 30) return EntanglementState::STRUGGLING;
    return EntanglementState::COLLAPSED;
}

ConceptEntanglementGraph update_concept_entanglement(
    const ConceptEntanglementGraph& graph,
    const ConceptId& concept_id,
    const BehaviorSignal& signal,
    Timestamp now,
    size_t signal_window
) {
    auto it = graph.entanglements.find(concept_id);
    if (it == graph.entanglements.end()) {
        return graph;
    }

    ConceptEntanglement updated = it->second;

    // Keep the window ordered by timestamp; equal timestamps stay in arrival order
    auto pos = std::upper_bound(
        updated.signals.begin(), updated.signals.end(), signal.timestamp,
        [](Timestamp ts, const BehaviorSignal& s) { return ts < s.timestamp; }
    );
    updated.signals.insert(pos, signal);

    size_t window = std::max<size_t>(1, signal_window);
    if (updated.signals.size() > window) {
        updated.signals.erase(updated.signals.begin(),
                              updated.signals.end() - static_cast<std::ptrdiff_t>(window));
    }

    ComprehensionEstimate estimate = calculate_concept_comprehension(updated.signals, now);
    updated.comprehension_score = estimate.score;
    updated.confidence = estimate.confidence;
    updated.attempts += 1;
    updated.time_spent_ms += signal_time_spent_ms(signal);
    updated.last_interaction = now;
    updated.state = score_to_entanglement_state(
        estimate.score, estimate.confidence, updated.cascade_failures);

    ConceptEntanglementGraph result = graph;
    result.entanglements[concept_id] = std::move(updated);
    result.metadata.last_updated = now;
    return result;
}

} // namespace cee
