#include "scoring/behavior_signal.hpp"
#include <stdexcept>
#include <type_traits>

namespace cee {

using json = nlohmann::json;

SignalType string_to_signal_type(const std::string& s) {
    if (s == "quiz") return SignalType::QUIZ;
    if (s == "playground") return SignalType::PLAYGROUND;
    if (s == "sectionTime" || s == "section_time") return SignalType::SECTION_TIME;
    if (s == "errorPattern" || s == "error_pattern") return SignalType::ERROR_PATTERN;
    if (s == "video") return SignalType::VIDEO;
    if (s == "navigation") return SignalType::NAVIGATION;
    throw std::invalid_argument("Unknown signal type: " + s);
}

SignalType BehaviorSignal::type() const {
    return std::visit([](const auto& p) -> SignalType {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, QuizSignal>) return SignalType::QUIZ;
        else if constexpr (std::is_same_v<T, PlaygroundSignal>) return SignalType::PLAYGROUND;
        else if constexpr (std::is_same_v<T, SectionTimeSignal>) return SignalType::SECTION_TIME;
        else if constexpr (std::is_same_v<T, ErrorPatternSignal>) return SignalType::ERROR_PATTERN;
        else if constexpr (std::is_same_v<T, VideoSignal>) return SignalType::VIDEO;
        else return SignalType::NAVIGATION;
    }, payload);
}

// ==========================================
// Factories
// ==========================================

BehaviorSignal BehaviorSignal::quiz(Timestamp ts, int correct_answers, int total_questions,
                                    int attempts_used, int64_t time_spent_ms) {
    BehaviorSignal s;
    s.timestamp = ts;
    s.payload = QuizSignal{correct_answers, total_questions, attempts_used, time_spent_ms};
    return s;
}

BehaviorSignal BehaviorSignal::playground(Timestamp ts, int run_count, int successful_runs,
                                          int error_count, int modifications_count,
                                          int64_t time_spent_ms) {
    BehaviorSignal s;
    s.timestamp = ts;
    s.payload = PlaygroundSignal{run_count, successful_runs, error_count,
                                 modifications_count, time_spent_ms};
    return s;
}

BehaviorSignal BehaviorSignal::section_time(Timestamp ts, double completion_percentage,
                                            int revisit_count, int64_t time_spent_ms) {
    BehaviorSignal s;
    s.timestamp = ts;
    s.payload = SectionTimeSignal{completion_percentage, revisit_count, time_spent_ms};
    return s;
}

BehaviorSignal BehaviorSignal::error_pattern(Timestamp ts, int repeated_count) {
    BehaviorSignal s;
    s.timestamp = ts;
    s.payload = ErrorPatternSignal{repeated_count};
    return s;
}

BehaviorSignal BehaviorSignal::video(Timestamp ts, double watched_percentage, int rewind_count) {
    BehaviorSignal s;
    s.timestamp = ts;
    s.payload = VideoSignal{watched_percentage, rewind_count};
    return s;
}

BehaviorSignal BehaviorSignal::navigation(Timestamp ts, bool is_backward) {
    BehaviorSignal s;
    s.timestamp = ts;
    s.payload = NavigationSignal{is_backward};
    return s;
}

// ==========================================
// JSON
// ==========================================

json BehaviorSignal::to_json() const {
    json j;
    j["type"] = signal_type_to_string(type());
    j["timestamp"] = timestamp;
    if (!section_id.empty()) {
        j["section_id"] = section_id;
    }

    std::visit([&j](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, QuizSignal>) {
            j["correct_answers"] = p.correct_answers;
            j["total_questions"] = p.total_questions;
            j["attempts_used"] = p.attempts_used;
            j["time_spent_ms"] = p.time_spent_ms;
        } else if constexpr (std::is_same_v<T, PlaygroundSignal>) {
            j["run_count"] = p.run_count;
            j["successful_runs"] = p.successful_runs;
            j["error_count"] = p.error_count;
            j["modifications_count"] = p.modifications_count;
            j["time_spent_ms"] = p.time_spent_ms;
        } else if constexpr (std::is_same_v<T, SectionTimeSignal>) {
            j["completion_percentage"] = p.completion_percentage;
            j["revisit_count"] = p.revisit_count;
            j["time_spent_ms"] = p.time_spent_ms;
        } else if constexpr (std::is_same_v<T, ErrorPatternSignal>) {
            j["repeated_count"] = p.repeated_count;
        } else if constexpr (std::is_same_v<T, VideoSignal>) {
            j["watched_percentage"] = p.watched_percentage;
            j["rewind_count"] = p.rewind_count;
        } else {
            j["is_backward"] = p.is_backward;
        }
    }, payload);

    return j;
}

BehaviorSignal BehaviorSignal::from_json(const json& j) {
    BehaviorSignal s;
    s.timestamp = j.value("timestamp", static_cast<Timestamp>(0));
    s.section_id = j.value("section_id", "");

    switch (string_to_signal_type(j.at("type").get<std::string>())) {
        case SignalType::QUIZ:
            s.payload = QuizSignal{
                j.value("correct_answers", 0),
                j.value("total_questions", 0),
                j.value("attempts_used", 1),
                j.value("time_spent_ms", static_cast<int64_t>(0))
            };
            break;
        case SignalType::PLAYGROUND:
            s.payload = PlaygroundSignal{
                j.value("run_count", 0),
                j.value("successful_runs", 0),
                j.value("error_count", 0),
                j.value("modifications_count", 0),
                j.value("time_spent_ms", static_cast<int64_t>(0))
            };
            break;
        case SignalType::SECTION_TIME:
            s.payload = SectionTimeSignal{
                j.value("completion_percentage", 0.0),
                j.value("revisit_count", 0),
                j.value("time_spent_ms", static_cast<int64_t>(0))
            };
            break;
        case SignalType::ERROR_PATTERN:
            s.payload = ErrorPatternSignal{j.value("repeated_count", 0)};
            break;
        case SignalType::VIDEO:
            s.payload = VideoSignal{
                j.value("watched_percentage", 0.0),
                j.value("rewind_count", 0)
            };
            break;
        case SignalType::NAVIGATION:
            s.payload = NavigationSignal{j.value("is_backward", false)};
            break;
    }

    return s;
}

} // namespace cee
