#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <variant>

namespace cee {

// Milliseconds since the Unix epoch
using Timestamp = int64_t;

// Behavior signal kinds
enum class SignalType {
    QUIZ,
    PLAYGROUND,
    SECTION_TIME,
    ERROR_PATTERN,
    VIDEO,
    NAVIGATION
};

inline std::string signal_type_to_string(SignalType type) {
    switch (type) {
        case SignalType::QUIZ: return "quiz";
        case SignalType::PLAYGROUND: return "playground";
        case SignalType::SECTION_TIME: return "sectionTime";
        case SignalType::ERROR_PATTERN: return "errorPattern";
        case SignalType::VIDEO: return "video";
        case SignalType::NAVIGATION: return "navigation";
        default: return "unknown";
    }
}

/**
 * @brief Parse a signal type name
 * @throws std::invalid_argument for names outside the closed set
 */
SignalType string_to_signal_type(const std::string& s);

struct QuizSignal {
    int correct_answers = 0;
    int total_questions = 0;
    int attempts_used = 1;
    int64_t time_spent_ms = 0;
};

struct PlaygroundSignal {
    int run_count = 0;
    int successful_runs = 0;
    int error_count = 0;
    int modifications_count = 0;
    int64_t time_spent_ms = 0;
};

struct SectionTimeSignal {
    double completion_percentage = 0.0;    // 0-100
    int revisit_count = 0;
    int64_t time_spent_ms = 0;
};

struct ErrorPatternSignal {
    int repeated_count = 0;
};

struct VideoSignal {
    double watched_percentage = 0.0;       // 0-100
    int rewind_count = 0;
};

struct NavigationSignal {
    bool is_backward = false;
};

/**
 * @brief A timestamped observation of learner behavior
 *
 * Signals are immutable once recorded. The payload is one of a closed set of
 * six variants; scoring dispatches on the active alternative.
 */
struct BehaviorSignal {
    using Payload = std::variant<
        QuizSignal,
        PlaygroundSignal,
        SectionTimeSignal,
        ErrorPatternSignal,
        VideoSignal,
        NavigationSignal
    >;

    Timestamp timestamp = 0;
    std::string section_id;                // Optional instrumentation context
    Payload payload;

    SignalType type() const;

    template <typename T>
    const T* get() const { return std::get_if<T>(&payload); }

    static BehaviorSignal quiz(Timestamp ts, int correct_answers, int total_questions,
                               int attempts_used = 1, int64_t time_spent_ms = 0);
    static BehaviorSignal playground(Timestamp ts, int run_count, int successful_runs,
                                     int error_count, int modifications_count = 0,
                                     int64_t time_spent_ms = 0);
    static BehaviorSignal section_time(Timestamp ts, double completion_percentage,
                                       int revisit_count, int64_t time_spent_ms = 0);
    static BehaviorSignal error_pattern(Timestamp ts, int repeated_count);
    static BehaviorSignal video(Timestamp ts, double watched_percentage, int rewind_count);
    static BehaviorSignal navigation(Timestamp ts, bool is_backward);

    nlohmann::json to_json() const;

    /**
     * @brief Decode a signal
     * @throws std::invalid_argument on an unknown "type"
     */
    static BehaviorSignal from_json(const nlohmann::json& j);
};

} // namespace cee
