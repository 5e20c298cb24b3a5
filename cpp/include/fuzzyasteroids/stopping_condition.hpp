#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace fa {

// Episode end reason. The integer values are the stable external tags.
enum class StoppingCondition : uint8_t {
    None = 0,
    NoAsteroids = 1,
    NoLives = 2,
    TimeLimitReached = 3
};

constexpr bool is_terminal(StoppingCondition condition) {
    return condition != StoppingCondition::None;
}

int to_tag(StoppingCondition condition);
// Throws std::invalid_argument for an unknown tag.
StoppingCondition stopping_condition_from_tag(int tag);

const char* to_string(StoppingCondition condition);
// Throws std::invalid_argument for an unknown name.
StoppingCondition stopping_condition_from_string(const std::string& name);

// Fixed precedence: no lives, then no asteroids, then the time limit.
StoppingCondition evaluate_stopping_condition(int lives_remaining,
                                              std::size_t asteroids_alive,
                                              double episode_time_s,
                                              std::optional<double> time_limit_s);

} // namespace fa
