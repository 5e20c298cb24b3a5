#include "fuzzyasteroids/stopping_condition.hpp"

#include <stdexcept>

namespace fa {

int to_tag(StoppingCondition condition) {
    return static_cast<int>(condition);
}

StoppingCondition stopping_condition_from_tag(int tag) {
    switch (tag) {
    case 0: return StoppingCondition::None;
    case 1: return StoppingCondition::NoAsteroids;
    case 2: return StoppingCondition::NoLives;
    case 3: return StoppingCondition::TimeLimitReached;
    default: break;
    }
    throw std::invalid_argument("unknown stopping condition tag: " + std::to_string(tag));
}

const char* to_string(StoppingCondition condition) {
    switch (condition) {
    case StoppingCondition::None: return "None";
    case StoppingCondition::NoAsteroids: return "No Asteroids";
    case StoppingCondition::NoLives: return "No Lives";
    case StoppingCondition::TimeLimitReached: return "No Time";
    }
    return "None";
}

StoppingCondition stopping_condition_from_string(const std::string& name) {
    for (int tag = 0; tag <= 3; ++tag) {
        const StoppingCondition candidate = stopping_condition_from_tag(tag);
        if (name == to_string(candidate)) return candidate;
    }
    throw std::invalid_argument("unknown stopping condition: '" + name + "'");
}

StoppingCondition evaluate_stopping_condition(int lives_remaining,
                                              std::size_t asteroids_alive,
                                              double episode_time_s,
                                              std::optional<double> time_limit_s) {
    if (lives_remaining <= 0) return StoppingCondition::NoLives;
    if (asteroids_alive == 0) return StoppingCondition::NoAsteroids;
    if (time_limit_s.has_value() && episode_time_s >= *time_limit_s) return StoppingCondition::TimeLimitReached;
    return StoppingCondition::None;
}

} // namespace fa
