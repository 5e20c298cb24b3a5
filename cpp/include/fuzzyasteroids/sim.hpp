#pragma once

#include "action.hpp"
#include "agent.hpp"
#include "rng.hpp"
#include "score.hpp"
#include "settings.hpp"
#include "state.hpp"

#include <cstdint>
#include <iosfwd>

namespace fa {

class Simulator {
  public:
    explicit Simulator(EnvironmentSettings settings = {}, uint64_t seed = 0);

    void reset(uint64_t seed);
    StoppingCondition step(const Action& action);

    // Asks the agent for this tick's action, timing the call when compute
    // cost tracking is on.
    Action query_agent(Agent& agent);

    const Score& finalize();

    const GameState& state() const { return state_; }
    const EnvironmentSettings& settings() const { return settings_; }
    const Score& score() const { return recorder_.score(); }
    StoppingCondition stopping_condition() const { return state_.stopping_condition; }
    bool done() const { return is_terminal(state_.stopping_condition); }

    // nullptr silences the crash log and game-over banner.
    void set_log_stream(std::ostream* out) { log_ = out; }

  private:
    EnvironmentSettings settings_;
    GameState state_{};
    DeterministicRng rng_{0};
    ScoreRecorder recorder_;
    std::ostream* log_ = nullptr;

    void init_ship();
    void init_asteroids();
    void fire_bullet();
    void advance_entities();
    void resolve_collisions();
    void destroy_asteroid(EntityId id);
    void crash_ship(EntityId asteroid_id);
    void remove_dead_entities();
    void log_game_over();
};

Score run_episode(Agent& agent, const EnvironmentSettings& settings, uint64_t seed = 0);

} // namespace fa
