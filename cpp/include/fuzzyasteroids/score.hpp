#pragma once

#include "state.hpp"
#include "stopping_condition.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fa {

struct ComputeCost {
    double total = 0.0;
    std::size_t calls = 0;
    double mean = 0.0;
    double median = 0.0;
    double min = 0.0;
    double max = 0.0;
    std::vector<double> evaluation_times;
    std::vector<int> asteroid_counts;
};

struct Score {
    uint64_t frame_count = 0;
    double episode_time = 0.0;
    StoppingCondition stopping_condition = StoppingCondition::None;
    int lives_remaining = 0;
    int asteroids_destroyed = 0;
    int max_asteroids = 0;
    int bullets_fired = 0;
    int bullets_hit = 0;
    double accuracy = 0.0;
    int deaths = 0;
    double distance_travelled = 0.0;
    std::vector<CrashRecord> crashes;
    std::optional<ComputeCost> compute_cost;

    std::optional<double> compute_cost_total() const {
        if (!compute_cost) return std::nullopt;
        return compute_cost->total;
    }
};

class ScoreRecorder {
  public:
    ScoreRecorder(int max_asteroids, bool track_compute_cost);

    void update(const GameState& state);
    void record_agent_call(double seconds, int asteroids_alive);

    // Freezes the record. Throws EpisodeNotFinished while `condition` is None
    // and ScoreAlreadyFinalized on a second call.
    const Score& finalize(StoppingCondition condition);

    const Score& score() const { return score_; }
    bool finalized() const { return finalized_; }

  private:
    Score score_{};
    bool finalized_ = false;
};

std::vector<std::pair<std::string, double>> score_scalars(const Score& score);
// Single line of space separated key=value pairs, stable field order.
std::string format_score(const Score& score);

} // namespace fa
