#include "fuzzyasteroids/score.hpp"

#include "fuzzyasteroids/errors.hpp"

#include <algorithm>
#include <numeric>
#include <sstream>

namespace fa {
namespace {

void summarize(ComputeCost& cost) {
    if (cost.evaluation_times.empty()) return;

    std::vector<double> sorted = cost.evaluation_times;
    std::sort(sorted.begin(), sorted.end());
    const std::size_t n = sorted.size();

    cost.mean = std::accumulate(sorted.begin(), sorted.end(), 0.0) / static_cast<double>(n);
    cost.median = (n % 2 == 1) ? sorted[n / 2] : 0.5 * (sorted[n / 2 - 1] + sorted[n / 2]);
    cost.min = sorted.front();
    cost.max = sorted.back();
}

} // namespace

ScoreRecorder::ScoreRecorder(int max_asteroids, bool track_compute_cost) {
    score_.max_asteroids = max_asteroids;
    if (track_compute_cost) score_.compute_cost = ComputeCost{};
}

void ScoreRecorder::update(const GameState& state) {
    if (finalized_) throw ScoreAlreadyFinalized("score was already finalized; the episode is over");

    score_.frame_count = state.frame;
    score_.episode_time = state.episode_time_s;
    score_.stopping_condition = state.stopping_condition;
    score_.lives_remaining = state.ship.lives;
    score_.asteroids_destroyed = state.stats.asteroids_destroyed;
    score_.bullets_fired = state.stats.bullets_fired;
    score_.bullets_hit = state.stats.bullets_hit;
    score_.accuracy = state.stats.bullets_fired > 0
                          ? static_cast<double>(state.stats.bullets_hit) / static_cast<double>(state.stats.bullets_fired)
                          : 0.0;
    score_.deaths = state.stats.deaths;
    score_.distance_travelled = state.stats.distance_travelled;
    score_.crashes = state.crashes;
}

void ScoreRecorder::record_agent_call(double seconds, int asteroids_alive) {
    if (!score_.compute_cost || finalized_) return;
    ComputeCost& cost = *score_.compute_cost;
    cost.evaluation_times.push_back(seconds);
    cost.asteroid_counts.push_back(asteroids_alive);
    cost.total += seconds;
    cost.calls += 1;
}

const Score& ScoreRecorder::finalize(StoppingCondition condition) {
    if (finalized_) throw ScoreAlreadyFinalized("score was already finalized");
    if (!is_terminal(condition)) throw EpisodeNotFinished("cannot finalize the score while the episode is running");

    score_.stopping_condition = condition;
    if (score_.compute_cost) summarize(*score_.compute_cost);
    finalized_ = true;
    return score_;
}

std::vector<std::pair<std::string, double>> score_scalars(const Score& score) {
    std::vector<std::pair<std::string, double>> out{
        {"frame_count", static_cast<double>(score.frame_count)},
        {"episode_time", score.episode_time},
        {"stopping_condition", static_cast<double>(to_tag(score.stopping_condition))},
        {"lives_remaining", static_cast<double>(score.lives_remaining)},
        {"asteroids_destroyed", static_cast<double>(score.asteroids_destroyed)},
        {"max_asteroids", static_cast<double>(score.max_asteroids)},
        {"bullets_fired", static_cast<double>(score.bullets_fired)},
        {"bullets_hit", static_cast<double>(score.bullets_hit)},
        {"accuracy", score.accuracy},
        {"deaths", static_cast<double>(score.deaths)},
        {"distance_travelled", score.distance_travelled},
        {"crashes", static_cast<double>(score.crashes.size())},
    };

    if (score.compute_cost) {
        const ComputeCost& cost = *score.compute_cost;
        out.emplace_back("compute_cost_total", cost.total);
        out.emplace_back("compute_calls", static_cast<double>(cost.calls));
        out.emplace_back("eval_time_mean", cost.mean);
        out.emplace_back("eval_time_median", cost.median);
        out.emplace_back("eval_time_min", cost.min);
        out.emplace_back("eval_time_max", cost.max);
    }
    return out;
}

std::string format_score(const Score& score) {
    std::ostringstream oss;
    oss.precision(17);
    for (const auto& [key, value] : score_scalars(score)) {
        oss << key << '=' << value << ' ';
    }
    oss << "stop_reason=\"" << to_string(score.stopping_condition) << '"';
    return oss.str();
}

} // namespace fa
