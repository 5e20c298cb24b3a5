#pragma once

#include "config.hpp"
#include "state.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace fa {

struct AsteroidSpec {
    Vec2 pos{};
    float heading_deg = 0.0f;
    float speed = 0.0f;
    AsteroidSize size = AsteroidSize::Large;
};

// Starting layout of an episode. When `asteroids` is empty, `num_asteroids`
// asteroids of `asteroid_size` are placed at random away from the ship.
struct Scenario {
    std::string name = "default";
    float map_width = kMapWidth;
    float map_height = kMapHeight;
    int num_asteroids = kDefaultAsteroidCount;
    AsteroidSize asteroid_size = AsteroidSize::Huge;
    std::vector<AsteroidSpec> asteroids;

    // Upper bound on asteroids the scenario can produce when fully split.
    int max_asteroids() const;
};

struct EnvironmentSettings {
    int frequency = kDefaultFrequency;
    std::optional<double> time_limit;
    int starting_lives = kDefaultLives;
    // nullopt means randomized at episode start.
    std::optional<Vec2> starting_position = Vec2{kMapWidth * 0.5f, kMapHeight * 0.5f};
    std::optional<float> starting_angle = 0.0f;
    bool track_compute_cost = false;
    bool prints = true;
    Scenario scenario{};

    double tick_seconds() const { return 1.0 / static_cast<double>(frequency); }
    double time_at(uint64_t frame) const { return static_cast<double>(frame) / static_cast<double>(frequency); }
};

// Throws ConfigurationError naming the first invalid field.
void validate_settings(const EnvironmentSettings& settings);

// Headless, silent settings for batch evaluation and training.
EnvironmentSettings training_settings(EnvironmentSettings base = {});

// Decimal digits only; signs, blanks and values past 2^64 - 1 are rejected.
std::optional<uint64_t> parse_seed(const std::string& text);

} // namespace fa
