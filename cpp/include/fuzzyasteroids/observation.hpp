#pragma once

#include "config.hpp"
#include "state.hpp"

#include <vector>

namespace fa {

struct ShipView {
    Vec2 pos{};
    Vec2 vel{};
    float heading_deg = 0.0f;
    float speed = 0.0f;
    int lives = 0;
    bool alive = true;
    bool respawning = false;
    bool can_fire = true;
};

struct AsteroidView {
    EntityId id = 0;
    Vec2 pos{};
    Vec2 vel{};
    AsteroidSize size = AsteroidSize::Large;
    float radius = 0.0f;
};

struct BulletView {
    EntityId id = 0;
    Vec2 pos{};
    Vec2 vel{};
    float ttl = 0.0f;
};

// What an agent may see each tick. Bookkeeping such as the RNG, id counter
// and score stays inside the simulator.
struct ObservableState {
    uint64_t frame = 0;
    double time = 0.0;
    float map_width = kMapWidth;
    float map_height = kMapHeight;
    ShipView ship{};
    std::vector<AsteroidView> asteroids;
    std::vector<BulletView> bullets;
};

ObservableState build_observation(const GameState& state);

// Fixed-length encoding for learning code: ship block followed by the
// kAsteroidObsCount nearest asteroids relative to the ship.
std::vector<float> build_observation_vector(const GameState& state);
int observation_dim();

} // namespace fa
