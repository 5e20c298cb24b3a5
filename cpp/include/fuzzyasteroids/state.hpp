#pragma once

#include "config.hpp"
#include "stopping_condition.hpp"

#include <cstdint>
#include <vector>

namespace fa {

using EntityId = uint32_t;

struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;
};

// Common state of everything that moves on the play field.
struct Entity {
    EntityId id = 0;
    Vec2 pos{};
    Vec2 vel{};
    float heading_deg = 0.0f;
    float radius = 0.0f;
    bool alive = true;
};

struct Ship : Entity {
    int lives = kDefaultLives;
    float speed = 0.0f;
    float thrust = 0.0f;
    float turn_rate = 0.0f;
    float respawn_timer = 0.0f;
    float fire_cooldown = 0.0f;
    Vec2 spawn_pos{kMapWidth * 0.5f, kMapHeight * 0.5f};
    float spawn_heading_deg = 0.0f;

    bool respawning() const { return respawn_timer > 0.0f; }
    bool can_fire() const { return alive && fire_cooldown <= 0.0f; }
};

struct Asteroid : Entity {
    AsteroidSize size = AsteroidSize::Large;
};

struct Bullet : Entity {
    float ttl = kBulletTtl;
};

struct CrashRecord {
    uint64_t frame = 0;
    double time = 0.0;
    Vec2 pos{};
    int lives_remaining = 0;
    bool fatal = false;
};

struct RuntimeStats {
    int asteroids_destroyed = 0;
    int bullets_fired = 0;
    int bullets_hit = 0;
    int deaths = 0;
    double distance_travelled = 0.0;
};

struct GameState {
    uint64_t seed = 0;
    uint64_t frame = 0;
    double episode_time_s = 0.0;
    float map_width = kMapWidth;
    float map_height = kMapHeight;
    StoppingCondition stopping_condition = StoppingCondition::None;

    Ship ship{};
    std::vector<Asteroid> asteroids;
    std::vector<Bullet> bullets;
    std::vector<CrashRecord> crashes;

    EntityId next_id = 1;
    RuntimeStats stats{};

    EntityId allocate_id() { return next_id++; }
};

} // namespace fa
