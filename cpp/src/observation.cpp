#include "fuzzyasteroids/observation.hpp"

#include "fuzzyasteroids/config.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace fa {
namespace {

constexpr int kShipObsCount = 9;
constexpr int kAsteroidObsWidth = 6;
constexpr float kAsteroidVelScale = 100.0f;
constexpr float kDegToRad = 3.14159265358979f / 180.0f;

float len(Vec2 v) { return std::sqrt(v.x * v.x + v.y * v.y); }

// Shortest displacement on the torus.
float wrapped_delta(float d, float extent) {
    if (d > extent * 0.5f) return d - extent;
    if (d < -extent * 0.5f) return d + extent;
    return d;
}

} // namespace

ObservableState build_observation(const GameState& state) {
    ObservableState obs;
    obs.frame = state.frame;
    obs.time = state.episode_time_s;
    obs.map_width = state.map_width;
    obs.map_height = state.map_height;

    const Ship& s = state.ship;
    obs.ship.pos = s.pos;
    obs.ship.vel = s.vel;
    obs.ship.heading_deg = s.heading_deg;
    obs.ship.speed = s.speed;
    obs.ship.lives = s.lives;
    obs.ship.alive = s.alive;
    obs.ship.respawning = s.respawning();
    obs.ship.can_fire = s.can_fire();

    obs.asteroids.reserve(state.asteroids.size());
    for (const auto& a : state.asteroids) {
        if (!a.alive) continue;
        obs.asteroids.push_back({a.id, a.pos, a.vel, a.size, a.radius});
    }

    obs.bullets.reserve(state.bullets.size());
    for (const auto& b : state.bullets) {
        if (!b.alive) continue;
        obs.bullets.push_back({b.id, b.pos, b.vel, b.ttl});
    }
    return obs;
}

int observation_dim() {
    return kShipObsCount + kAsteroidObsCount * kAsteroidObsWidth;
}

std::vector<float> build_observation_vector(const GameState& state) {
    std::vector<float> obs;
    obs.reserve(static_cast<std::size_t>(observation_dim()));

    const float w = state.map_width;
    const float h = state.map_height;
    const float diag = std::sqrt(w * w + h * h);

    const auto& p = state.ship;
    obs.push_back(p.pos.x / w);
    obs.push_back(p.pos.y / h);
    obs.push_back(p.vel.x / kShipMaxSpeed);
    obs.push_back(p.vel.y / kShipMaxSpeed);
    obs.push_back(std::sin(p.heading_deg * kDegToRad));
    obs.push_back(std::cos(p.heading_deg * kDegToRad));
    obs.push_back(static_cast<float>(p.lives));
    obs.push_back(p.respawning() ? 1.0f : 0.0f);
    obs.push_back(p.can_fire() ? 1.0f : 0.0f);

    std::vector<std::pair<float, const Asteroid*>> nearest;
    nearest.reserve(state.asteroids.size());
    for (const auto& a : state.asteroids) {
        if (!a.alive) continue;
        const float dx = wrapped_delta(a.pos.x - p.pos.x, w);
        const float dy = wrapped_delta(a.pos.y - p.pos.y, h);
        nearest.push_back({dx * dx + dy * dy, &a});
    }
    std::sort(nearest.begin(), nearest.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first < b.first;
        return a.second->id < b.second->id;
    });

    for (int i = 0; i < kAsteroidObsCount; ++i) {
        if (i < static_cast<int>(nearest.size())) {
            const Asteroid& a = *nearest[i].second;
            const Vec2 rel{wrapped_delta(a.pos.x - p.pos.x, w), wrapped_delta(a.pos.y - p.pos.y, h)};
            obs.push_back(rel.x / w);
            obs.push_back(rel.y / h);
            obs.push_back(len(rel) / diag);
            obs.push_back(a.vel.x / kAsteroidVelScale);
            obs.push_back(a.vel.y / kAsteroidVelScale);
            obs.push_back(static_cast<float>(a.size) / static_cast<float>(AsteroidSize::Huge));
        } else {
            obs.insert(obs.end(), {0.0f, 0.0f, 1.0f, 0.0f, 0.0f, 0.0f});
        }
    }

    return obs;
}

} // namespace fa
