#include "fuzzyasteroids/sim.hpp"
#include "fuzzyasteroids/collision.hpp"
#include "fuzzyasteroids/config.hpp"
#include "fuzzyasteroids/errors.hpp"
#include "fuzzyasteroids/observation.hpp"
#include "fuzzyasteroids/physics.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>

namespace fa {
namespace {

constexpr int kSpawnPlacementAttempts = 64;

EnvironmentSettings checked(EnvironmentSettings settings) {
    validate_settings(settings);
    return settings;
}

template <typename T>
T* find_entity(std::vector<T>& entities, EntityId id) {
    for (auto& e : entities) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

float wrapped_distance(Vec2 a, Vec2 b, float width, float height) {
    float dx = std::abs(a.x - b.x);
    float dy = std::abs(a.y - b.y);
    dx = std::min(dx, width - dx);
    dy = std::min(dy, height - dy);
    return std::sqrt(dx * dx + dy * dy);
}

Asteroid make_asteroid(EntityId id, Vec2 pos, float heading_deg, float speed, AsteroidSize size) {
    Asteroid a{};
    a.id = id;
    a.pos = pos;
    a.heading_deg = normalize_heading(heading_deg);
    const Vec2 dir = heading_direction(a.heading_deg);
    a.vel = {dir.x * speed, dir.y * speed};
    a.radius = asteroid_radius(size);
    a.size = size;
    return a;
}

} // namespace

Simulator::Simulator(EnvironmentSettings settings, uint64_t seed)
    : settings_(checked(std::move(settings))),
      recorder_(settings_.scenario.max_asteroids(), settings_.track_compute_cost),
      log_(settings_.prints ? &std::cout : nullptr) {
    reset(seed);
}

void Simulator::reset(uint64_t seed) {
    state_ = GameState{};
    state_.seed = seed;
    state_.map_width = settings_.scenario.map_width;
    state_.map_height = settings_.scenario.map_height;
    rng_.reseed(seed);
    recorder_ = ScoreRecorder(settings_.scenario.max_asteroids(), settings_.track_compute_cost);
    init_ship();
    init_asteroids();
    recorder_.update(state_);
}

void Simulator::init_ship() {
    Ship& ship = state_.ship;
    ship.id = state_.allocate_id();
    ship.radius = kShipRadius;
    ship.lives = settings_.starting_lives;

    if (settings_.starting_position.has_value()) {
        ship.spawn_pos = *settings_.starting_position;
    } else {
        const float x = rng_.uniform(0.0f, state_.map_width);
        const float y = rng_.uniform(0.0f, state_.map_height);
        ship.spawn_pos = wrap_position({x, y}, state_.map_width, state_.map_height);
    }
    ship.spawn_heading_deg = normalize_heading(settings_.starting_angle.has_value() ? *settings_.starting_angle
                                                                                    : rng_.heading());
    ship.pos = ship.spawn_pos;
    ship.heading_deg = ship.spawn_heading_deg;
}

void Simulator::init_asteroids() {
    const Scenario& scenario = settings_.scenario;

    if (!scenario.asteroids.empty()) {
        for (const auto& spec : scenario.asteroids) {
            state_.asteroids.push_back(
                make_asteroid(state_.allocate_id(), spec.pos, spec.heading_deg, spec.speed, spec.size));
        }
        return;
    }

    for (int i = 0; i < scenario.num_asteroids; ++i) {
        Vec2 pos{};
        for (int attempt = 0; attempt < kSpawnPlacementAttempts; ++attempt) {
            pos = wrap_position({rng_.uniform(0.0f, state_.map_width), rng_.uniform(0.0f, state_.map_height)},
                                state_.map_width, state_.map_height);
            if (wrapped_distance(pos, state_.ship.pos, state_.map_width, state_.map_height) >
                kAsteroidSafeSpawnDistance) {
                break;
            }
        }
        const float heading = rng_.heading();
        state_.asteroids.push_back(make_asteroid(state_.allocate_id(), pos, heading,
                                                 asteroid_base_speed(scenario.asteroid_size), scenario.asteroid_size));
    }
}

Action Simulator::query_agent(Agent& agent) {
    if (done()) {
        throw EpisodeAlreadyEnded(std::string("episode already ended (") + to_string(state_.stopping_condition) + ")");
    }

    const ObservableState obs = build_observation(state_);
    if (!settings_.track_compute_cost) return agent.decide(obs);

    const auto t0 = std::chrono::steady_clock::now();
    const Action action = agent.decide(obs);
    const auto t1 = std::chrono::steady_clock::now();
    recorder_.record_agent_call(std::chrono::duration<double>(t1 - t0).count(),
                                static_cast<int>(state_.asteroids.size()));
    return action;
}

void Simulator::fire_bullet() {
    Ship& ship = state_.ship;
    if (!ship.can_fire()) return;

    Bullet b{};
    b.id = state_.allocate_id();
    b.pos = ship.pos;
    b.heading_deg = ship.heading_deg;
    const Vec2 dir = heading_direction(ship.heading_deg);
    b.vel = {dir.x * kBulletSpeed, dir.y * kBulletSpeed};
    b.radius = kBulletRadius;
    b.ttl = kBulletTtl;
    state_.bullets.push_back(b);

    ship.fire_cooldown = kShipFireInterval;
    // Shooting gives up the post-respawn grace period.
    ship.respawn_timer = 0.0f;
    state_.stats.bullets_fired += 1;
}

void Simulator::advance_entities() {
    const float dt = static_cast<float>(settings_.tick_seconds());
    const float w = state_.map_width;
    const float h = state_.map_height;

    Ship& ship = state_.ship;
    advance_ship(ship, dt, w, h);
    if (ship.alive) state_.stats.distance_travelled += std::abs(ship.speed) * dt;

    for (auto& a : state_.asteroids) advance_asteroid(a, dt, w, h);
    for (auto& b : state_.bullets) advance_bullet(b, dt, w, h);
}

void Simulator::destroy_asteroid(EntityId id) {
    Asteroid* target = find_entity(state_.asteroids, id);
    if (target == nullptr || !target->alive) return;

    target->alive = false;
    state_.stats.asteroids_destroyed += 1;

    const Vec2 origin = target->pos;
    const AsteroidSize size = target->size;
    if (size == AsteroidSize::Small) return;

    // `target` may dangle once children are appended.
    const auto child = static_cast<AsteroidSize>(static_cast<int>(size) - 1);
    for (int i = 0; i < kAsteroidSplitCount; ++i) {
        const float heading = rng_.heading();
        state_.asteroids.push_back(
            make_asteroid(state_.allocate_id(), origin, heading, asteroid_base_speed(child), child));
    }
}

void Simulator::crash_ship(EntityId asteroid_id) {
    Ship& ship = state_.ship;

    CrashRecord rec{};
    rec.frame = state_.frame + 1;
    rec.time = settings_.time_at(rec.frame);
    rec.pos = ship.pos;

    ship.lives = std::max(0, ship.lives - 1);
    state_.stats.deaths += 1;
    rec.lives_remaining = ship.lives;
    rec.fatal = ship.lives == 0;
    state_.crashes.push_back(rec);

    if (log_ != nullptr) {
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(3) << "Crashed at (" << rec.pos.x << ", " << rec.pos.y
            << "), t=" << rec.time << " seconds";
        if (rec.fatal) oss << " (final)";
        *log_ << oss.str() << '\n';
    }

    // The last crash leaves the asteroid in play.
    if (ship.lives > 0) destroy_asteroid(asteroid_id);

    ship.speed = 0.0f;
    ship.vel = {0.0f, 0.0f};
    ship.thrust = 0.0f;
    ship.turn_rate = 0.0f;
    if (ship.lives > 0) {
        ship.pos = ship.spawn_pos;
        ship.heading_deg = ship.spawn_heading_deg;
        ship.respawn_timer = kShipRespawnSeconds;
    } else {
        ship.alive = false;
    }
}

void Simulator::resolve_collisions() {
    const std::vector<CollisionPair> pairs = detect_collisions(state_);

    for (const auto& pair : pairs) {
        switch (pair.kind) {
        case CollisionKind::BulletAsteroid: {
            Bullet* b = find_entity(state_.bullets, pair.a);
            const Asteroid* a = find_entity(state_.asteroids, pair.b);
            if (b == nullptr || a == nullptr || !b->alive || !a->alive) break;
            b->alive = false;
            state_.stats.bullets_hit += 1;
            destroy_asteroid(pair.b);
            break;
        }
        case CollisionKind::ShipAsteroid: {
            const Ship& ship = state_.ship;
            const Asteroid* a = find_entity(state_.asteroids, pair.b);
            // A respawned or dead ship sits out the rest of the tick.
            if (!ship.alive || ship.respawning() || a == nullptr || !a->alive) break;
            crash_ship(pair.b);
            break;
        }
        }
    }
}

void Simulator::remove_dead_entities() {
    state_.asteroids.erase(std::remove_if(state_.asteroids.begin(), state_.asteroids.end(),
                                          [](const Asteroid& a) { return !a.alive; }),
                           state_.asteroids.end());
    state_.bullets.erase(
        std::remove_if(state_.bullets.begin(), state_.bullets.end(), [](const Bullet& b) { return !b.alive; }),
        state_.bullets.end());
}

StoppingCondition Simulator::step(const Action& action) {
    if (done()) {
        throw EpisodeAlreadyEnded(std::string("episode already ended (") + to_string(state_.stopping_condition) + ")");
    }
    validate_action(action);

    Ship& ship = state_.ship;
    if (ship.alive) {
        ship.thrust = action.thrust;
        ship.turn_rate = action.turn_rate;
        if (action.fire) fire_bullet();
    }

    advance_entities();
    resolve_collisions();
    remove_dead_entities();

    state_.frame += 1;
    state_.episode_time_s = settings_.time_at(state_.frame);

    state_.stopping_condition = evaluate_stopping_condition(state_.ship.lives, state_.asteroids.size(),
                                                            state_.episode_time_s, settings_.time_limit);
    recorder_.update(state_);

    if (done()) log_game_over();
    return state_.stopping_condition;
}

const Score& Simulator::finalize() {
    return recorder_.finalize(state_.stopping_condition);
}

void Simulator::log_game_over() {
    if (log_ == nullptr) return;
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);
    oss << "**********************************************************\n"
        << "Scenario: " << settings_.scenario.name << '\n'
        << "Game over at " << state_.episode_time_s << " seconds | (" << to_string(state_.stopping_condition) << ")\n"
        << "**********************************************************\n";
    *log_ << oss.str();
}

Score run_episode(Agent& agent, const EnvironmentSettings& settings, uint64_t seed) {
    Simulator sim(settings, seed);
    while (!sim.done()) {
        const Action action = sim.query_agent(agent);
        sim.step(action);
    }
    return sim.finalize();
}

} // namespace fa
