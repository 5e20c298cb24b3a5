#include "fuzzyasteroids/collision.hpp"

namespace fa {

namespace {

float sqr(float v) { return v * v; }

} // namespace

bool circles_overlap(Vec2 a, float ra, Vec2 b, float rb) {
    const float dx = b.x - a.x;
    const float dy = b.y - a.y;
    return (dx * dx + dy * dy) < sqr(ra + rb);
}

std::vector<CollisionPair> detect_collisions(const GameState& state) {
    std::vector<CollisionPair> pairs;

    for (const auto& b : state.bullets) {
        if (!b.alive) continue;
        for (const auto& a : state.asteroids) {
            if (!a.alive) continue;
            if (circles_overlap(b.pos, b.radius, a.pos, a.radius)) {
                pairs.push_back({CollisionKind::BulletAsteroid, b.id, a.id});
            }
        }
    }

    const Ship& ship = state.ship;
    if (ship.alive && !ship.respawning()) {
        for (const auto& a : state.asteroids) {
            if (!a.alive) continue;
            if (circles_overlap(ship.pos, ship.radius, a.pos, a.radius)) {
                pairs.push_back({CollisionKind::ShipAsteroid, ship.id, a.id});
            }
        }
    }

    return pairs;
}

} // namespace fa
