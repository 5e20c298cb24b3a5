#pragma once

#include "state.hpp"

#include <vector>

namespace fa {

enum class CollisionKind : uint8_t {
    BulletAsteroid,
    ShipAsteroid
};

// Entities are referenced by id so resolution never holds a pointer into a
// container that may grow while children are spawned.
struct CollisionPair {
    CollisionKind kind = CollisionKind::BulletAsteroid;
    EntityId a = 0;
    EntityId b = 0;
};

bool circles_overlap(Vec2 a, float ra, Vec2 b, float rb);

// Bullet-asteroid pairs first (bullet order, then asteroid order), then
// ship-asteroid pairs. The ship only takes part while alive and not
// respawning.
std::vector<CollisionPair> detect_collisions(const GameState& state);

} // namespace fa
