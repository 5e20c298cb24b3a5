#include "fuzzyasteroids/physics.hpp"

#include <algorithm>
#include <cmath>

namespace fa {
namespace {

constexpr float kDegToRad = 3.14159265358979f / 180.0f;

float wrap_axis(float v, float extent) {
    float w = std::fmod(v, extent);
    if (w < 0.0f) w += extent;
    // fmod of a tiny negative value can round up to exactly `extent`.
    if (w >= extent) w = 0.0f;
    return w;
}

void integrate(Entity& e, float dt, float width, float height) {
    e.pos.x += e.vel.x * dt;
    e.pos.y += e.vel.y * dt;
    e.pos = wrap_position(e.pos, width, height);
}

} // namespace

Vec2 heading_direction(float heading_deg) {
    const float rad = heading_deg * kDegToRad;
    return {-std::sin(rad), std::cos(rad)};
}

float normalize_heading(float heading_deg) {
    float h = std::fmod(heading_deg, 360.0f);
    if (h > 180.0f) h -= 360.0f;
    if (h <= -180.0f) h += 360.0f;
    return h;
}

Vec2 wrap_position(Vec2 pos, float width, float height) {
    return {wrap_axis(pos.x, width), wrap_axis(pos.y, height)};
}

void advance_ship(Ship& ship, float dt, float width, float height) {
    if (!ship.alive) return;

    ship.respawn_timer = std::max(0.0f, ship.respawn_timer - dt);
    ship.fire_cooldown = std::max(0.0f, ship.fire_cooldown - dt);

    // Drag pulls toward zero and stops the ship outright instead of
    // overshooting.
    const float drag = kShipDrag * dt;
    if (drag >= std::abs(ship.speed)) {
        ship.speed = 0.0f;
    } else {
        ship.speed -= ship.speed > 0.0f ? drag : -drag;
    }

    ship.speed += ship.thrust * dt;
    ship.speed = std::clamp(ship.speed, -kShipMaxSpeed, kShipMaxSpeed);

    ship.heading_deg = normalize_heading(ship.heading_deg + ship.turn_rate * dt);
    const Vec2 dir = heading_direction(ship.heading_deg);
    ship.vel = {dir.x * ship.speed, dir.y * ship.speed};
    integrate(ship, dt, width, height);
}

void advance_asteroid(Asteroid& asteroid, float dt, float width, float height) {
    if (!asteroid.alive) return;
    integrate(asteroid, dt, width, height);
}

void advance_bullet(Bullet& bullet, float dt, float width, float height) {
    if (!bullet.alive) return;
    integrate(bullet, dt, width, height);
    bullet.ttl -= dt;
    if (bullet.ttl <= 0.0f) bullet.alive = false;
}

} // namespace fa
