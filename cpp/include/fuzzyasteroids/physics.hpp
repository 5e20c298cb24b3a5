#pragma once

#include "state.hpp"

namespace fa {

Vec2 heading_direction(float heading_deg);
float normalize_heading(float heading_deg);
Vec2 wrap_position(Vec2 pos, float width, float height);

void advance_ship(Ship& ship, float dt, float width, float height);
void advance_asteroid(Asteroid& asteroid, float dt, float width, float height);
void advance_bullet(Bullet& bullet, float dt, float width, float height);

} // namespace fa
