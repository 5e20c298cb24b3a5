#include <catch2/catch.hpp>

#include <fuzzyasteroids/collision.hpp>

using namespace fa;

namespace {

Asteroid asteroid_at(EntityId id, Vec2 pos, float radius = 16.0f) {
    Asteroid a{};
    a.id = id;
    a.pos = pos;
    a.radius = radius;
    return a;
}

Bullet bullet_at(EntityId id, Vec2 pos) {
    Bullet b{};
    b.id = id;
    b.pos = pos;
    b.radius = 2.0f;
    return b;
}

GameState empty_state() {
    GameState s{};
    s.ship.id = 1;
    s.ship.radius = 15.0f;
    s.ship.pos = {700.0f, 700.0f};
    return s;
}

} // namespace

TEST_CASE("circles touching exactly do not collide") {
    REQUIRE_FALSE(circles_overlap({0.0f, 0.0f}, 5.0f, {10.0f, 0.0f}, 5.0f));
    REQUIRE(circles_overlap({0.0f, 0.0f}, 5.0f, {9.9f, 0.0f}, 5.0f));
}

TEST_CASE("same-role pairs never collide") {
    GameState s = empty_state();
    s.asteroids.push_back(asteroid_at(10, {100.0f, 100.0f}));
    s.asteroids.push_back(asteroid_at(11, {101.0f, 100.0f}));
    s.bullets.push_back(bullet_at(20, {300.0f, 300.0f}));
    s.bullets.push_back(bullet_at(21, {300.0f, 300.0f}));

    REQUIRE(detect_collisions(s).empty());
}

TEST_CASE("bullet pairs come before ship pairs and every overlap is reported") {
    GameState s = empty_state();
    s.asteroids.push_back(asteroid_at(10, {700.0f, 720.0f}));
    s.asteroids.push_back(asteroid_at(11, {100.0f, 100.0f}));
    s.bullets.push_back(bullet_at(20, {100.0f, 105.0f}));
    s.bullets.push_back(bullet_at(21, {100.0f, 95.0f}));

    const auto pairs = detect_collisions(s);
    REQUIRE(pairs.size() == 3);
    REQUIRE(pairs[0].kind == CollisionKind::BulletAsteroid);
    REQUIRE(pairs[0].a == 20);
    REQUIRE(pairs[0].b == 11);
    REQUIRE(pairs[1].a == 21);
    REQUIRE(pairs[1].b == 11);
    REQUIRE(pairs[2].kind == CollisionKind::ShipAsteroid);
    REQUIRE(pairs[2].a == 1);
    REQUIRE(pairs[2].b == 10);
}

TEST_CASE("respawning or dead ship is not collidable") {
    GameState s = empty_state();
    s.asteroids.push_back(asteroid_at(10, s.ship.pos));

    s.ship.respawn_timer = 1.0f;
    REQUIRE(detect_collisions(s).empty());

    s.ship.respawn_timer = 0.0f;
    s.ship.alive = false;
    REQUIRE(detect_collisions(s).empty());

    s.ship.alive = true;
    REQUIRE(detect_collisions(s).size() == 1);
}

TEST_CASE("dead entities are skipped") {
    GameState s = empty_state();
    s.asteroids.push_back(asteroid_at(10, {100.0f, 100.0f}));
    s.bullets.push_back(bullet_at(20, {100.0f, 100.0f}));
    s.bullets[0].alive = false;
    REQUIRE(detect_collisions(s).empty());
}
