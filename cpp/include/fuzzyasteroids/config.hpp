#pragma once

#include <cstdint>

namespace fa {

constexpr int kDefaultFrequency = 60;
constexpr float kMapWidth = 800.0f;
constexpr float kMapHeight = 800.0f;
constexpr int kDefaultLives = 3;
constexpr int kDefaultAsteroidCount = 3;

constexpr float kShipRadius = 15.0f;
constexpr float kShipMaxThrust = 480.0f;
constexpr float kShipMaxTurnRate = 180.0f;
constexpr float kShipMaxSpeed = 240.0f;
constexpr float kShipDrag = 80.0f;
constexpr float kShipFireInterval = 0.1f;
constexpr float kShipRespawnSeconds = 3.0f;

constexpr float kBulletSpeed = 800.0f;
constexpr float kBulletRadius = 2.0f;
constexpr float kBulletTtl = 1.0f;

constexpr int kAsteroidSplitCount = 3;
constexpr float kAsteroidRadiusPerSize = 8.0f;
constexpr float kAsteroidSafeSpawnDistance = 150.0f;
constexpr int kAsteroidObsCount = 8;

enum class AsteroidSize : uint8_t {
    Small = 1,
    Medium = 2,
    Large = 3,
    Huge = 4
};

constexpr float asteroid_radius(AsteroidSize size) {
    return kAsteroidRadiusPerSize * static_cast<float>(size);
}

constexpr float asteroid_base_speed(AsteroidSize size) {
    switch (size) {
    case AsteroidSize::Small: return 90.0f;
    case AsteroidSize::Medium: return 60.0f;
    case AsteroidSize::Large: return 45.0f;
    case AsteroidSize::Huge: return 30.0f;
    }
    return 0.0f;
}

} // namespace fa
