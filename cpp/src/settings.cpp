#include "fuzzyasteroids/settings.hpp"

#include "fuzzyasteroids/errors.hpp"

#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string>

namespace fa {
namespace {

bool valid_size(AsteroidSize size) {
    const int s = static_cast<int>(size);
    return s >= static_cast<int>(AsteroidSize::Small) && s <= static_cast<int>(AsteroidSize::Huge);
}

int fragments_from(AsteroidSize size) {
    int total = 0;
    int generation = 1;
    for (int s = static_cast<int>(size); s >= static_cast<int>(AsteroidSize::Small); --s) {
        total += generation;
        generation *= kAsteroidSplitCount;
    }
    return total;
}

bool inside_map(Vec2 p, float width, float height) {
    return std::isfinite(p.x) && std::isfinite(p.y) && p.x >= 0.0f && p.x < width && p.y >= 0.0f && p.y < height;
}

void validate_scenario(const Scenario& scenario) {
    if (!(std::isfinite(scenario.map_width) && scenario.map_width > 0.0f)) {
        throw ConfigurationError("scenario.map_width", "must be a positive number");
    }
    if (!(std::isfinite(scenario.map_height) && scenario.map_height > 0.0f)) {
        throw ConfigurationError("scenario.map_height", "must be a positive number");
    }

    if (scenario.asteroids.empty()) {
        if (scenario.num_asteroids < 1) {
            throw ConfigurationError("scenario.num_asteroids", "at least one asteroid is required");
        }
        if (!valid_size(scenario.asteroid_size)) {
            throw ConfigurationError("scenario.asteroid_size", "size class must be 1..4");
        }
        return;
    }

    for (std::size_t i = 0; i < scenario.asteroids.size(); ++i) {
        const AsteroidSpec& spec = scenario.asteroids[i];
        const std::string prefix = "scenario.asteroids[" + std::to_string(i) + "]";
        if (!inside_map(spec.pos, scenario.map_width, scenario.map_height)) {
            throw ConfigurationError(prefix + ".pos", "must lie inside the map");
        }
        if (!std::isfinite(spec.heading_deg)) {
            throw ConfigurationError(prefix + ".heading_deg", "must be finite");
        }
        if (!(std::isfinite(spec.speed) && spec.speed >= 0.0f)) {
            throw ConfigurationError(prefix + ".speed", "must be a non-negative number");
        }
        if (!valid_size(spec.size)) {
            throw ConfigurationError(prefix + ".size", "size class must be 1..4");
        }
    }
}

} // namespace

int Scenario::max_asteroids() const {
    if (asteroids.empty()) return num_asteroids * fragments_from(asteroid_size);
    int total = 0;
    for (const auto& spec : asteroids) total += fragments_from(spec.size);
    return total;
}

void validate_settings(const EnvironmentSettings& settings) {
    if (settings.frequency <= 0) {
        throw ConfigurationError("frequency", "must be a positive tick rate");
    }
    if (settings.time_limit.has_value() && !(std::isfinite(*settings.time_limit) && *settings.time_limit > 0.0)) {
        throw ConfigurationError("time_limit", "must be a positive number of seconds or disabled");
    }
    if (settings.starting_lives < 1) {
        throw ConfigurationError("starting_lives", "must be at least 1");
    }

    validate_scenario(settings.scenario);

    if (settings.starting_position.has_value() &&
        !inside_map(*settings.starting_position, settings.scenario.map_width, settings.scenario.map_height)) {
        throw ConfigurationError("starting_position", "must lie inside the map");
    }
    if (settings.starting_angle.has_value() && !std::isfinite(*settings.starting_angle)) {
        throw ConfigurationError("starting_angle", "must be finite");
    }
}

EnvironmentSettings training_settings(EnvironmentSettings base) {
    base.prints = false;
    base.track_compute_cost = false;
    return base;
}

std::optional<uint64_t> parse_seed(const std::string& text) {
    if (text.empty()) return std::nullopt;
    for (const char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    try {
        return static_cast<uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace fa
