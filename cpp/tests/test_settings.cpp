#include <catch2/catch.hpp>

#include <fuzzyasteroids/errors.hpp>
#include <fuzzyasteroids/settings.hpp>
#include <fuzzyasteroids/sim.hpp>

#include <optional>
#include <string>

using namespace fa;

namespace {

std::string failing_field(const EnvironmentSettings& settings) {
    try {
        validate_settings(settings);
    } catch (const ConfigurationError& ex) {
        return ex.field();
    }
    return {};
}

} // namespace

TEST_CASE("default settings are valid") {
    REQUIRE_NOTHROW(validate_settings(EnvironmentSettings{}));
}

TEST_CASE("configuration errors name the offending field") {
    EnvironmentSettings s{};
    s.starting_lives = 0;
    REQUIRE(failing_field(s) == "starting_lives");

    s = EnvironmentSettings{};
    s.frequency = 0;
    REQUIRE(failing_field(s) == "frequency");

    s = EnvironmentSettings{};
    s.time_limit = -1.0;
    REQUIRE(failing_field(s) == "time_limit");

    s = EnvironmentSettings{};
    s.scenario.num_asteroids = 0;
    REQUIRE(failing_field(s) == "scenario.num_asteroids");

    s = EnvironmentSettings{};
    s.scenario.asteroid_size = static_cast<AsteroidSize>(7);
    REQUIRE(failing_field(s) == "scenario.asteroid_size");

    s = EnvironmentSettings{};
    s.starting_position = Vec2{900.0f, 10.0f};
    REQUIRE(failing_field(s) == "starting_position");

    s = EnvironmentSettings{};
    s.scenario.asteroids.push_back({{10.0f, 10.0f}, 0.0f, -5.0f, AsteroidSize::Small});
    REQUIRE(failing_field(s) == "scenario.asteroids[0].speed");
}

TEST_CASE("the simulator refuses invalid settings before starting") {
    EnvironmentSettings s{};
    s.prints = false;
    s.starting_lives = -2;
    REQUIRE_THROWS_AS(Simulator(s, 1), ConfigurationError);
}

TEST_CASE("max_asteroids counts every fragment a scenario can produce") {
    Scenario random_layout{};
    random_layout.num_asteroids = 2;
    random_layout.asteroid_size = AsteroidSize::Large;
    REQUIRE(random_layout.max_asteroids() == 2 * (1 + 3 + 9));

    Scenario explicit_layout{};
    explicit_layout.asteroids.push_back({{10.0f, 10.0f}, 0.0f, 0.0f, AsteroidSize::Small});
    explicit_layout.asteroids.push_back({{20.0f, 10.0f}, 0.0f, 0.0f, AsteroidSize::Huge});
    REQUIRE(explicit_layout.max_asteroids() == 1 + (1 + 3 + 9 + 27));
}

TEST_CASE("training settings are silent and untimed") {
    EnvironmentSettings base{};
    base.track_compute_cost = true;
    base.starting_lives = 5;
    const EnvironmentSettings t = training_settings(base);
    REQUIRE_FALSE(t.prints);
    REQUIRE_FALSE(t.track_compute_cost);
    REQUIRE(t.starting_lives == 5);
}

TEST_CASE("seeds must be plain non-negative integers") {
    REQUIRE(parse_seed("42") == std::optional<uint64_t>(42));
    REQUIRE(parse_seed("0") == std::optional<uint64_t>(0));
    REQUIRE(parse_seed("18446744073709551615") == std::optional<uint64_t>(18446744073709551615ULL));

    REQUIRE_FALSE(parse_seed("-1").has_value());
    REQUIRE_FALSE(parse_seed("+7").has_value());
    REQUIRE_FALSE(parse_seed("").has_value());
    REQUIRE_FALSE(parse_seed(" 7").has_value());
    REQUIRE_FALSE(parse_seed("12abc").has_value());
    REQUIRE_FALSE(parse_seed("18446744073709551616").has_value());
}
