#include "fuzzyasteroids/agent.hpp"
#include "fuzzyasteroids/agent_protocol.hpp"
#include "fuzzyasteroids/physics.hpp"
#include "fuzzyasteroids/score.hpp"
#include "fuzzyasteroids/settings.hpp"
#include "fuzzyasteroids/sim.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#ifdef FUZZYASTEROIDS_WITH_RAYLIB
#include <raylib.h>
#endif

namespace {

void print_usage() {
    std::cout << "Usage: fuzzy_asteroids [--headless|--rendered] [--seed N] [--time-limit SECONDS (0 = none)]\n"
                 "                       [--lives N] [--asteroids N] [--asteroid-size 1-4] [--frequency HZ]\n"
                 "                       [--track-compute-cost] [--quiet] [--builtin idle|spinner]\n"
                 "                       [--agent HOST:PORT]\n";
}

#ifdef FUZZYASTEROIDS_WITH_RAYLIB
void draw_frame(const fa::Simulator& sim, const std::string& agent_name) {
    const auto& s = sim.state();

    BeginDrawing();
    ClearBackground(BLACK);

    for (const auto& a : s.asteroids) DrawCircleLines(static_cast<int>(a.pos.x), static_cast<int>(s.map_height - a.pos.y), a.radius, GRAY);
    for (const auto& b : s.bullets) DrawCircleV({b.pos.x, s.map_height - b.pos.y}, b.radius, YELLOW);

    if (s.ship.alive) {
        const fa::Vec2 dir = fa::heading_direction(s.ship.heading_deg);
        const Vector2 center{s.ship.pos.x, s.map_height - s.ship.pos.y};
        const Vector2 nose{center.x + dir.x * s.ship.radius, center.y - dir.y * s.ship.radius};
        const Color hull = s.ship.respawning() ? Fade(GREEN, 0.4f) : GREEN;
        DrawCircleLines(static_cast<int>(center.x), static_cast<int>(center.y), s.ship.radius, hull);
        DrawLineV(center, nose, hull);
    }

    const auto& score = sim.score();
    DrawText(TextFormat("Agent: %s", agent_name.c_str()), 10, 10, 16, LIGHTGRAY);
    DrawText(TextFormat("Time: %.1f sec", s.episode_time_s), 10, 30, 16, WHITE);
    DrawText(TextFormat("Lives: %d", s.ship.lives), 10, 50, 16, WHITE);
    DrawText(TextFormat("Score: %d", score.asteroids_destroyed), 10, 70, 16, WHITE);
    DrawText(TextFormat("Accuracy (%%): %d", static_cast<int>(100.0 * score.accuracy)), 10, 90, 16, WHITE);
    DrawText(TextFormat("Asteroid Count: %d", static_cast<int>(s.asteroids.size())), 10, 110, 16, WHITE);

    EndDrawing();
}
#endif

} // namespace

int main(int argc, char** argv) {
#ifdef FUZZYASTEROIDS_WITH_RAYLIB
    bool headless = false;
#endif
    std::uint64_t seed = 1337;
    std::string builtin = "spinner";
    std::optional<fa::AgentEndpoint> agent_endpoint;

    fa::EnvironmentSettings settings{};
    settings.time_limit = 60.0;

    try {
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
#ifndef FUZZYASTEROIDS_WITH_RAYLIB
            if (arg == "--rendered") {
                std::cerr << "Rendered mode is unavailable: built without raylib.\n";
                return 2;
            }
#endif
            if (arg == "--headless") {
#ifdef FUZZYASTEROIDS_WITH_RAYLIB
                headless = true;
#endif
            } else if (arg == "--rendered") {
#ifdef FUZZYASTEROIDS_WITH_RAYLIB
                headless = false;
#endif
            } else if (arg == "--seed" && i + 1 < argc) {
                const auto parsed = fa::parse_seed(argv[++i]);
                if (!parsed.has_value()) {
                    std::cerr << "Invalid --seed value. Expected a non-negative integer\n";
                    return 2;
                }
                seed = *parsed;
            } else if (arg == "--time-limit" && i + 1 < argc) {
                const double limit = std::stod(argv[++i]);
                settings.time_limit = limit == 0.0 ? std::nullopt : std::optional<double>(limit);
            } else if (arg == "--lives" && i + 1 < argc) {
                settings.starting_lives = std::stoi(argv[++i]);
            } else if (arg == "--asteroids" && i + 1 < argc) {
                settings.scenario.num_asteroids = std::stoi(argv[++i]);
            } else if (arg == "--asteroid-size" && i + 1 < argc) {
                settings.scenario.asteroid_size = static_cast<fa::AsteroidSize>(std::stoi(argv[++i]));
            } else if (arg == "--frequency" && i + 1 < argc) {
                settings.frequency = std::stoi(argv[++i]);
            } else if (arg == "--track-compute-cost") {
                settings.track_compute_cost = true;
            } else if (arg == "--quiet") {
                settings.prints = false;
            } else if (arg == "--builtin" && i + 1 < argc) {
                builtin = argv[++i];
            } else if (arg == "--agent" && i + 1 < argc) {
                const auto parsed = fa::parse_agent_endpoint(argv[++i]);
                if (!parsed.has_value()) {
                    std::cerr << "Invalid --agent endpoint. Expected HOST:PORT\n";
                    return 2;
                }
                agent_endpoint = parsed;
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return 0;
            } else {
                std::cerr << "Unknown or incomplete argument: " << arg << '\n';
                print_usage();
                return 2;
            }
        }
    } catch (const std::exception& ex) {
        std::cerr << "Failed to parse CLI arguments: " << ex.what() << '\n';
        return 2;
    }

    std::unique_ptr<fa::Agent> agent;
    if (agent_endpoint.has_value()) {
        try {
            agent = fa::RemoteAgent::connect(*agent_endpoint);
            std::cout << "Connected to agent server at " << agent_endpoint->host << ':' << agent_endpoint->port
                      << " model=" << agent->name() << '\n';
        } catch (const std::exception& ex) {
            std::cerr << "Failed to connect to agent server: " << ex.what() << '\n';
            return 2;
        }
    } else if (builtin == "idle") {
        agent = std::make_unique<fa::IdleAgent>();
    } else if (builtin == "spinner") {
        agent = std::make_unique<fa::SpinnerAgent>();
    } else {
        std::cerr << "Unknown --builtin agent: " << builtin << '\n';
        return 2;
    }

    try {
        fa::Simulator sim(settings, seed);

#ifdef FUZZYASTEROIDS_WITH_RAYLIB
        if (!headless) {
            InitWindow(static_cast<int>(sim.state().map_width), static_cast<int>(sim.state().map_height),
                       "Fuzzy Asteroids");
            SetTargetFPS(settings.frequency);

            while (!WindowShouldClose() && !sim.done()) {
                const fa::Action action = sim.query_agent(*agent);
                sim.step(action);
                draw_frame(sim, agent->name());
            }

            CloseWindow();
            if (!sim.done()) {
                std::cout << "Window closed before the episode finished\n";
                return 0;
            }
            std::cout << "seed=" << seed << ' ' << fa::format_score(sim.finalize()) << '\n';
            return 0;
        }
#endif

        while (!sim.done()) {
            const fa::Action action = sim.query_agent(*agent);
            sim.step(action);
        }
        std::cout << "seed=" << seed << ' ' << fa::format_score(sim.finalize()) << '\n';
    } catch (const std::exception& ex) {
        std::cerr << "Episode failed: " << ex.what() << '\n';
        return 2;
    }
    return 0;
}
