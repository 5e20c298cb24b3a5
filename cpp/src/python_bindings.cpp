#include "fuzzyasteroids/agent.hpp"
#include "fuzzyasteroids/errors.hpp"
#include "fuzzyasteroids/observation.hpp"
#include "fuzzyasteroids/score.hpp"
#include "fuzzyasteroids/settings.hpp"
#include "fuzzyasteroids/sim.hpp"

#include <pybind11/numpy.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstring>
#include <string>
#include <vector>

namespace py = pybind11;

namespace {

py::array_t<float> as_numpy(const std::vector<float>& v) {
    py::array_t<float> arr(v.size());
    std::memcpy(arr.mutable_data(), v.data(), v.size() * sizeof(float));
    return arr;
}

py::tuple as_tuple(fa::Vec2 v) {
    return py::make_tuple(v.x, v.y);
}

py::dict score_to_dict(const fa::Score& score) {
    py::dict out;
    for (const auto& [key, value] : fa::score_scalars(score)) {
        out[py::str(key)] = value;
    }
    out["stop_reason"] = fa::to_string(score.stopping_condition);

    py::list crashes;
    for (const auto& c : score.crashes) {
        py::dict rec;
        rec["frame"] = c.frame;
        rec["time"] = c.time;
        rec["position"] = as_tuple(c.pos);
        rec["lives_remaining"] = c.lives_remaining;
        rec["fatal"] = c.fatal;
        crashes.append(rec);
    }
    out["crash_log"] = crashes;

    if (score.compute_cost) {
        out["evaluation_times"] = score.compute_cost->evaluation_times;
        out["num_asteroids"] = score.compute_cost->asteroid_counts;
    }
    return out;
}

py::dict observable_to_dict(const fa::ObservableState& obs) {
    py::dict ship;
    ship["position"] = as_tuple(obs.ship.pos);
    ship["velocity"] = as_tuple(obs.ship.vel);
    ship["angle"] = obs.ship.heading_deg;
    ship["speed"] = obs.ship.speed;
    ship["lives"] = obs.ship.lives;
    ship["alive"] = obs.ship.alive;
    ship["respawning"] = obs.ship.respawning;
    ship["can_fire"] = obs.ship.can_fire;

    py::list asteroids;
    for (const auto& a : obs.asteroids) {
        py::dict d;
        d["id"] = a.id;
        d["position"] = as_tuple(a.pos);
        d["velocity"] = as_tuple(a.vel);
        d["size"] = static_cast<int>(a.size);
        d["radius"] = a.radius;
        asteroids.append(d);
    }

    py::list bullets;
    for (const auto& b : obs.bullets) {
        py::dict d;
        d["id"] = b.id;
        d["position"] = as_tuple(b.pos);
        d["velocity"] = as_tuple(b.vel);
        d["ttl"] = b.ttl;
        bullets.append(d);
    }

    py::dict out;
    out["frame"] = obs.frame;
    out["time"] = obs.time;
    out["map_dimensions"] = py::make_tuple(obs.map_width, obs.map_height);
    out["ship"] = ship;
    out["asteroids"] = asteroids;
    out["bullets"] = bullets;
    return out;
}

// Lets Python controllers subclass fa::Agent.
class PyAgent : public fa::Agent {
  public:
    using fa::Agent::Agent;

    fa::Action decide(const fa::ObservableState& state) override {
        PYBIND11_OVERRIDE_PURE(fa::Action, fa::Agent, decide, state);
    }

    std::string name() const override {
        PYBIND11_OVERRIDE(std::string, fa::Agent, name);
    }
};

} // namespace

PYBIND11_MODULE(fuzzy_asteroids_core, m) {
    auto& simulation_error = py::register_exception<fa::SimulationError>(m, "SimulationError");
    py::register_exception<fa::ConfigurationError>(m, "ConfigurationError", simulation_error.ptr());
    py::register_exception<fa::InvalidAction>(m, "InvalidAction", simulation_error.ptr());
    py::register_exception<fa::EpisodeAlreadyEnded>(m, "EpisodeAlreadyEnded", simulation_error.ptr());
    py::register_exception<fa::EpisodeNotFinished>(m, "EpisodeNotFinished", simulation_error.ptr());
    py::register_exception<fa::ScoreAlreadyFinalized>(m, "ScoreAlreadyFinalized", simulation_error.ptr());
    py::register_exception<fa::AgentProtocolError>(m, "AgentProtocolError", simulation_error.ptr());

    py::enum_<fa::StoppingCondition>(m, "StoppingCondition")
        .value("none", fa::StoppingCondition::None)
        .value("no_asteroids", fa::StoppingCondition::NoAsteroids)
        .value("no_lives", fa::StoppingCondition::NoLives)
        .value("no_time", fa::StoppingCondition::TimeLimitReached);
    m.def("stopping_condition_from_tag", &fa::stopping_condition_from_tag, py::arg("tag"));
    m.def("stopping_condition_name",
          [](fa::StoppingCondition c) { return std::string(fa::to_string(c)); },
          py::arg("condition"));

    py::enum_<fa::AsteroidSize>(m, "AsteroidSize")
        .value("small", fa::AsteroidSize::Small)
        .value("medium", fa::AsteroidSize::Medium)
        .value("large", fa::AsteroidSize::Large)
        .value("huge", fa::AsteroidSize::Huge);

    py::class_<fa::Vec2>(m, "Vec2")
        .def(py::init<>())
        .def(py::init([](float x, float y) { return fa::Vec2{x, y}; }), py::arg("x"), py::arg("y"))
        .def_readwrite("x", &fa::Vec2::x)
        .def_readwrite("y", &fa::Vec2::y);

    py::class_<fa::Action>(m, "Action")
        .def(py::init<>())
        .def(py::init([](float thrust, float turn_rate, bool fire) { return fa::Action{thrust, turn_rate, fire}; }),
             py::arg("thrust") = 0.0f, py::arg("turn_rate") = 0.0f, py::arg("fire") = false)
        .def_readwrite("thrust", &fa::Action::thrust)
        .def_readwrite("turn_rate", &fa::Action::turn_rate)
        .def_readwrite("fire", &fa::Action::fire);

    py::class_<fa::AsteroidSpec>(m, "AsteroidSpec")
        .def(py::init<>())
        .def_readwrite("position", &fa::AsteroidSpec::pos)
        .def_readwrite("angle", &fa::AsteroidSpec::heading_deg)
        .def_readwrite("speed", &fa::AsteroidSpec::speed)
        .def_readwrite("size", &fa::AsteroidSpec::size);

    py::class_<fa::Scenario>(m, "Scenario")
        .def(py::init<>())
        .def_readwrite("name", &fa::Scenario::name)
        .def_readwrite("map_width", &fa::Scenario::map_width)
        .def_readwrite("map_height", &fa::Scenario::map_height)
        .def_readwrite("num_asteroids", &fa::Scenario::num_asteroids)
        .def_readwrite("asteroid_size", &fa::Scenario::asteroid_size)
        .def_readwrite("asteroids", &fa::Scenario::asteroids)
        .def_property_readonly("max_asteroids", &fa::Scenario::max_asteroids);

    py::class_<fa::EnvironmentSettings>(m, "EnvironmentSettings")
        .def(py::init<>())
        .def_readwrite("frequency", &fa::EnvironmentSettings::frequency)
        .def_readwrite("time_limit", &fa::EnvironmentSettings::time_limit)
        .def_readwrite("starting_lives", &fa::EnvironmentSettings::starting_lives)
        .def_readwrite("starting_position", &fa::EnvironmentSettings::starting_position)
        .def_readwrite("starting_angle", &fa::EnvironmentSettings::starting_angle)
        .def_readwrite("track_compute_cost", &fa::EnvironmentSettings::track_compute_cost)
        .def_readwrite("prints", &fa::EnvironmentSettings::prints)
        .def_readwrite("scenario", &fa::EnvironmentSettings::scenario);
    m.def("training_settings", &fa::training_settings, py::arg("base") = fa::EnvironmentSettings{});

    py::class_<fa::ObservableState>(m, "ObservableState")
        .def_readonly("frame", &fa::ObservableState::frame)
        .def_readonly("time", &fa::ObservableState::time)
        .def("to_dict", &observable_to_dict);

    py::class_<fa::Agent, PyAgent>(m, "Agent")
        .def(py::init<>())
        .def("decide", &fa::Agent::decide, py::arg("state"))
        .def("name", &fa::Agent::name);

    py::class_<fa::Simulator>(m, "Simulator")
        .def(py::init<fa::EnvironmentSettings, std::uint64_t>(), py::arg("settings") = fa::EnvironmentSettings{},
             py::arg("seed") = 0)
        .def("reset", &fa::Simulator::reset, py::arg("seed"))
        .def("step", &fa::Simulator::step, py::arg("action"))
        .def("query_agent", &fa::Simulator::query_agent, py::arg("agent"))
        .def("done", &fa::Simulator::done)
        .def("stopping_condition", &fa::Simulator::stopping_condition)
        .def("observation", [](const fa::Simulator& sim) { return as_numpy(fa::build_observation_vector(sim.state())); })
        .def("observable_state", [](const fa::Simulator& sim) { return observable_to_dict(fa::build_observation(sim.state())); })
        .def("score", [](const fa::Simulator& sim) { return score_to_dict(sim.score()); })
        .def("finalize", [](fa::Simulator& sim) { return score_to_dict(sim.finalize()); })
        .def_static("observation_dim", &fa::observation_dim);

    m.def(
        "run_episode",
        [](fa::Agent& agent, const fa::EnvironmentSettings& settings, std::uint64_t seed) {
            return score_to_dict(fa::run_episode(agent, settings, seed));
        },
        py::arg("agent"), py::arg("settings") = fa::EnvironmentSettings{}, py::arg("seed") = 0);
}
