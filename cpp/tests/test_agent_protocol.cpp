#include <catch2/catch.hpp>

#include <fuzzyasteroids/action.hpp>
#include <fuzzyasteroids/agent_protocol.hpp>
#include <fuzzyasteroids/errors.hpp>
#include <fuzzyasteroids/sim.hpp>

#include <string>

using namespace fa;

namespace {

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

ObservableState sample_observation() {
    ObservableState obs{};
    obs.frame = 12;
    obs.time = 0.2;
    obs.ship.pos = {400.0f, 300.0f};
    obs.ship.heading_deg = 90.0f;
    obs.ship.lives = 2;
    obs.ship.respawning = true;
    obs.ship.can_fire = false;

    AsteroidView a{};
    a.id = 7;
    a.pos = {100.0f, 200.0f};
    a.vel = {3.0f, -4.0f};
    a.size = AsteroidSize::Medium;
    a.radius = 16.0f;
    obs.asteroids.push_back(a);

    BulletView b{};
    b.id = 9;
    b.pos = {1.5f, 2.5f};
    b.vel = {0.0f, 800.0f};
    b.ttl = 0.5f;
    obs.bullets.push_back(b);
    return obs;
}

} // namespace

TEST_CASE("observation messages carry the ship and every entity") {
    const std::string msg = format_observation_message(sample_observation());

    REQUIRE(msg.front() == '{');
    REQUIRE(msg.back() == '}');
    REQUIRE_FALSE(contains(msg, "\n"));
    REQUIRE(contains(msg, "\"type\":\"observation\",\"frame\":12,\"time\":0.2"));
    REQUIRE(contains(msg, "\"map\":{\"width\":800,\"height\":800}"));
    REQUIRE(contains(msg, "\"x\":400,\"y\":300"));
    REQUIRE(contains(msg, "\"heading\":90"));
    REQUIRE(contains(msg, "\"lives\":2,\"alive\":true,\"respawning\":true,\"can_fire\":false"));
    REQUIRE(contains(msg, "{\"id\":7,\"x\":100,\"y\":200,\"vx\":3,\"vy\":-4,\"size\":2,\"radius\":16}"));
    REQUIRE(contains(msg, "{\"id\":9,\"x\":1.5,\"y\":2.5,\"vx\":0,\"vy\":800,\"ttl\":0.5}"));
}

TEST_CASE("observation messages list nothing when the field is empty") {
    const std::string msg = format_observation_message(ObservableState{});
    REQUIRE(contains(msg, "\"asteroids\":[],\"bullets\":[]}"));
}

TEST_CASE("observation messages follow the live simulator state") {
    EnvironmentSettings s{};
    s.prints = false;
    s.scenario.asteroids.push_back({{100.0f, 100.0f}, 0.0f, 0.0f, AsteroidSize::Large});
    s.scenario.asteroids.push_back({{700.0f, 700.0f}, 0.0f, 0.0f, AsteroidSize::Small});
    const Simulator sim(s, 1);

    const std::string msg = format_observation_message(build_observation(sim.state()));
    REQUIRE(contains(msg, "\"frame\":0"));
    REQUIRE(contains(msg, "\"size\":3"));
    REQUIRE(contains(msg, "\"size\":1"));
    REQUIRE(contains(msg, "\"bullets\":[]"));
}

TEST_CASE("hello announces the protocol version") {
    REQUIRE(format_hello_message() == "{\"type\":\"hello\",\"protocol\":1}");
}

TEST_CASE("action replies are parsed field by field") {
    const Action a = parse_action_message("{\"thrust\": 120.5, \"turn_rate\":-30, \"fire\": true}");
    REQUIRE(a.thrust == Approx(120.5f));
    REQUIRE(a.turn_rate == Approx(-30.0f));
    REQUIRE(a.fire);

    REQUIRE_FALSE(parse_action_message("{\"thrust\":0,\"turn_rate\":0,\"fire\":false}").fire);
    REQUIRE_FALSE(parse_action_message("{\"turn_rate\":0,\"thrust\":0}").fire);
    REQUIRE(parse_action_message("{\"thrust\":0,\"turn_rate\":0,\"fire\":1}").fire);
}

TEST_CASE("malformed action replies are rejected") {
    REQUIRE_THROWS_AS(parse_action_message("{\"turn_rate\":10}"), AgentProtocolError);
    REQUIRE_THROWS_AS(parse_action_message("{\"thrust\":\"fast\",\"turn_rate\":0}"), AgentProtocolError);
    REQUIRE_THROWS_AS(parse_action_message("{\"thrust\":1,\"turn_rate\":0,\"fire\":\"yes\"}"), AgentProtocolError);
    REQUIRE_THROWS_AS(parse_action_message(""), AgentProtocolError);
}

TEST_CASE("out-of-range controls reach the simulator unclamped") {
    const Action a = parse_action_message("{\"thrust\":9999,\"turn_rate\":0}");
    REQUIRE(a.thrust == Approx(9999.0f));
    REQUIRE_THROWS_AS(validate_action(a), InvalidAction);
}

TEST_CASE("model names come from the hello reply") {
    REQUIRE(parse_model_name("{\"model\": \"fuzzy-v2\"}") == "fuzzy-v2");
    REQUIRE(parse_model_name("{\"model\":\"\"}") == "unknown");
    REQUIRE(parse_model_name("{\"status\":\"ok\"}") == "unknown");
}

TEST_CASE("line buffer splits stream reads into messages") {
    LineBuffer buf;
    REQUIRE_FALSE(buf.next_line().has_value());

    const std::string first = "{\"a\":1}\n{\"b\"";
    buf.append(first.data(), first.size());
    REQUIRE(buf.next_line() == std::optional<std::string>("{\"a\":1}"));
    REQUIRE_FALSE(buf.next_line().has_value());

    const std::string rest = ":2}\r\n";
    buf.append(rest.data(), rest.size());
    REQUIRE(buf.next_line() == std::optional<std::string>("{\"b\":2}"));
    REQUIRE_FALSE(buf.next_line().has_value());
}

TEST_CASE("line buffer refuses oversized messages") {
    LineBuffer buf(8);
    const std::string chunk = "123456789";
    REQUIRE_THROWS_AS(buf.append(chunk.data(), chunk.size()), AgentProtocolError);
}

TEST_CASE("agent endpoints need a host and a valid port") {
    const auto ok = parse_agent_endpoint("localhost:5555");
    REQUIRE(ok.has_value());
    REQUIRE(ok->host == "localhost");
    REQUIRE(ok->port == 5555);

    const auto v6 = parse_agent_endpoint("::1:9000");
    REQUIRE(v6.has_value());
    REQUIRE(v6->host == "::1");

    REQUIRE_FALSE(parse_agent_endpoint("localhost").has_value());
    REQUIRE_FALSE(parse_agent_endpoint(":5555").has_value());
    REQUIRE_FALSE(parse_agent_endpoint("localhost:").has_value());
    REQUIRE_FALSE(parse_agent_endpoint("localhost:0").has_value());
    REQUIRE_FALSE(parse_agent_endpoint("localhost:65536").has_value());
    REQUIRE_FALSE(parse_agent_endpoint("localhost:12ab").has_value());
    REQUIRE_FALSE(parse_agent_endpoint("localhost:-1").has_value());
}
