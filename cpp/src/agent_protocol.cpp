#include "fuzzyasteroids/agent_protocol.hpp"

#include "fuzzyasteroids/errors.hpp"

#include <array>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <stdexcept>

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace fa {
namespace {

std::size_t skip_blanks(const std::string& json, std::size_t pos) {
    while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos]))) ++pos;
    return pos;
}

// Offset of the value stored under `key`, or npos. Flat objects only.
std::size_t find_value(const std::string& json, const char* key) {
    const std::string quoted = std::string("\"") + key + "\"";
    const std::size_t at = json.find(quoted);
    if (at == std::string::npos) return std::string::npos;
    const std::size_t colon = skip_blanks(json, at + quoted.size());
    if (colon >= json.size() || json[colon] != ':') return std::string::npos;
    return skip_blanks(json, colon + 1);
}

double number_at(const std::string& json, std::size_t pos, const char* key) {
    const char* begin = json.c_str() + pos;
    char* end = nullptr;
    const double value = std::strtod(begin, &end);
    if (end == begin) {
        throw AgentProtocolError(std::string("agent field '") + key + "' is not a number");
    }
    return value;
}

float required_number(const std::string& json, const char* key) {
    const std::size_t pos = find_value(json, key);
    if (pos == std::string::npos) {
        throw AgentProtocolError(std::string("agent reply is missing '") + key + "'");
    }
    return static_cast<float>(number_at(json, pos, key));
}

bool optional_flag(const std::string& json, const char* key) {
    const std::size_t pos = find_value(json, key);
    if (pos == std::string::npos) return false;
    if (json.compare(pos, 4, "true") == 0) return true;
    if (json.compare(pos, 5, "false") == 0) return false;
    return number_at(json, pos, key) > 0.5;
}

void put_number(std::ostream& out, double value) {
    out << (std::isfinite(value) ? value : 0.0);
}

void put_motion(std::ostream& out, const Vec2& pos, const Vec2& vel) {
    out << "\"x\":";
    put_number(out, pos.x);
    out << ",\"y\":";
    put_number(out, pos.y);
    out << ",\"vx\":";
    put_number(out, vel.x);
    out << ",\"vy\":";
    put_number(out, vel.y);
}

} // namespace

std::optional<AgentEndpoint> parse_agent_endpoint(const std::string& text) {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) return std::nullopt;

    const std::string port_text = text.substr(colon + 1);
    if (port_text.size() > 5) return std::nullopt;
    unsigned long port = 0;
    for (const char c : port_text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        port = port * 10 + static_cast<unsigned long>(c - '0');
    }
    if (port == 0 || port > 65535) return std::nullopt;
    return AgentEndpoint{text.substr(0, colon), static_cast<std::uint16_t>(port)};
}

std::string format_hello_message() {
    return "{\"type\":\"hello\",\"protocol\":" + std::to_string(kAgentProtocolVersion) + "}";
}

std::string format_observation_message(const ObservableState& state) {
    std::ostringstream out;
    out.precision(9);
    out << std::boolalpha;

    out << "{\"type\":\"observation\",\"frame\":" << state.frame << ",\"time\":";
    put_number(out, state.time);
    out << ",\"map\":{\"width\":";
    put_number(out, state.map_width);
    out << ",\"height\":";
    put_number(out, state.map_height);
    out << '}';

    const ShipView& ship = state.ship;
    out << ",\"ship\":{";
    put_motion(out, ship.pos, ship.vel);
    out << ",\"heading\":";
    put_number(out, ship.heading_deg);
    out << ",\"speed\":";
    put_number(out, ship.speed);
    out << ",\"lives\":" << ship.lives << ",\"alive\":" << ship.alive << ",\"respawning\":" << ship.respawning
        << ",\"can_fire\":" << ship.can_fire << '}';

    out << ",\"asteroids\":[";
    for (std::size_t i = 0; i < state.asteroids.size(); ++i) {
        const AsteroidView& a = state.asteroids[i];
        if (i > 0) out << ',';
        out << "{\"id\":" << a.id << ',';
        put_motion(out, a.pos, a.vel);
        out << ",\"size\":" << static_cast<int>(a.size) << ",\"radius\":";
        put_number(out, a.radius);
        out << '}';
    }

    out << "],\"bullets\":[";
    for (std::size_t i = 0; i < state.bullets.size(); ++i) {
        const BulletView& b = state.bullets[i];
        if (i > 0) out << ',';
        out << "{\"id\":" << b.id << ',';
        put_motion(out, b.pos, b.vel);
        out << ",\"ttl\":";
        put_number(out, b.ttl);
        out << '}';
    }
    out << "]}";
    return out.str();
}

Action parse_action_message(const std::string& line) {
    Action action{};
    action.thrust = required_number(line, "thrust");
    action.turn_rate = required_number(line, "turn_rate");
    action.fire = optional_flag(line, "fire");
    return action;
}

std::string parse_model_name(const std::string& line) {
    const std::size_t pos = find_value(line, "model");
    if (pos == std::string::npos || line[pos] != '"') return "unknown";
    const std::size_t close = line.find('"', pos + 1);
    if (close == std::string::npos || close == pos + 1) return "unknown";
    return line.substr(pos + 1, close - pos - 1);
}

void LineBuffer::append(const char* data, std::size_t size) {
    pending_.append(data, size);
    if (pending_.size() > max_pending_) {
        throw AgentProtocolError("agent message exceeds " + std::to_string(max_pending_) + " bytes");
    }
}

std::optional<std::string> LineBuffer::next_line() {
    const std::size_t newline = pending_.find('\n');
    if (newline == std::string::npos) return std::nullopt;

    std::string line = pending_.substr(0, newline);
    pending_.erase(0, newline + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

std::unique_ptr<RemoteAgent> RemoteAgent::connect(const AgentEndpoint& endpoint) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* found = nullptr;
    const int rc = ::getaddrinfo(endpoint.host.c_str(), std::to_string(endpoint.port).c_str(), &hints, &found);
    if (rc != 0) {
        throw std::runtime_error("cannot resolve agent host " + endpoint.host + ": " + ::gai_strerror(rc));
    }
    const std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> addresses(found, &::freeaddrinfo);

    int fd = -1;
    for (const addrinfo* ai = addresses.get(); ai != nullptr && fd < 0; ai = ai->ai_next) {
        fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd >= 0 && ::connect(fd, ai->ai_addr, ai->ai_addrlen) != 0) {
            ::close(fd);
            fd = -1;
        }
    }
    if (fd < 0) {
        throw std::runtime_error("no agent listening on " + endpoint.host + ":" + std::to_string(endpoint.port));
    }

    std::unique_ptr<RemoteAgent> agent(new RemoteAgent(fd));
    agent->write_line(format_hello_message());
    agent->model_ = parse_model_name(agent->read_line());
    return agent;
}

RemoteAgent::~RemoteAgent() {
    if (fd_ >= 0) ::close(fd_);
}

Action RemoteAgent::decide(const ObservableState& state) {
    write_line(format_observation_message(state));
    return parse_action_message(read_line());
}

void RemoteAgent::write_line(const std::string& message) {
    const std::string framed = message + '\n';
    const char* cursor = framed.data();
    std::size_t left = framed.size();
    while (left > 0) {
        const ssize_t n = ::send(fd_, cursor, left, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) throw std::runtime_error(std::string("sending to agent failed: ") + std::strerror(errno));
        if (n == 0) throw std::runtime_error("agent connection accepted no data");
        cursor += n;
        left -= static_cast<std::size_t>(n);
    }
}

std::string RemoteAgent::read_line() {
    std::array<char, 4096> chunk{};
    while (true) {
        if (auto line = inbox_.next_line()) return *line;

        const ssize_t n = ::recv(fd_, chunk.data(), chunk.size(), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) throw std::runtime_error(std::string("reading from agent failed: ") + std::strerror(errno));
        if (n == 0) throw std::runtime_error("agent closed the connection");
        inbox_.append(chunk.data(), static_cast<std::size_t>(n));
    }
}

} // namespace fa
