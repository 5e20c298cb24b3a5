#pragma once

#include "action.hpp"
#include "agent.hpp"
#include "observation.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace fa {

// Remote agents speak newline-terminated JSON objects over TCP:
//
//   -> {"type":"hello","protocol":1}
//   <- {"model":"<name>"}
//   -> {"type":"observation","frame":..,"time":..,"map":{..},"ship":{..},
//       "asteroids":[{..}],"bullets":[{..}]}
//   <- {"thrust":T,"turn_rate":R,"fire":true}
//
// One observation/action exchange per tick. `fire` may be omitted.

constexpr int kAgentProtocolVersion = 1;

struct AgentEndpoint {
    std::string host;
    std::uint16_t port = 0;
};

// "HOST:PORT" with a port in [1, 65535].
std::optional<AgentEndpoint> parse_agent_endpoint(const std::string& text);

std::string format_hello_message();
std::string format_observation_message(const ObservableState& state);

// Throws AgentProtocolError on a missing or malformed field. Values are not
// range checked here; the simulator rejects illegal controls.
Action parse_action_message(const std::string& line);

// "unknown" when the reply carries no model name.
std::string parse_model_name(const std::string& line);

// Reassembles newline-terminated messages from stream reads.
class LineBuffer {
  public:
    explicit LineBuffer(std::size_t max_pending = std::size_t{1} << 20U) : max_pending_(max_pending) {}

    void append(const char* data, std::size_t size);
    std::optional<std::string> next_line();

  private:
    std::string pending_;
    std::size_t max_pending_;
};

class RemoteAgent : public Agent {
  public:
    // Connects and performs the hello exchange.
    static std::unique_ptr<RemoteAgent> connect(const AgentEndpoint& endpoint);

    ~RemoteAgent() override;
    RemoteAgent(const RemoteAgent&) = delete;
    RemoteAgent& operator=(const RemoteAgent&) = delete;

    Action decide(const ObservableState& state) override;
    std::string name() const override { return model_; }

  private:
    explicit RemoteAgent(int fd) : fd_(fd) {}

    void write_line(const std::string& message);
    std::string read_line();

    int fd_ = -1;
    LineBuffer inbox_;
    std::string model_ = "unknown";
};

} // namespace fa
