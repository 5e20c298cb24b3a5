#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace fa {

class SimulationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class ConfigurationError : public SimulationError {
  public:
    ConfigurationError(std::string field, const std::string& reason)
        : SimulationError("invalid setting '" + field + "': " + reason), field_(std::move(field)) {}

    const std::string& field() const { return field_; }

  private:
    std::string field_;
};

class InvalidAction : public SimulationError {
  public:
    using SimulationError::SimulationError;
};

class EpisodeAlreadyEnded : public SimulationError {
  public:
    using SimulationError::SimulationError;
};

class EpisodeNotFinished : public SimulationError {
  public:
    using SimulationError::SimulationError;
};

class ScoreAlreadyFinalized : public SimulationError {
  public:
    using SimulationError::SimulationError;
};

// A remote agent sent a message that does not follow the line protocol.
class AgentProtocolError : public SimulationError {
  public:
    using SimulationError::SimulationError;
};

} // namespace fa
