#pragma once

#include "action.hpp"
#include "observation.hpp"

#include <string>

namespace fa {

class Agent {
  public:
    virtual ~Agent() = default;

    virtual Action decide(const ObservableState& state) = 0;
    virtual std::string name() const { return "agent"; }
};

// Never touches the controls.
class IdleAgent : public Agent {
  public:
    Action decide(const ObservableState& state) override;
    std::string name() const override { return "idle"; }
};

// Turns at a constant rate and fires whenever the gun is ready.
class SpinnerAgent : public Agent {
  public:
    explicit SpinnerAgent(float turn_rate = kShipMaxTurnRate * 0.5f) : turn_rate_(turn_rate) {}

    Action decide(const ObservableState& state) override;
    std::string name() const override { return "spinner"; }

  private:
    float turn_rate_;
};

} // namespace fa
