#include "fuzzyasteroids/agent.hpp"

namespace fa {

Action IdleAgent::decide(const ObservableState&) {
    return Action{};
}

Action SpinnerAgent::decide(const ObservableState& state) {
    Action action{};
    action.turn_rate = turn_rate_;
    action.fire = state.ship.can_fire;
    return action;
}

} // namespace fa
