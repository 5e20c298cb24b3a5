#pragma once

namespace fa {

// One tick of ship controls. thrust is px/s^2 along the heading, turn_rate is
// deg/s (positive turns counter-clockwise).
struct Action {
    float thrust = 0.0f;
    float turn_rate = 0.0f;
    bool fire = false;
};

// Throws InvalidAction when a field is non-finite or outside the ship's range.
void validate_action(const Action& action);

} // namespace fa
