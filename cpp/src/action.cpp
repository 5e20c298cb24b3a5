#include "fuzzyasteroids/action.hpp"

#include "fuzzyasteroids/config.hpp"
#include "fuzzyasteroids/errors.hpp"

#include <cmath>
#include <sstream>
#include <string>

namespace fa {
namespace {

void check_range(const char* field, float value, float limit) {
    if (std::isfinite(value) && std::abs(value) <= limit) return;
    std::ostringstream oss;
    oss << field << '=' << value << " outside [" << -limit << ", " << limit << ']';
    throw InvalidAction(oss.str());
}

} // namespace

void validate_action(const Action& action) {
    check_range("thrust", action.thrust, kShipMaxThrust);
    check_range("turn_rate", action.turn_rate, kShipMaxTurnRate);
}

} // namespace fa
