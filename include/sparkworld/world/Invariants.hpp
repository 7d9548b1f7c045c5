#pragma once
#include "sparkworld/world/WorldState.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace sparkworld::world {

// The engine's own ordering rules were broken. Never handled at runtime:
// it aborts the tick and nothing gets saved.
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Every structural problem found in `w`, one message each. Empty means consistent.
[[nodiscard]] std::vector<std::string> FindInvariantViolations(const WorldState& w);

// Throws InvariantViolation listing every problem found.
void CheckInvariants(const WorldState& w);

} // namespace sparkworld::world
