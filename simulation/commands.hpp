#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "geometry/named_quantities.hpp"
#include "physics/degrees_of_freedom.hpp"

namespace orrery {
namespace simulation {

// The commands are applied in the order in which they were enqueued, at the
// beginning of the next step.

// Has no effect if a ship with the same id exists.
struct CreateShip final {
  std::string id;
  physics::DegreesOfFreedom degrees_of_freedom;
  // Computed from the bodies if absent.
  std::optional<geometry::Acceleration> acceleration;
};

// Has no effect if there is no ship with that id.
struct RemoveShip final {
  std::string id;
};

struct ToggleTime final {};

// Ignored, with a warning, if |step_size| is 0.
struct SetTimeScale final {
  std::uint64_t step_size;
};

using Command = std::variant<CreateShip, RemoveShip, ToggleTime, SetTimeScale>;

}  // namespace simulation
}  // namespace orrery
