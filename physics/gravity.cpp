#include "physics/gravity.hpp"

#include <cmath>

#include "quantities/constants.hpp"

namespace orrery {
namespace physics {
namespace internal_gravity {

using geometry::Displacement;
using quantities::constants::GravitationalConstant;

Acceleration GravitationalAcceleration(
    Position const& position,
    std::vector<not_null<Celestial const*>> const& bodies) {
  Acceleration acceleration;
  for (not_null<Celestial const*> const body : bodies) {
    acceleration +=
        GravitationalAcceleration(position, body->position(), body->mass());
  }
  return acceleration;
}

Acceleration GravitationalAcceleration(Position const& position,
                                       Position const& body_position,
                                       double const body_mass) {
  Displacement const r = body_position - position;
  double const r_squared = r.NormSquared();
  if (r_squared == 0) {
    return Acceleration();
  }
  double const r_norm = std::sqrt(r_squared);
  return GravitationalConstant * body_mass / (r_squared * r_norm) * r;
}

}  // namespace internal_gravity
}  // namespace physics
}  // namespace orrery
