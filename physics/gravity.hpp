#pragma once

#include <vector>

#include "base/not_null.hpp"
#include "geometry/named_quantities.hpp"
#include "physics/celestial.hpp"

namespace orrery {
namespace physics {
namespace internal_gravity {

using base::not_null;
using geometry::Acceleration;
using geometry::Position;

// The Newtonian acceleration at |position| due to the given bodies, in
// km/day².  A body located exactly at |position| is skipped.
Acceleration GravitationalAcceleration(
    Position const& position,
    std::vector<not_null<Celestial const*>> const& bodies);

// Same as above for a single point mass.
Acceleration GravitationalAcceleration(Position const& position,
                                       Position const& body_position,
                                       double body_mass);

}  // namespace internal_gravity

using internal_gravity::GravitationalAcceleration;

}  // namespace physics
}  // namespace orrery
