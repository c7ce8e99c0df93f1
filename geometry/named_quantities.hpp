#pragma once

#include "geometry/r3_element.hpp"

namespace orrery {
namespace geometry {

// All vectors are expressed in the inertial axes of the primary body, in km,
// km/day and km/day².
using Displacement = R3Element<double>;
using Position = R3Element<double>;
using Velocity = R3Element<double>;
using Acceleration = R3Element<double>;

}  // namespace geometry
}  // namespace orrery
