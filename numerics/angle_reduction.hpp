#pragma once

namespace orrery {
namespace numerics {
namespace internal_angle_reduction {

// Returns the angle congruent to |angle| modulo 360° in [-180°, 180°).  Both
// angles are in degrees.
double ReduceAngle(double angle);

}  // namespace internal_angle_reduction

using internal_angle_reduction::ReduceAngle;

}  // namespace numerics
}  // namespace orrery
