#pragma once

#include "base/not_null.hpp"
#include "geometry/named_quantities.hpp"

namespace orrery {
namespace integrators {
namespace internal_leapfrog {

using base::not_null;
using geometry::Acceleration;
using geometry::Position;
using geometry::Velocity;

// The state of a point mass for the second-order equation q̈ = a(q).
struct SystemState final {
  Position position;
  Velocity velocity;
  // Must be a(position).
  Acceleration acceleration;
};

// Advances |state| by |Δt| using the kick-drift-kick leapfrog scheme:
//   v½ = v + a(q) Δt / 2
//   q′ = q + v½ Δt
//   v′ = v½ + a(q′) Δt / 2
// |compute_acceleration| is called exactly once, on q′.  The scheme is
// time-reversible: stepping back from the result with −Δt restores |state|
// up to rounding.
template<typename ComputeAcceleration>
void LeapfrogStep(double Δt,
                  ComputeAcceleration const& compute_acceleration,
                  not_null<SystemState*> state);

}  // namespace internal_leapfrog

using internal_leapfrog::LeapfrogStep;
using internal_leapfrog::SystemState;

}  // namespace integrators
}  // namespace orrery

#include "integrators/leapfrog_body.hpp"
