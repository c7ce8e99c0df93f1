#pragma once

#include "base/not_null.hpp"
#include "geometry/named_quantities.hpp"
#include "physics/influence.hpp"
#include "physics/orbital_propagator.hpp"
#include "physics/ship.hpp"

namespace orrery {
namespace physics {
namespace internal_ship_integrator {

using base::not_null;
using geometry::Acceleration;
using geometry::Position;

// Integrates the motion of ships in the gravitational field of the bodies of
// |propagator|, in their current state.  The influence of a ship is always
// resolved before its acceleration is computed.
class ShipIntegrator final {
 public:
  explicit ShipIntegrator(OrbitalPropagator const& propagator);

  // Resolves the influence at the position of |ship| and stores it.
  void UpdateInfluence(not_null<Ship*> ship) const;

  // Resolves the influence and recomputes the acceleration of |ship| at its
  // position.
  void UpdateAcceleration(not_null<Ship*> ship) const;

  // The acceleration at |position| due to the bodies of |influence|.
  Acceleration ComputeAcceleration(Position const& position,
                                   Influence const& influence) const;
  // The acceleration at |position| due to the bodies that influence it.
  Acceleration ComputeAcceleration(Position const& position) const;

  // Advances |ship| by |Δt| days with the leapfrog scheme.  The influence is
  // resolved again at the new position before the final acceleration is
  // computed.
  void Step(double Δt, not_null<Ship*> ship) const;

 private:
  InfluenceResolver const resolver_;
};

}  // namespace internal_ship_integrator

using internal_ship_integrator::ShipIntegrator;

}  // namespace physics
}  // namespace orrery
