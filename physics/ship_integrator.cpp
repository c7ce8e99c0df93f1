#include "physics/ship_integrator.hpp"

#include "integrators/leapfrog.hpp"
#include "physics/gravity.hpp"

namespace orrery {
namespace physics {
namespace internal_ship_integrator {

using integrators::LeapfrogStep;
using integrators::SystemState;

ShipIntegrator::ShipIntegrator(OrbitalPropagator const& propagator)
    : resolver_(propagator) {}

void ShipIntegrator::UpdateInfluence(not_null<Ship*> const ship) const {
  ship->set_influence(resolver_.Resolve(ship->position()));
}

void ShipIntegrator::UpdateAcceleration(not_null<Ship*> const ship) const {
  UpdateInfluence(ship);
  ship->set_acceleration(
      ComputeAcceleration(ship->position(), ship->influence()));
}

Acceleration ShipIntegrator::ComputeAcceleration(
    Position const& position,
    Influence const& influence) const {
  return GravitationalAcceleration(position,
                                   resolver_.Influencers(influence));
}

Acceleration ShipIntegrator::ComputeAcceleration(
    Position const& position) const {
  return ComputeAcceleration(position, resolver_.Resolve(position));
}

void ShipIntegrator::Step(double const Δt, not_null<Ship*> const ship) const {
  UpdateAcceleration(ship);
  SystemState state{ship->position(), ship->velocity(), ship->acceleration()};
  LeapfrogStep(
      Δt,
      [this, ship](Position const& position) {
        ship->set_influence(resolver_.Resolve(position));
        return ComputeAcceleration(position, ship->influence());
      },
      &state);
  ship->set_degrees_of_freedom({state.position, state.velocity});
  ship->set_acceleration(state.acceleration);
}

}  // namespace internal_ship_integrator
}  // namespace physics
}  // namespace orrery
