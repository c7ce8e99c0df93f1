#pragma once

#include "integrators/leapfrog.hpp"

namespace orrery {
namespace integrators {
namespace internal_leapfrog {

template<typename ComputeAcceleration>
void LeapfrogStep(double const Δt,
                  ComputeAcceleration const& compute_acceleration,
                  not_null<SystemState*> const state) {
  double const half_Δt = 0.5 * Δt;
  Velocity const v_half = state->velocity + half_Δt * state->acceleration;
  state->position += Δt * v_half;
  state->acceleration = compute_acceleration(state->position);
  state->velocity = v_half + half_Δt * state->acceleration;
}

}  // namespace internal_leapfrog
}  // namespace integrators
}  // namespace orrery
