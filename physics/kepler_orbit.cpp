#include "physics/kepler_orbit.hpp"

#include <cmath>

#include "glog/logging.h"
#include "numerics/angle_reduction.hpp"
#include "quantities/si.hpp"

namespace orrery {
namespace physics {
namespace internal_kepler_orbit {

using numerics::NewtonRaphson;
using numerics::ReduceAngle;
using quantities::π;
using quantities::si::Degree;
using quantities::si::Radian;

void KeplerianElements::WriteToMessage(
    not_null<serialization::KeplerianElements*> const message) const {
  message->set_eccentricity(eccentricity);
  message->set_semimajor_axis(semimajor_axis);
  message->set_inclination(inclination);
  message->set_longitude_of_ascending_node(longitude_of_ascending_node);
  message->set_argument_of_periapsis(argument_of_periapsis);
  message->set_mean_anomaly(mean_anomaly);
  message->set_revolution_period(revolution_period);
}

KeplerianElements KeplerianElements::ReadFromMessage(
    serialization::KeplerianElements const& message) {
  KeplerianElements elements;
  elements.eccentricity = message.eccentricity();
  elements.semimajor_axis = message.semimajor_axis();
  elements.inclination = message.inclination();
  elements.longitude_of_ascending_node = message.longitude_of_ascending_node();
  elements.argument_of_periapsis = message.argument_of_periapsis();
  elements.mean_anomaly = message.mean_anomaly();
  elements.revolution_period = message.revolution_period();
  return elements;
}

NewtonRaphsonResult<double> SolveKeplerEquation(double const mean_anomaly,
                                                double const eccentricity) {
  double const e = eccentricity;
  double const e_degrees = e * Radian / Degree;
  double const M = mean_anomaly;
  auto const f = [e_degrees, M](double const E) {
    return (E - e_degrees * std::sin(E * Degree)) - M;
  };
  auto const derivative = [e](double const E) {
    return 1 - e * std::cos(E * Degree);
  };
  double const E_0 = M + e_degrees * std::sin(M * Degree);
  auto const result = NewtonRaphson(
      f, derivative, E_0, kepler_tolerance, max_kepler_iterations);
  VLOG_IF(1, !result.converged)
      << "Kepler's equation did not converge for M = " << M << "°, e = " << e
      << ", using E = " << result.root << "°";
  return result;
}

KeplerOrbit::KeplerOrbit(KeplerianElements const& elements)
    : elements_(elements),
      to_reference_(elements.argument_of_periapsis * Degree,
                    elements.longitude_of_ascending_node * Degree,
                    elements.inclination * Degree),
      mean_anomaly_(elements.mean_anomaly) {
  CHECK_LE(0, elements_.eccentricity);
  CHECK_LT(elements_.eccentricity, 1);
  CHECK_LE(0, elements_.revolution_period);
}

void KeplerOrbit::Update(double const t) {
  if (elements_.revolution_period == 0) {
    return;
  }
  double const a = elements_.semimajor_axis;
  double const e = elements_.eccentricity;

  mean_anomaly_ = ReduceAngle(elements_.mean_anomaly +
                              360 * t / elements_.revolution_period);
  eccentric_anomaly_ = SolveKeplerEquation(mean_anomaly_, e).root;

  double const E = eccentric_anomaly_ * Degree;
  double const cos_E = std::cos(E);
  double const sin_E = std::sin(E);
  double const sqrt_1_minus_e_squared = std::sqrt(1 - e * e);
  orbital_plane_position_ = {a * (cos_E - e),
                             a * sqrt_1_minus_e_squared * sin_E,
                             0};

  // Rates in radians per day.
  double const dM_dt = 2 * π / elements_.revolution_period;
  double const dE_dt = dM_dt / (1 - e * cos_E);
  orbital_plane_velocity_ = {-a * sin_E * dE_dt,
                             a * cos_E * dE_dt * sqrt_1_minus_e_squared,
                             0};

  local_degrees_of_freedom_ = {to_reference_(orbital_plane_position_),
                               to_reference_(orbital_plane_velocity_)};
}

KeplerianElements const& KeplerOrbit::elements() const {
  return elements_;
}

double KeplerOrbit::mean_anomaly() const {
  return mean_anomaly_;
}

double KeplerOrbit::eccentric_anomaly() const {
  return eccentric_anomaly_;
}

Position const& KeplerOrbit::orbital_plane_position() const {
  return orbital_plane_position_;
}

Velocity const& KeplerOrbit::orbital_plane_velocity() const {
  return orbital_plane_velocity_;
}

DegreesOfFreedom const& KeplerOrbit::local_degrees_of_freedom() const {
  return local_degrees_of_freedom_;
}

}  // namespace internal_kepler_orbit
}  // namespace physics
}  // namespace orrery
