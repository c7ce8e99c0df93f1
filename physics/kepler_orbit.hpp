#pragma once

#include <cstdint>

#include "base/not_null.hpp"
#include "geometry/named_quantities.hpp"
#include "geometry/rotation.hpp"
#include "numerics/root_finders.hpp"
#include "physics/degrees_of_freedom.hpp"
#include "serialization/catalog.pb.h"

namespace orrery {
namespace physics {
namespace internal_kepler_orbit {

using base::not_null;
using geometry::Position;
using geometry::Rotation;
using geometry::Velocity;
using numerics::NewtonRaphsonResult;

// The elements of an elliptic orbit around the parent body.  Lengths are in
// km, angles in degrees, times in days.  A |revolution_period| of 0 denotes a
// body that doesn't orbit anything.
struct KeplerianElements final {
  double eccentricity = 0;
  double semimajor_axis = 0;
  double inclination = 0;
  double longitude_of_ascending_node = 0;
  double argument_of_periapsis = 0;
  double mean_anomaly = 0;
  double revolution_period = 0;

  void WriteToMessage(
      not_null<serialization::KeplerianElements*> message) const;
  static KeplerianElements ReadFromMessage(
      serialization::KeplerianElements const& message);
};

constexpr std::int64_t max_kepler_iterations = 10;
constexpr double kepler_tolerance = 1e-6;

// Solves Kepler's equation M = E − e sin E for the eccentric anomaly E.  The
// anomalies are in degrees, so the eccentricity is scaled to degrees in the
// equation.  The initial estimate is M + e sin M.
NewtonRaphsonResult<double> SolveKeplerEquation(double mean_anomaly,
                                                double eccentricity);

// The analytic motion of a body relative to its parent.
class KeplerOrbit final {
 public:
  explicit KeplerOrbit(KeplerianElements const& elements);

  // Positions the body at the simulated time |t| (days since tick 0).  Does
  // nothing if the body doesn't orbit.
  void Update(double t);

  KeplerianElements const& elements() const;

  // In degrees, as of the last |Update|.
  double mean_anomaly() const;
  double eccentric_anomaly() const;

  // In the orbital plane, with x towards the periapsis; z is always 0.
  Position const& orbital_plane_position() const;
  Velocity const& orbital_plane_velocity() const;

  // Relative to the parent, in the reference axes.
  DegreesOfFreedom const& local_degrees_of_freedom() const;

 private:
  KeplerianElements const elements_;
  Rotation const to_reference_;

  double mean_anomaly_;
  double eccentric_anomaly_ = 0;
  Position orbital_plane_position_;
  Velocity orbital_plane_velocity_;
  DegreesOfFreedom local_degrees_of_freedom_;
};

}  // namespace internal_kepler_orbit

using internal_kepler_orbit::KeplerianElements;
using internal_kepler_orbit::KeplerOrbit;
using internal_kepler_orbit::SolveKeplerEquation;

}  // namespace physics
}  // namespace orrery
