#include "physics/kepler_orbit.hpp"

#include <cmath>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "physics/degrees_of_freedom.hpp"
#include "quantities/si.hpp"

namespace orrery {

using geometry::Position;
using quantities::si::Degree;
using quantities::si::Hour;
using quantities::si::Radian;
using ::testing::AllOf;
using ::testing::DoubleNear;
using ::testing::Ge;
using ::testing::Le;

namespace physics {

class KeplerOrbitTest : public ::testing::Test {
 protected:
  KeplerOrbitTest() {
    earth_.eccentricity = 0.0167086;
    earth_.semimajor_axis = 149598023;
    earth_.inclination = 0.00005;
    earth_.longitude_of_ascending_node = -11.26064;
    earth_.argument_of_periapsis = 114.20783;
    earth_.mean_anomaly = 358.617;
    earth_.revolution_period = 365.256363004;
  }

  // The residual of Kepler's equation in degrees.
  static double Residual(double const mean_anomaly,
                         double const eccentricity,
                         double const eccentric_anomaly) {
    return std::abs(mean_anomaly -
                    (eccentric_anomaly - eccentricity * Radian / Degree *
                                             std::sin(eccentric_anomaly *
                                                      Degree)));
  }

  KeplerianElements earth_;
};

TEST_F(KeplerOrbitTest, Convergence) {
  for (double e = 0; e <= 0.8; e += 0.1) {
    for (double M = -180; M <= 180; M += 5) {
      auto const result = SolveKeplerEquation(M, e);
      EXPECT_TRUE(result.converged) << "M = " << M << ", e = " << e;
      EXPECT_LE(result.iterations, max_kepler_iterations);
      EXPECT_LE(Residual(M, e, result.root), 1e-6)
          << "M = " << M << ", e = " << e;
    }
  }
}

TEST_F(KeplerOrbitTest, CircularOrbitNeedsNoCorrection) {
  auto const result = SolveKeplerEquation(42, 0);
  EXPECT_TRUE(result.converged);
  EXPECT_EQ(1, result.iterations);
  EXPECT_EQ(42, result.root);
}

TEST_F(KeplerOrbitTest, NearParabolic) {
  // No guarantee on the residual, but the iteration is capped and the result
  // is usable.
  auto const result = SolveKeplerEquation(0.5, 0.999);
  EXPECT_LE(result.iterations, max_kepler_iterations);
  EXPECT_TRUE(std::isfinite(result.root));
}

TEST_F(KeplerOrbitTest, Earth) {
  KeplerOrbit orbit(earth_);
  orbit.Update(/*t=*/0);
  EXPECT_THAT(orbit.mean_anomaly(), DoubleNear(-1.383, 1e-9));
  EXPECT_LE(Residual(orbit.mean_anomaly(),
                     earth_.eccentricity,
                     orbit.eccentric_anomaly()),
            1e-6);

  auto const& dof = orbit.local_degrees_of_freedom();
  EXPECT_THAT(dof.position.Norm(), AllOf(Ge(147095000), Le(152100000)));
  double const speed_per_hour = dof.velocity.Norm() * Hour;
  EXPECT_THAT(speed_per_hour, AllOf(Ge(107200 - 20000), Le(107200 + 20000)));
  // The orbit is almost in the reference plane.
  EXPECT_THAT(dof.position.z, DoubleNear(0, 200));
}

TEST_F(KeplerOrbitTest, EarthOverAYear) {
  KeplerOrbit orbit(earth_);
  for (double t = 0; t < 400; t += 10) {
    orbit.Update(t);
    EXPECT_THAT(orbit.local_degrees_of_freedom().position.Norm(),
                AllOf(Ge(147095000), Le(152100000)))
        << t;
    EXPECT_THAT(orbit.mean_anomaly(), AllOf(Ge(-180), Le(180))) << t;
  }
}

TEST_F(KeplerOrbitTest, CircularOrbit) {
  KeplerianElements elements;
  elements.semimajor_axis = 1e8;
  elements.revolution_period = 100;
  KeplerOrbit orbit(elements);

  orbit.Update(/*t=*/0);
  EXPECT_EQ(Position(1e8, 0, 0), orbit.local_degrees_of_freedom().position);

  orbit.Update(/*t=*/25);
  EXPECT_EQ(90, orbit.mean_anomaly());
  auto const& dof = orbit.local_degrees_of_freedom();
  EXPECT_THAT(dof.position.x, DoubleNear(0, 1e-6));
  EXPECT_THAT(dof.position.y, DoubleNear(1e8, 1e-6));
  double const speed = 2 * quantities::π * 1e8 / 100;
  EXPECT_THAT(dof.velocity.x, DoubleNear(-speed, 1e-6));
  EXPECT_THAT(dof.velocity.y, DoubleNear(0, 1e-6));
}

TEST_F(KeplerOrbitTest, MeanAnomalyWraps) {
  KeplerianElements elements;
  elements.semimajor_axis = 1e6;
  elements.mean_anomaly = 170;
  elements.revolution_period = 360;
  KeplerOrbit orbit(elements);
  orbit.Update(/*t=*/20);
  EXPECT_EQ(-170, orbit.mean_anomaly());
}

TEST_F(KeplerOrbitTest, NoOrbit) {
  KeplerianElements elements;
  elements.semimajor_axis = 1e6;
  KeplerOrbit orbit(elements);
  orbit.Update(/*t=*/1000);
  EXPECT_EQ(DegreesOfFreedom(), orbit.local_degrees_of_freedom());
}

TEST_F(KeplerOrbitTest, Serialization) {
  serialization::KeplerianElements message;
  earth_.WriteToMessage(&message);
  EXPECT_EQ(0.0167086, message.eccentricity());
  EXPECT_EQ(365.256363004, message.revolution_period());
  auto const elements = KeplerianElements::ReadFromMessage(message);
  EXPECT_EQ(earth_.argument_of_periapsis, elements.argument_of_periapsis);
  EXPECT_EQ(earth_.mean_anomaly, elements.mean_anomaly);
}

using KeplerOrbitDeathTest = KeplerOrbitTest;

TEST_F(KeplerOrbitDeathTest, Hyperbolic) {
  EXPECT_DEATH({
    earth_.eccentricity = 1.5;
    KeplerOrbit orbit(earth_);
  }, "eccentricity");
}

}  // namespace physics
}  // namespace orrery
