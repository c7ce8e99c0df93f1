#include <memory>
#include <thread>

#include "base/thread_pool.hpp"
#include "benchmark/benchmark.h"
#include "physics/degrees_of_freedom.hpp"
#include "physics/kepler_orbit.hpp"
#include "physics/orbital_propagator.hpp"
#include "physics/ship.hpp"
#include "physics/ship_integrator.hpp"
#include "testing_utilities/solar_system.hpp"

namespace orrery {

using base::ThreadPool;
using physics::BodiesConfig;
using physics::BodyType;
using physics::DegreesOfFreedom;
using physics::OrbitalPropagator;
using physics::Ship;
using physics::ShipIntegrator;
using physics::SolveKeplerEquation;
using testing_utilities::SolarSystemCatalog;

namespace physics {

void BM_SolveKeplerEquation(benchmark::State& state) {  // NOLINT
  double mean_anomaly = -180;
  for (auto _ : state) {
    benchmark::DoNotOptimize(SolveKeplerEquation(mean_anomaly, 0.2));
    mean_anomaly = mean_anomaly >= 180 ? -180 : mean_anomaly + 1;
  }
}
BENCHMARK(BM_SolveKeplerEquation);

void BM_Propagate(benchmark::State& state) {  // NOLINT
  OrbitalPropagator propagator(SolarSystemCatalog().Filter(
      BodiesConfig::SmallestBodyType(BodyType::Comet)));
  std::unique_ptr<ThreadPool<void>> pool;
  if (state.range(0) > 0) {
    pool = std::make_unique<ThreadPool<void>>(state.range(0));
  }
  double t = 0;
  for (auto _ : state) {
    propagator.Propagate(t, pool.get());
    t += 1;
  }
}
BENCHMARK(BM_Propagate)->Arg(0)->Arg(2)->Arg(4);

void BM_ShipStep(benchmark::State& state) {  // NOLINT
  OrbitalPropagator const propagator(SolarSystemCatalog().Filter(
      BodiesConfig::SmallestBodyType(BodyType::Comet)));
  ShipIntegrator const integrator(propagator);
  Ship ship("bench",
            DegreesOfFreedom{{1.5e8, 0, 0}, {0, 2.5e6, 0}},
            geometry::Acceleration());
  for (auto _ : state) {
    integrator.Step(1, &ship);
  }
}
BENCHMARK(BM_ShipStep);

}  // namespace physics
}  // namespace orrery

BENCHMARK_MAIN();
