#pragma once

#include <cstdint>
#include <optional>

#include "absl/status/status.h"

namespace orrery {
namespace simulation {
namespace internal_simulation_clock {

// The simulated time of a simulation, counted in ticks.  Each tick of a
// running clock lasts |step_size| days.  The tick counter never decreases.
class SimulationClock final {
 public:
  // Paused at tick 0 with a step size of 1 day.
  SimulationClock();

  std::uint64_t tick() const;
  std::uint64_t step_size() const;
  bool running() const;

  // tick × step size, in days.
  double simulated_time() const;
  // The simulated time at |tick| with the current step size.
  double SimulatedTimeAt(std::uint64_t tick) const;

  // Applies the pending running state, if any, then advances by one tick if
  // the clock is running.  Returns true if it advanced.
  bool Tick();

  // Flips the running state at the next call to |Tick|.  Two requests before
  // a tick cancel each other.
  void RequestToggle();

  // Changes the running state now.  Discards any pending request.
  void SetRunning(bool running);

  // Takes effect immediately.  Fails with |InvalidArgumentError| if
  // |step_size| is 0.
  absl::Status SetStepSize(std::uint64_t step_size);

  // Adopts the tick of the authoritative peer.  Ignored if |tick| is before
  // the current tick.
  void SetTick(std::uint64_t tick);

 private:
  std::uint64_t tick_ = 0;
  std::uint64_t step_size_ = 1;
  bool running_ = false;
  std::optional<bool> pending_running_;
};

}  // namespace internal_simulation_clock

using internal_simulation_clock::SimulationClock;

}  // namespace simulation
}  // namespace orrery
