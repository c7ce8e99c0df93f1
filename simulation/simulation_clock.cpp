#include "simulation/simulation_clock.hpp"

#include "glog/logging.h"

namespace orrery {
namespace simulation {
namespace internal_simulation_clock {

SimulationClock::SimulationClock() = default;

std::uint64_t SimulationClock::tick() const {
  return tick_;
}

std::uint64_t SimulationClock::step_size() const {
  return step_size_;
}

bool SimulationClock::running() const {
  return running_;
}

double SimulationClock::simulated_time() const {
  return SimulatedTimeAt(tick_);
}

double SimulationClock::SimulatedTimeAt(std::uint64_t const tick) const {
  return static_cast<double>(tick) * static_cast<double>(step_size_);
}

bool SimulationClock::Tick() {
  if (pending_running_.has_value()) {
    running_ = *pending_running_;
    pending_running_.reset();
    LOG(INFO) << (running_ ? "Time started" : "Time paused") << " at tick "
              << tick_;
  }
  if (running_) {
    ++tick_;
  }
  return running_;
}

void SimulationClock::RequestToggle() {
  bool const next = !pending_running_.value_or(running_);
  if (next == running_) {
    pending_running_.reset();
  } else {
    pending_running_ = next;
  }
}

void SimulationClock::SetRunning(bool const running) {
  pending_running_.reset();
  running_ = running;
}

absl::Status SimulationClock::SetStepSize(std::uint64_t const step_size) {
  if (step_size == 0) {
    return absl::InvalidArgumentError("The step size must be positive");
  }
  if (step_size != step_size_) {
    VLOG(1) << "Step size changed from " << step_size_ << " to " << step_size;
  }
  step_size_ = step_size;
  return absl::OkStatus();
}

void SimulationClock::SetTick(std::uint64_t const tick) {
  if (tick < tick_) {
    VLOG(1) << "Ignoring tick " << tick << " before " << tick_;
    return;
  }
  tick_ = tick;
}

}  // namespace internal_simulation_clock
}  // namespace simulation
}  // namespace orrery
