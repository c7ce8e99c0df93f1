#include "simulation/fixed_step_scheduler.hpp"

#include "glog/logging.h"

namespace orrery {
namespace simulation {
namespace internal_fixed_step_scheduler {

FixedStepScheduler::FixedStepScheduler(
    absl::Duration const period,
    std::int64_t const max_steps_per_update)
    : period_(period),
      max_steps_per_update_(max_steps_per_update),
      accumulated_(absl::ZeroDuration()) {
  CHECK_LT(absl::ZeroDuration(), period_);
  CHECK_LT(0, max_steps_per_update_);
}

std::int64_t FixedStepScheduler::Update(absl::Duration const elapsed) {
  CHECK_LE(absl::ZeroDuration(), elapsed);
  accumulated_ += elapsed;
  std::int64_t steps = absl::IDivDuration(accumulated_, period_, &accumulated_);
  if (steps > max_steps_per_update_) {
    LOG(WARNING) << "Dropping " << steps - max_steps_per_update_
                 << " steps, the simulation is falling behind";
    steps = max_steps_per_update_;
  }
  return steps;
}

absl::Duration FixedStepScheduler::TimeToNextStep() const {
  return period_ - accumulated_;
}

absl::Duration FixedStepScheduler::period() const {
  return period_;
}

}  // namespace internal_fixed_step_scheduler
}  // namespace simulation
}  // namespace orrery
