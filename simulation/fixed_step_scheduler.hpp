#pragma once

#include <cstdint>

#include "absl/time/time.h"

namespace orrery {
namespace simulation {
namespace internal_fixed_step_scheduler {

// Converts elapsed wall-clock time into a number of fixed steps.  The time
// that doesn't make a whole step is carried over to the next update.  When
// the steps fall behind by more than |max_steps_per_update|, the excess is
// dropped rather than run in a burst.
class FixedStepScheduler final {
 public:
  FixedStepScheduler(absl::Duration period,
                     std::int64_t max_steps_per_update);

  // Returns the number of steps to run for |elapsed| more wall-clock time.
  std::int64_t Update(absl::Duration elapsed);

  // The wall-clock time until the next step is due.
  absl::Duration TimeToNextStep() const;

  absl::Duration period() const;

 private:
  absl::Duration const period_;
  std::int64_t const max_steps_per_update_;
  absl::Duration accumulated_;
};

}  // namespace internal_fixed_step_scheduler

using internal_fixed_step_scheduler::FixedStepScheduler;

}  // namespace simulation
}  // namespace orrery
