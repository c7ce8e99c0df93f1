#include "simulation/simulation_clock.hpp"

#include "absl/status/status.h"
#include "gtest/gtest.h"

namespace orrery {
namespace simulation {

class SimulationClockTest : public ::testing::Test {
 protected:
  SimulationClock clock_;
};

TEST_F(SimulationClockTest, Initial) {
  EXPECT_EQ(0, clock_.tick());
  EXPECT_EQ(1, clock_.step_size());
  EXPECT_FALSE(clock_.running());
  EXPECT_FALSE(clock_.Tick());
  EXPECT_EQ(0, clock_.tick());
  EXPECT_EQ(0, clock_.simulated_time());
}

TEST_F(SimulationClockTest, ToggleTakesEffectAtTheNextTick) {
  clock_.RequestToggle();
  EXPECT_FALSE(clock_.running());
  EXPECT_TRUE(clock_.Tick());
  EXPECT_TRUE(clock_.running());
  EXPECT_EQ(1, clock_.tick());
  EXPECT_TRUE(clock_.Tick());
  EXPECT_EQ(2, clock_.tick());

  clock_.RequestToggle();
  EXPECT_FALSE(clock_.Tick());
  EXPECT_FALSE(clock_.running());
  EXPECT_EQ(2, clock_.tick());
}

TEST_F(SimulationClockTest, TogglesCancel) {
  clock_.RequestToggle();
  clock_.RequestToggle();
  EXPECT_FALSE(clock_.Tick());
  EXPECT_EQ(0, clock_.tick());
  clock_.RequestToggle();
  clock_.RequestToggle();
  clock_.RequestToggle();
  EXPECT_TRUE(clock_.Tick());
}

TEST_F(SimulationClockTest, SetRunning) {
  clock_.RequestToggle();
  clock_.SetRunning(false);
  EXPECT_FALSE(clock_.Tick());
  clock_.SetRunning(true);
  EXPECT_TRUE(clock_.running());
  EXPECT_TRUE(clock_.Tick());
  EXPECT_EQ(1, clock_.tick());
}

TEST_F(SimulationClockTest, StepSize) {
  EXPECT_TRUE(clock_.SetStepSize(30).ok());
  clock_.SetRunning(true);
  clock_.Tick();
  clock_.Tick();
  EXPECT_EQ(2, clock_.tick());
  EXPECT_EQ(60, clock_.simulated_time());
  EXPECT_EQ(150, clock_.SimulatedTimeAt(5));

  absl::Status const status = clock_.SetStepSize(0);
  EXPECT_EQ(absl::StatusCode::kInvalidArgument, status.code());
  EXPECT_EQ(30, clock_.step_size());
}

TEST_F(SimulationClockTest, TickNeverDecreases) {
  clock_.SetTick(100);
  EXPECT_EQ(100, clock_.tick());
  clock_.SetTick(99);
  EXPECT_EQ(100, clock_.tick());
  clock_.SetTick(100);
  EXPECT_EQ(100, clock_.tick());
  clock_.SetRunning(true);
  clock_.Tick();
  EXPECT_EQ(101, clock_.tick());
}

}  // namespace simulation
}  // namespace orrery
