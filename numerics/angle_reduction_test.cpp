#include "numerics/angle_reduction.hpp"

#include "gtest/gtest.h"

namespace orrery {
namespace numerics {

class AngleReductionTest : public ::testing::Test {};

TEST_F(AngleReductionTest, InRange) {
  EXPECT_EQ(0, ReduceAngle(0));
  EXPECT_EQ(90, ReduceAngle(90));
  EXPECT_EQ(-179.5, ReduceAngle(-179.5));
  EXPECT_EQ(179.5, ReduceAngle(179.5));
}

TEST_F(AngleReductionTest, OutOfRange) {
  EXPECT_EQ(-170, ReduceAngle(190));
  EXPECT_EQ(170, ReduceAngle(-190));
  EXPECT_EQ(10, ReduceAngle(730));
  EXPECT_EQ(-10, ReduceAngle(-730));
  EXPECT_NEAR(-1.383, ReduceAngle(358.617), 1e-12);
}

TEST_F(AngleReductionTest, HalfTurn) {
  EXPECT_EQ(-180, ReduceAngle(180));
  EXPECT_EQ(-180, ReduceAngle(-180));
  EXPECT_EQ(-180, ReduceAngle(540));
}

}  // namespace numerics
}  // namespace orrery
