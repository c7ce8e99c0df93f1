#include "geometry/r3_element.hpp"

#include <sstream>

#include "gtest/gtest.h"
#include "serialization/geometry.pb.h"

namespace orrery {
namespace geometry {

class R3ElementTest : public ::testing::Test {
 protected:
  R3Element<double> const a_ = {1, 2, 3};
  R3Element<double> const b_ = {-4, 5, 0.5};
};

TEST_F(R3ElementTest, Arithmetic) {
  EXPECT_EQ(R3Element<double>(-3, 7, 3.5), a_ + b_);
  EXPECT_EQ(R3Element<double>(5, -3, 2.5), a_ - b_);
  EXPECT_EQ(R3Element<double>(-1, -2, -3), -a_);
  EXPECT_EQ(R3Element<double>(2, 4, 6), 2 * a_);
  EXPECT_EQ(R3Element<double>(2, 4, 6), a_ * 2);
  EXPECT_EQ(R3Element<double>(0.5, 1, 1.5), a_ / 2);

  R3Element<double> c = a_;
  c += b_;
  EXPECT_EQ(a_ + b_, c);
  c -= b_;
  EXPECT_EQ(a_, c);
  c *= 3;
  EXPECT_EQ(R3Element<double>(3, 6, 9), c);
  c /= 3;
  EXPECT_EQ(a_, c);
}

TEST_F(R3ElementTest, Indexing) {
  R3Element<double> c = a_;
  EXPECT_EQ(1, c[0]);
  EXPECT_EQ(2, c[1]);
  EXPECT_EQ(3, c[2]);
  c[1] = 7;
  EXPECT_EQ(7, c.y);
}

TEST_F(R3ElementTest, Products) {
  EXPECT_EQ(7.5, Dot(a_, b_));
  EXPECT_EQ(R3Element<double>(-14, -12.5, 13), Cross(a_, b_));
  EXPECT_EQ(0, Dot(Cross(a_, b_), a_));
  EXPECT_EQ(14, a_.NormSquared());
  EXPECT_EQ(5, R3Element<double>(3, 0, 4).Norm());
}

TEST_F(R3ElementTest, Serialization) {
  serialization::R3Element message;
  b_.WriteToMessage(&message);
  EXPECT_EQ(-4, message.x());
  EXPECT_EQ(5, message.y());
  EXPECT_EQ(0.5, message.z());
  EXPECT_EQ(b_, R3Element<double>::ReadFromMessage(message));
}

TEST_F(R3ElementTest, Output) {
  std::ostringstream out;
  out << b_;
  EXPECT_EQ("{-4, 5, 0.5}", out.str());
}

using R3ElementDeathTest = R3ElementTest;

TEST_F(R3ElementDeathTest, IndexOutOfRange) {
  EXPECT_DEATH({
    R3Element<double> c;
    c[3] = 1;
  }, "Index = 3");
}

}  // namespace geometry
}  // namespace orrery
