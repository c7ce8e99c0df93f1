#pragma once

#include <cstdint>
#include <iosfwd>

#include "geometry/r3_element.hpp"
#include "gmock/gmock-matchers.h"
#include "gmock/gmock.h"
#include "physics/degrees_of_freedom.hpp"

namespace orrery {
namespace testing_utilities {
namespace internal_almost_equals {

template<typename T>
class AlmostEqualsMatcher;

// The distance between |x| and |y| in units in the last place.  Infinite if
// they don't have the same sign.
std::int64_t ULPDistance(double x, double y);

// Matches values within |max_ulps| of |expected|.  For vectors and degrees of
// freedom, applies to the component with the largest error.
template<typename T>
testing::PolymorphicMatcher<AlmostEqualsMatcher<T>> AlmostEquals(
    T const& expected,
    std::int64_t max_ulps);

template<typename T>
class AlmostEqualsMatcher final {
 public:
  AlmostEqualsMatcher(T const& expected, std::int64_t max_ulps);

  bool MatchAndExplain(double actual,
                       testing::MatchResultListener* listener) const;
  bool MatchAndExplain(geometry::R3Element<double> const& actual,
                       testing::MatchResultListener* listener) const;
  bool MatchAndExplain(physics::DegreesOfFreedom const& actual,
                       testing::MatchResultListener* listener) const;

  void DescribeTo(std::ostream* out) const;
  void DescribeNegationTo(std::ostream* out) const;

 private:
  bool Explain(std::int64_t distance,
               testing::MatchResultListener* listener) const;

  T const expected_;
  std::int64_t const max_ulps_;
};

}  // namespace internal_almost_equals

using internal_almost_equals::AlmostEquals;
using internal_almost_equals::ULPDistance;

}  // namespace testing_utilities
}  // namespace orrery

#include "testing_utilities/almost_equals_body.hpp"
