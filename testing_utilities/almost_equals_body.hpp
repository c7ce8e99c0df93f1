#pragma once

#include "testing_utilities/almost_equals.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <limits>
#include <ostream>
#include <type_traits>

#include "glog/logging.h"

namespace orrery {
namespace testing_utilities {
namespace internal_almost_equals {

inline std::int64_t ULPDistance(double const x, double const y) {
  if (x == y) {
    return 0;
  }
  if (std::isnan(x) || std::isnan(y) || std::signbit(x) != std::signbit(y)) {
    return std::numeric_limits<std::int64_t>::max();
  }
  std::int64_t const x_bits = std::bit_cast<std::int64_t>(x);
  std::int64_t const y_bits = std::bit_cast<std::int64_t>(y);
  return x_bits > y_bits ? x_bits - y_bits : y_bits - x_bits;
}

template<typename T>
testing::PolymorphicMatcher<AlmostEqualsMatcher<T>> AlmostEquals(
    T const& expected,
    std::int64_t const max_ulps) {
  return testing::MakePolymorphicMatcher(
      AlmostEqualsMatcher<T>(expected, max_ulps));
}

template<typename T>
AlmostEqualsMatcher<T>::AlmostEqualsMatcher(T const& expected,
                                            std::int64_t const max_ulps)
    : expected_(expected), max_ulps_(max_ulps) {
  CHECK_LE(0, max_ulps_);
}

template<typename T>
bool AlmostEqualsMatcher<T>::MatchAndExplain(
    double const actual,
    testing::MatchResultListener* listener) const {
  if constexpr (std::is_same_v<T, double>) {
    return Explain(ULPDistance(actual, expected_), listener);
  } else {
    return false;
  }
}

template<typename T>
bool AlmostEqualsMatcher<T>::MatchAndExplain(
    geometry::R3Element<double> const& actual,
    testing::MatchResultListener* listener) const {
  if constexpr (std::is_same_v<T, geometry::R3Element<double>>) {
    std::int64_t const distance =
        std::max({ULPDistance(actual.x, expected_.x),
                  ULPDistance(actual.y, expected_.y),
                  ULPDistance(actual.z, expected_.z)});
    return Explain(distance, listener);
  } else {
    return false;
  }
}

template<typename T>
bool AlmostEqualsMatcher<T>::MatchAndExplain(
    physics::DegreesOfFreedom const& actual,
    testing::MatchResultListener* listener) const {
  if constexpr (std::is_same_v<T, physics::DegreesOfFreedom>) {
    std::int64_t const distance = std::max(
        {ULPDistance(actual.position.x, expected_.position.x),
         ULPDistance(actual.position.y, expected_.position.y),
         ULPDistance(actual.position.z, expected_.position.z),
         ULPDistance(actual.velocity.x, expected_.velocity.x),
         ULPDistance(actual.velocity.y, expected_.velocity.y),
         ULPDistance(actual.velocity.z, expected_.velocity.z)});
    return Explain(distance, listener);
  } else {
    return false;
  }
}

template<typename T>
void AlmostEqualsMatcher<T>::DescribeTo(std::ostream* const out) const {
  *out << "is within " << max_ulps_ << " ULPs of " << expected_;
}

template<typename T>
void AlmostEqualsMatcher<T>::DescribeNegationTo(
    std::ostream* const out) const {
  *out << "is not within " << max_ulps_ << " ULPs of " << expected_;
}

template<typename T>
bool AlmostEqualsMatcher<T>::Explain(
    std::int64_t const distance,
    testing::MatchResultListener* const listener) const {
  *listener << "the numbers are separated by " << distance << " ULPs";
  return distance <= max_ulps_;
}

}  // namespace internal_almost_equals
}  // namespace testing_utilities
}  // namespace orrery
