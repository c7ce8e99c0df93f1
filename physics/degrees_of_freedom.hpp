#pragma once

#include <ostream>
#include <string>

#include "absl/strings/str_cat.h"
#include "geometry/named_quantities.hpp"

namespace orrery {
namespace physics {
namespace internal_degrees_of_freedom {

using geometry::Position;
using geometry::Velocity;

struct DegreesOfFreedom final {
  Position position;
  Velocity velocity;
};

// Composes a state relative to a parent with the state of the parent.
inline DegreesOfFreedom operator+(DegreesOfFreedom const& left,
                                  DegreesOfFreedom const& right) {
  return {left.position + right.position, left.velocity + right.velocity};
}

inline bool operator==(DegreesOfFreedom const& left,
                       DegreesOfFreedom const& right) {
  return left.position == right.position && left.velocity == right.velocity;
}

inline bool operator!=(DegreesOfFreedom const& left,
                       DegreesOfFreedom const& right) {
  return !(left == right);
}

inline std::string DebugString(DegreesOfFreedom const& degrees_of_freedom) {
  return absl::StrCat("{", DebugString(degrees_of_freedom.position), ", ",
                      DebugString(degrees_of_freedom.velocity), "}");
}

inline std::ostream& operator<<(std::ostream& out,
                                DegreesOfFreedom const& degrees_of_freedom) {
  return out << DebugString(degrees_of_freedom);
}

}  // namespace internal_degrees_of_freedom

using internal_degrees_of_freedom::DegreesOfFreedom;

}  // namespace physics
}  // namespace orrery
