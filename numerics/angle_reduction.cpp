#include "numerics/angle_reduction.hpp"

#include <cmath>

namespace orrery {
namespace numerics {
namespace internal_angle_reduction {

double ReduceAngle(double const angle) {
  double reduced = std::fmod(angle + 180, 360);
  if (reduced < 0) {
    reduced += 360;
  }
  return reduced - 180;
}

}  // namespace internal_angle_reduction
}  // namespace numerics
}  // namespace orrery
