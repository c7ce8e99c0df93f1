#pragma once

#include "geometry/r3_element.hpp"

namespace orrery {
namespace geometry {
namespace internal_rotation {

// The 3-1-3 Euler rotation that maps the axes of an orbital plane (x towards
// the periapsis, z along the angular momentum) to the reference axes.  The
// angles are in radians.
class Rotation final {
 public:
  Rotation(double argument_of_periapsis,
           double longitude_of_ascending_node,
           double inclination);

  R3Element<double> operator()(R3Element<double> const& r3_element) const;

  Rotation Inverse() const;

 private:
  Rotation(R3Element<double> const& row_x,
           R3Element<double> const& row_y,
           R3Element<double> const& row_z);

  R3Element<double> row_x_;
  R3Element<double> row_y_;
  R3Element<double> row_z_;
};

}  // namespace internal_rotation

using internal_rotation::Rotation;

}  // namespace geometry
}  // namespace orrery
