#include "geometry/rotation.hpp"

#include <cmath>

namespace orrery {
namespace geometry {
namespace internal_rotation {

Rotation::Rotation(double const argument_of_periapsis,
                   double const longitude_of_ascending_node,
                   double const inclination) {
  double const cos_ω = std::cos(argument_of_periapsis);
  double const sin_ω = std::sin(argument_of_periapsis);
  double const cos_Ω = std::cos(longitude_of_ascending_node);
  double const sin_Ω = std::sin(longitude_of_ascending_node);
  double const cos_i = std::cos(inclination);
  double const sin_i = std::sin(inclination);
  row_x_ = {cos_ω * cos_Ω - sin_ω * sin_Ω * cos_i,
            -sin_ω * cos_Ω - cos_ω * sin_Ω * cos_i,
            sin_Ω * sin_i};
  row_y_ = {cos_ω * sin_Ω + sin_ω * cos_Ω * cos_i,
            -sin_ω * sin_Ω + cos_ω * cos_Ω * cos_i,
            -cos_Ω * sin_i};
  row_z_ = {sin_ω * sin_i, cos_ω * sin_i, cos_i};
}

R3Element<double> Rotation::operator()(
    R3Element<double> const& r3_element) const {
  return {Dot(row_x_, r3_element),
          Dot(row_y_, r3_element),
          Dot(row_z_, r3_element)};
}

Rotation Rotation::Inverse() const {
  // The matrix is orthogonal.
  return Rotation({row_x_.x, row_y_.x, row_z_.x},
                  {row_x_.y, row_y_.y, row_z_.y},
                  {row_x_.z, row_y_.z, row_z_.z});
}

Rotation::Rotation(R3Element<double> const& row_x,
                   R3Element<double> const& row_y,
                   R3Element<double> const& row_z)
    : row_x_(row_x), row_y_(row_y), row_z_(row_z) {}

}  // namespace internal_rotation
}  // namespace geometry
}  // namespace orrery
