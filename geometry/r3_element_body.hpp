#pragma once

#include "geometry/r3_element.hpp"

#include <cmath>
#include <ostream>
#include <string>

#include "absl/strings/str_cat.h"
#include "base/macros.hpp"
#include "glog/logging.h"

namespace orrery {
namespace geometry {
namespace internal_r3_element {

template<typename Scalar>
constexpr R3Element<Scalar>::R3Element() : x(), y(), z() {}

template<typename Scalar>
constexpr R3Element<Scalar>::R3Element(Scalar const& x,
                                       Scalar const& y,
                                       Scalar const& z)
    : x(x), y(y), z(z) {}

template<typename Scalar>
Scalar& R3Element<Scalar>::operator[](int const index) {
  switch (index) {
    case 0:
      return x;
    case 1:
      return y;
    case 2:
      return z;
    default:
      LOG(FATAL) << "Index = " << index;
      base::noreturn();
  }
}

template<typename Scalar>
Scalar const& R3Element<Scalar>::operator[](int const index) const {
  switch (index) {
    case 0:
      return x;
    case 1:
      return y;
    case 2:
      return z;
    default:
      LOG(FATAL) << "Index = " << index;
      base::noreturn();
  }
}

template<typename Scalar>
R3Element<Scalar>& R3Element<Scalar>::operator+=(R3Element const& right) {
  return *this = *this + right;
}

template<typename Scalar>
R3Element<Scalar>& R3Element<Scalar>::operator-=(R3Element const& right) {
  return *this = *this - right;
}

template<typename Scalar>
R3Element<Scalar>& R3Element<Scalar>::operator*=(double const right) {
  return *this = *this * right;
}

template<typename Scalar>
R3Element<Scalar>& R3Element<Scalar>::operator/=(double const right) {
  return *this = *this / right;
}

template<typename Scalar>
Scalar R3Element<Scalar>::Norm() const {
  return std::sqrt(NormSquared());
}

template<typename Scalar>
Scalar R3Element<Scalar>::NormSquared() const {
  return x * x + y * y + z * z;
}

template<typename Scalar>
void R3Element<Scalar>::WriteToMessage(
    not_null<serialization::R3Element*> const message) const {
  message->set_x(x);
  message->set_y(y);
  message->set_z(z);
}

template<typename Scalar>
R3Element<Scalar> R3Element<Scalar>::ReadFromMessage(
    serialization::R3Element const& message) {
  return {message.x(), message.y(), message.z()};
}

template<typename Scalar>
constexpr R3Element<Scalar> operator+(R3Element<Scalar> const& right) {
  return right;
}

template<typename Scalar>
constexpr R3Element<Scalar> operator-(R3Element<Scalar> const& right) {
  return {-right.x, -right.y, -right.z};
}

template<typename Scalar>
constexpr R3Element<Scalar> operator+(R3Element<Scalar> const& left,
                                      R3Element<Scalar> const& right) {
  return {left.x + right.x, left.y + right.y, left.z + right.z};
}

template<typename Scalar>
constexpr R3Element<Scalar> operator-(R3Element<Scalar> const& left,
                                      R3Element<Scalar> const& right) {
  return {left.x - right.x, left.y - right.y, left.z - right.z};
}

template<typename Scalar>
constexpr R3Element<Scalar> operator*(double const left,
                                      R3Element<Scalar> const& right) {
  return {left * right.x, left * right.y, left * right.z};
}

template<typename Scalar>
constexpr R3Element<Scalar> operator*(R3Element<Scalar> const& left,
                                      double const right) {
  return {left.x * right, left.y * right, left.z * right};
}

template<typename Scalar>
constexpr R3Element<Scalar> operator/(R3Element<Scalar> const& left,
                                      double const right) {
  return {left.x / right, left.y / right, left.z / right};
}

template<typename Scalar>
constexpr bool operator==(R3Element<Scalar> const& left,
                          R3Element<Scalar> const& right) {
  return left.x == right.x && left.y == right.y && left.z == right.z;
}

template<typename Scalar>
constexpr bool operator!=(R3Element<Scalar> const& left,
                          R3Element<Scalar> const& right) {
  return !(left == right);
}

template<typename Scalar>
Scalar Dot(R3Element<Scalar> const& left, R3Element<Scalar> const& right) {
  return left.x * right.x + left.y * right.y + left.z * right.z;
}

template<typename Scalar>
R3Element<Scalar> Cross(R3Element<Scalar> const& left,
                        R3Element<Scalar> const& right) {
  return {left.y * right.z - left.z * right.y,
          left.z * right.x - left.x * right.z,
          left.x * right.y - left.y * right.x};
}

template<typename Scalar>
std::string DebugString(R3Element<Scalar> const& r3_element) {
  return absl::StrCat(
      "{", r3_element.x, ", ", r3_element.y, ", ", r3_element.z, "}");
}

template<typename Scalar>
std::ostream& operator<<(std::ostream& out,
                         R3Element<Scalar> const& r3_element) {
  return out << DebugString(r3_element);
}

}  // namespace internal_r3_element
}  // namespace geometry
}  // namespace orrery
