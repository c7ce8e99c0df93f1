#pragma once

#include <iosfwd>
#include <string>

#include "base/not_null.hpp"
#include "serialization/geometry.pb.h"

namespace orrery {
namespace geometry {
namespace internal_r3_element {

using base::not_null;

// An element of R³.  The components are public since this is the basic
// coordinate type; there is no frame tag, every vector in the system is
// expressed in the inertial axes of the primary body.
template<typename Scalar>
struct R3Element final {
  constexpr R3Element();
  constexpr R3Element(Scalar const& x, Scalar const& y, Scalar const& z);

  Scalar& operator[](int index);
  Scalar const& operator[](int index) const;

  R3Element& operator+=(R3Element const& right);
  R3Element& operator-=(R3Element const& right);
  R3Element& operator*=(double right);
  R3Element& operator/=(double right);

  Scalar Norm() const;
  Scalar NormSquared() const;

  void WriteToMessage(not_null<serialization::R3Element*> message) const;
  static R3Element ReadFromMessage(serialization::R3Element const& message);

  Scalar x;
  Scalar y;
  Scalar z;
};

template<typename Scalar>
constexpr R3Element<Scalar> operator+(R3Element<Scalar> const& right);
template<typename Scalar>
constexpr R3Element<Scalar> operator-(R3Element<Scalar> const& right);

template<typename Scalar>
constexpr R3Element<Scalar> operator+(R3Element<Scalar> const& left,
                                      R3Element<Scalar> const& right);
template<typename Scalar>
constexpr R3Element<Scalar> operator-(R3Element<Scalar> const& left,
                                      R3Element<Scalar> const& right);

template<typename Scalar>
constexpr R3Element<Scalar> operator*(double left,
                                      R3Element<Scalar> const& right);
template<typename Scalar>
constexpr R3Element<Scalar> operator*(R3Element<Scalar> const& left,
                                      double right);
template<typename Scalar>
constexpr R3Element<Scalar> operator/(R3Element<Scalar> const& left,
                                      double right);

template<typename Scalar>
constexpr bool operator==(R3Element<Scalar> const& left,
                          R3Element<Scalar> const& right);
template<typename Scalar>
constexpr bool operator!=(R3Element<Scalar> const& left,
                          R3Element<Scalar> const& right);

template<typename Scalar>
Scalar Dot(R3Element<Scalar> const& left, R3Element<Scalar> const& right);

template<typename Scalar>
R3Element<Scalar> Cross(R3Element<Scalar> const& left,
                        R3Element<Scalar> const& right);

template<typename Scalar>
std::string DebugString(R3Element<Scalar> const& r3_element);

template<typename Scalar>
std::ostream& operator<<(std::ostream& out,
                         R3Element<Scalar> const& r3_element);

}  // namespace internal_r3_element

using internal_r3_element::Cross;
using internal_r3_element::DebugString;
using internal_r3_element::Dot;
using internal_r3_element::R3Element;

}  // namespace geometry
}  // namespace orrery

#include "geometry/r3_element_body.hpp"
