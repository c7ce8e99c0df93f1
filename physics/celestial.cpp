#include "physics/celestial.hpp"

#include <cmath>
#include <limits>

#include "glog/logging.h"

namespace orrery {
namespace physics {
namespace internal_celestial {

double HillRadius(BodyRecord const& body, BodyRecord const& parent) {
  CHECK_LT(0, parent.mass) << parent.id;
  auto const& elements = body.elements;
  return elements.semimajor_axis * (1 - elements.eccentricity) *
         std::cbrt(body.mass / (3 * parent.mass));
}

Celestial::Celestial(BodyRecord const& record)
    : record_(record),
      orbit_(record.elements),
      dominance_radius_(std::numeric_limits<double>::infinity()) {}

BodyRecord const& Celestial::record() const {
  return record_;
}

std::string const& Celestial::id() const {
  return record_.id;
}

double Celestial::mass() const {
  return record_.mass;
}

bool Celestial::has_parent() const {
  return parent_ != nullptr;
}

Celestial const* Celestial::parent() const {
  return parent_;
}

void Celestial::set_parent(not_null<Celestial*> const parent) {
  CHECK(!has_parent()) << id();
  parent_ = parent;
  parent->children_.push_back(this);
  depth_ = parent->depth_ + 1;
  dominance_radius_ = HillRadius(record_, parent->record_);
}

std::vector<not_null<Celestial*>> const& Celestial::children() const {
  return children_;
}

int Celestial::depth() const {
  return depth_;
}

double Celestial::dominance_radius() const {
  return dominance_radius_;
}

KeplerOrbit& Celestial::orbit() {
  return orbit_;
}

KeplerOrbit const& Celestial::orbit() const {
  return orbit_;
}

DegreesOfFreedom const& Celestial::degrees_of_freedom() const {
  return degrees_of_freedom_;
}

void Celestial::set_degrees_of_freedom(
    DegreesOfFreedom const& degrees_of_freedom) {
  degrees_of_freedom_ = degrees_of_freedom;
}

Position const& Celestial::position() const {
  return degrees_of_freedom_.position;
}

Velocity const& Celestial::velocity() const {
  return degrees_of_freedom_.velocity;
}

}  // namespace internal_celestial
}  // namespace physics
}  // namespace orrery
