#include "physics/ship.hpp"

#include <utility>

#include "glog/logging.h"
#include "physics/body_catalog.hpp"

namespace orrery {
namespace physics {
namespace internal_ship {

Ship::Ship(std::string id,
           DegreesOfFreedom const& degrees_of_freedom,
           Acceleration const& acceleration)
    : id_(std::move(id)),
      degrees_of_freedom_(degrees_of_freedom),
      acceleration_(acceleration) {
  CHECK(!id_.empty());
  CHECK_LE(id_.size(), max_id_length) << id_;
}

std::string const& Ship::id() const {
  return id_;
}

DegreesOfFreedom const& Ship::degrees_of_freedom() const {
  return degrees_of_freedom_;
}

Position const& Ship::position() const {
  return degrees_of_freedom_.position;
}

Velocity const& Ship::velocity() const {
  return degrees_of_freedom_.velocity;
}

Acceleration const& Ship::acceleration() const {
  return acceleration_;
}

Influence const& Ship::influence() const {
  return influence_;
}

void Ship::set_degrees_of_freedom(DegreesOfFreedom const& degrees_of_freedom) {
  degrees_of_freedom_ = degrees_of_freedom;
}

void Ship::set_position(Position const& position) {
  degrees_of_freedom_.position = position;
}

void Ship::set_velocity(Velocity const& velocity) {
  degrees_of_freedom_.velocity = velocity;
}

void Ship::set_acceleration(Acceleration const& acceleration) {
  acceleration_ = acceleration;
}

void Ship::set_influence(Influence influence) {
  influence_ = std::move(influence);
}

}  // namespace internal_ship
}  // namespace physics
}  // namespace orrery
