#pragma once

#include <string>

#include "geometry/named_quantities.hpp"
#include "physics/degrees_of_freedom.hpp"
#include "physics/influence.hpp"

namespace orrery {
namespace physics {
namespace internal_ship {

using geometry::Acceleration;
using geometry::Position;
using geometry::Velocity;

// A free-flying ship.  Its motion is integrated by the |ShipIntegrator|; the
// influence and the acceleration are those at the current position.
class Ship final {
 public:
  Ship(std::string id,
       DegreesOfFreedom const& degrees_of_freedom,
       Acceleration const& acceleration);

  std::string const& id() const;

  DegreesOfFreedom const& degrees_of_freedom() const;
  Position const& position() const;
  Velocity const& velocity() const;
  Acceleration const& acceleration() const;
  Influence const& influence() const;

  void set_degrees_of_freedom(DegreesOfFreedom const& degrees_of_freedom);
  void set_position(Position const& position);
  void set_velocity(Velocity const& velocity);
  void set_acceleration(Acceleration const& acceleration);
  void set_influence(Influence influence);

 private:
  std::string const id_;
  DegreesOfFreedom degrees_of_freedom_;
  Acceleration acceleration_;
  Influence influence_;
};

}  // namespace internal_ship

using internal_ship::Ship;

}  // namespace physics
}  // namespace orrery
