#pragma once

#include <string>
#include <vector>

#include "base/not_null.hpp"
#include "geometry/named_quantities.hpp"
#include "physics/body_catalog.hpp"
#include "physics/degrees_of_freedom.hpp"
#include "physics/kepler_orbit.hpp"

namespace orrery {
namespace physics {
namespace internal_celestial {

using base::not_null;
using geometry::Position;
using geometry::Velocity;

// The Hill radius a (1 − e) ∛(m / 3M) of a body of mass m orbiting a parent
// of mass M.
double HillRadius(BodyRecord const& body, BodyRecord const& parent);

// A celestial body of a running system: its record, its orbit, its place in
// the hierarchy, and its state as of the last propagation.
class Celestial final {
 public:
  explicit Celestial(BodyRecord const& record);

  Celestial(Celestial const&) = delete;
  Celestial& operator=(Celestial const&) = delete;

  BodyRecord const& record() const;
  std::string const& id() const;
  double mass() const;

  bool has_parent() const;
  // Null for the primary body.
  Celestial const* parent() const;
  // Also sets the dominance radius and the depth, and adds this body to the
  // children of |parent|.  May only be called once.
  void set_parent(not_null<Celestial*> parent);

  std::vector<not_null<Celestial*>> const& children() const;

  // 0 for the primary body.
  int depth() const;
  // The radius of the sphere within which the gravity of this body dominates
  // that of its parent.  Infinite for the primary body.
  double dominance_radius() const;

  KeplerOrbit& orbit();
  KeplerOrbit const& orbit() const;

  // In the reference frame of the primary body.
  DegreesOfFreedom const& degrees_of_freedom() const;
  void set_degrees_of_freedom(DegreesOfFreedom const& degrees_of_freedom);
  Position const& position() const;
  Velocity const& velocity() const;

 private:
  BodyRecord const record_;
  KeplerOrbit orbit_;
  Celestial const* parent_ = nullptr;
  std::vector<not_null<Celestial*>> children_;
  int depth_ = 0;
  double dominance_radius_;
  DegreesOfFreedom degrees_of_freedom_;
};

}  // namespace internal_celestial

using internal_celestial::Celestial;
using internal_celestial::HillRadius;

}  // namespace physics
}  // namespace orrery
