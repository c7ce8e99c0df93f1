#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "base/not_null.hpp"
#include "geometry/named_quantities.hpp"
#include "physics/celestial.hpp"
#include "physics/orbital_propagator.hpp"

namespace orrery {
namespace physics {
namespace internal_influence {

using base::not_null;
using geometry::Position;

// The bodies whose gravity acts on a point.
struct Influence final {
  // The innermost body whose dominance sphere contains the point.
  std::string dominant;
  // The primary body, then the bodies whose dominance sphere contains the
  // point and whose parent is in the set, parents before children.  Never
  // empty.
  std::vector<std::string> influencers;

  friend bool operator==(Influence const& left, Influence const& right);
};

std::ostream& operator<<(std::ostream& out, Influence const& influence);

// Determines the |Influence| at a point from the current state of the bodies
// of |propagator|.  The result is only valid until the next propagation.
class InfluenceResolver final {
 public:
  explicit InfluenceResolver(OrbitalPropagator const& propagator);

  Influence Resolve(Position const& position) const;

  // The bodies of |influence|, skipping any that the propagator doesn't know.
  std::vector<not_null<Celestial const*>> Influencers(
      Influence const& influence) const;

 private:
  OrbitalPropagator const& propagator_;
};

}  // namespace internal_influence

using internal_influence::Influence;
using internal_influence::InfluenceResolver;

}  // namespace physics
}  // namespace orrery
