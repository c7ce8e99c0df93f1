#include "physics/influence.hpp"

#include <deque>

#include "absl/strings/str_join.h"

namespace orrery {
namespace physics {
namespace internal_influence {

bool operator==(Influence const& left, Influence const& right) {
  return left.dominant == right.dominant &&
         left.influencers == right.influencers;
}

std::ostream& operator<<(std::ostream& out, Influence const& influence) {
  return out << "{dominant: " << influence.dominant << ", influencers: ["
             << absl::StrJoin(influence.influencers, ", ") << "]}";
}

InfluenceResolver::InfluenceResolver(OrbitalPropagator const& propagator)
    : propagator_(propagator) {}

Influence InfluenceResolver::Resolve(Position const& position) const {
  Celestial const& primary = propagator_.primary();
  Influence influence;
  influence.dominant = primary.id();
  influence.influencers.push_back(primary.id());

  Celestial const* dominant = &primary;
  double dominant_distance = (primary.position() - position).Norm();
  // Only the children of bodies in the set are examined, so a body is never
  // visited twice.
  std::deque<not_null<Celestial const*>> queue = {&primary};
  while (!queue.empty()) {
    not_null<Celestial const*> const body = queue.front();
    queue.pop_front();
    for (not_null<Celestial const*> const child : body->children()) {
      double const distance = (child->position() - position).Norm();
      if (distance > child->dominance_radius()) {
        continue;
      }
      influence.influencers.push_back(child->id());
      queue.push_back(child);
      if (child->depth() > dominant->depth() ||
          (child->depth() == dominant->depth() &&
           distance < dominant_distance)) {
        dominant = child;
        dominant_distance = distance;
      }
    }
  }
  influence.dominant = dominant->id();
  return influence;
}

std::vector<not_null<Celestial const*>> InfluenceResolver::Influencers(
    Influence const& influence) const {
  std::vector<not_null<Celestial const*>> influencers;
  influencers.reserve(influence.influencers.size());
  for (auto const& id : influence.influencers) {
    if (Celestial const* const body = propagator_.FindBody(id);
        body != nullptr) {
      influencers.push_back(body);
    }
  }
  return influencers;
}

}  // namespace internal_influence
}  // namespace physics
}  // namespace orrery
