#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "base/not_null.hpp"
#include "base/thread_pool.hpp"
#include "physics/body_catalog.hpp"
#include "physics/celestial.hpp"

namespace orrery {
namespace physics {
namespace internal_orbital_propagator {

using base::not_null;
using base::ThreadPool;

// Positions the bodies of a catalog as a function of the simulated time.
// Each body is first positioned relative to its parent, independently of the
// other bodies, then the relative states are composed from the primary body
// down.  The primary body is pinned at the origin.
class OrbitalPropagator final {
 public:
  // Positions the bodies at t = 0.
  explicit OrbitalPropagator(BodyCatalog const& catalog);

  // Positions the bodies at the simulated time |t| (days).  The relative
  // states are computed on |pool| if it is not null.  The result doesn't
  // depend on |pool|.
  void Propagate(double t, ThreadPool<void>* pool = nullptr);

  // Parents come before their children, the primary body first.
  std::vector<not_null<std::unique_ptr<Celestial>>> const& bodies() const;
  Celestial const& primary() const;
  // Returns null if there is no body with that id.
  Celestial const* FindBody(std::string_view id) const;

  // The largest distance from the origin of a body at t = 0.
  double system_size() const;

 private:
  void ComposeDegreesOfFreedom();

  std::vector<not_null<std::unique_ptr<Celestial>>> bodies_;
  std::map<std::string, std::int64_t, std::less<>> index_;
  double system_size_ = 0;
};

}  // namespace internal_orbital_propagator

using internal_orbital_propagator::OrbitalPropagator;

}  // namespace physics
}  // namespace orrery
