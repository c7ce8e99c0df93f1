#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "base/not_null.hpp"
#include "physics/degrees_of_freedom.hpp"
#include "serialization/network.pb.h"

namespace orrery {
namespace simulation {
namespace internal_snapshot {

using base::not_null;
using physics::DegreesOfFreedom;

struct ShipSnapshot final {
  std::string id;
  DegreesOfFreedom degrees_of_freedom;
};

// The kinematic state of the ships at a tick.  Bodies are not included, every
// peer computes them from the tick.
struct Snapshot final {
  std::uint64_t tick = 0;
  // Ordered by id.
  std::vector<ShipSnapshot> ships;

  void WriteToMessage(not_null<serialization::PeriodicUpdate*> message) const;
  static Snapshot ReadFromMessage(serialization::PeriodicUpdate const& message);
};

}  // namespace internal_snapshot

using internal_snapshot::ShipSnapshot;
using internal_snapshot::Snapshot;

}  // namespace simulation
}  // namespace orrery
