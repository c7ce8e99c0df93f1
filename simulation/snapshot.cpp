#include "simulation/snapshot.hpp"

#include "geometry/r3_element.hpp"

namespace orrery {
namespace simulation {
namespace internal_snapshot {

using geometry::Position;
using geometry::Velocity;

void Snapshot::WriteToMessage(
    not_null<serialization::PeriodicUpdate*> const message) const {
  message->Clear();
  message->set_tick(tick);
  for (auto const& ship : ships) {
    auto* const ship_message = message->add_ship();
    ship_message->set_id(ship.id);
    ship.degrees_of_freedom.position.WriteToMessage(
        ship_message->mutable_position());
    ship.degrees_of_freedom.velocity.WriteToMessage(
        ship_message->mutable_velocity());
  }
}

Snapshot Snapshot::ReadFromMessage(
    serialization::PeriodicUpdate const& message) {
  Snapshot snapshot;
  snapshot.tick = message.tick();
  snapshot.ships.reserve(message.ship_size());
  for (auto const& ship : message.ship()) {
    snapshot.ships.push_back(
        {ship.id(),
         {Position::ReadFromMessage(ship.position()),
          Velocity::ReadFromMessage(ship.velocity())}});
  }
  return snapshot;
}

}  // namespace internal_snapshot
}  // namespace simulation
}  // namespace orrery
