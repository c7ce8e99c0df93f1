#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "absl/status/status.h"
#include "base/not_null.hpp"
#include "network/transport.hpp"
#include "physics/degrees_of_freedom.hpp"
#include "serialization/network.pb.h"
#include "simulation/simulation.hpp"

namespace orrery {
namespace network {
namespace internal_sync_client {

using base::not_null;
using physics::DegreesOfFreedom;
using simulation::Simulation;

enum class SyncStatus {
  // No |InitialData| received yet.
  NotSynced,
  Synced,
};

std::ostream& operator<<(std::ostream& out, SyncStatus status);

// The replica end of the synchronization protocol.  It mirrors into
// |simulation| the state received from the server.  The clock of the replica
// keeps ticking locally between periodic updates, which correct it.
class SyncClient final {
 public:
  SyncClient(not_null<Simulation*> simulation,
             not_null<ClientTransport*> transport);

  // Applies the messages received since the last call.  Call before
  // |Simulation::Step|.
  void ReceiveMessages();

  // Creates a ship locally and asks the server to create it.  The acceleration
  // sent to the server is the one computed locally.
  absl::Status RequestShip(std::string const& id,
                           DegreesOfFreedom const& degrees_of_freedom);

  SyncStatus status() const;

  // The number of ship states of periodic updates that were skipped because
  // the ship doesn't exist locally.
  std::int64_t dropped_updates() const;
  // The number of periodic updates discarded because they were older than an
  // update already applied.
  std::int64_t stale_updates() const;
  // The tick of the last periodic update applied, if any.
  std::optional<std::uint64_t> last_update_tick() const;

 private:
  void Handle(serialization::ToClient const& message);

  not_null<Simulation*> const simulation_;
  not_null<ClientTransport*> const transport_;
  SyncStatus status_ = SyncStatus::NotSynced;
  std::int64_t dropped_updates_ = 0;
  std::int64_t stale_updates_ = 0;
  std::optional<std::uint64_t> last_update_tick_;
};

}  // namespace internal_sync_client

using internal_sync_client::SyncClient;
using internal_sync_client::SyncStatus;

}  // namespace network
}  // namespace orrery
