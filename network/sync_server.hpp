#pragma once

#include <cstdint>

#include "absl/time/time.h"
#include "base/not_null.hpp"
#include "network/transport.hpp"
#include "physics/bodies_config.hpp"
#include "serialization/network.pb.h"
#include "simulation/simulation.hpp"

namespace orrery {
namespace network {
namespace internal_sync_server {

using base::not_null;
using physics::BodiesConfig;
using simulation::Simulation;

// The authoritative end of the synchronization protocol.  It replicates the
// state of |simulation| to the clients of |transport|: the clock and the
// bodies config on the reliable channel whenever they change, the ships on the
// unreliable channel every |update_period| of wall-clock time.
//
// A tick of the server runs |ReceiveMessages|, |Simulation::Step|,
// |BroadcastChanges| and |SendPeriodicUpdate| in that order.
class SyncServer final {
 public:
  SyncServer(not_null<Simulation*> simulation,
             not_null<ServerTransport*> transport,
             absl::Duration update_period);

  // Greets the new clients with an |InitialData| and enqueues the commands
  // received since the last call.
  void ReceiveMessages();

  // Sends |ToggleTime|, |TimeScale| and |BodiesConfig| for whatever changed
  // since the last call.
  void BroadcastChanges();

  // Adds |elapsed| to the time since the last periodic update, and sends one
  // if a full period has elapsed.  At most one update is sent per call.
  // Returns true if an update was sent.
  bool SendPeriodicUpdate(absl::Duration elapsed);

  std::int64_t periodic_updates_sent() const;
  std::int64_t malformed_messages() const;

 private:
  void Broadcast(Channel channel, serialization::ToClient const& message);
  void Handle(ClientId client, serialization::ToServer const& message);

  not_null<Simulation*> const simulation_;
  not_null<ServerTransport*> const transport_;
  absl::Duration const update_period_;

  // The state last sent to the clients.
  bool running_;
  std::uint64_t step_size_;
  BodiesConfig bodies_config_;

  absl::Duration since_last_update_ = absl::ZeroDuration();
  std::int64_t periodic_updates_sent_ = 0;
  std::int64_t malformed_messages_ = 0;
};

}  // namespace internal_sync_server

using internal_sync_server::SyncServer;

}  // namespace network
}  // namespace orrery
