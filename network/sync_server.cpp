#include "network/sync_server.hpp"

#include <optional>
#include <string>

#include "geometry/named_quantities.hpp"
#include "glog/logging.h"
#include "physics/degrees_of_freedom.hpp"
#include "simulation/commands.hpp"
#include "simulation/snapshot.hpp"

namespace orrery {
namespace network {
namespace internal_sync_server {

using geometry::Acceleration;
using geometry::Position;
using geometry::Velocity;
using physics::DegreesOfFreedom;
using simulation::CreateShip;
using simulation::Snapshot;

SyncServer::SyncServer(not_null<Simulation*> const simulation,
                       not_null<ServerTransport*> const transport,
                       absl::Duration const update_period)
    : simulation_(simulation),
      transport_(transport),
      update_period_(update_period),
      running_(simulation->clock().running()),
      step_size_(simulation->clock().step_size()),
      bodies_config_(simulation->bodies_config()) {
  CHECK_LT(absl::ZeroDuration(), update_period_);
}

void SyncServer::ReceiveMessages() {
  for (ConnectionEvent const& event : transport_->PollConnectionEvents()) {
    switch (event.kind) {
      case ConnectionEvent::Kind::kConnected: {
        LOG(INFO) << "Client " << event.client << " connected";
        serialization::ToClient message;
        auto* const initial_data = message.mutable_initial_data();
        bodies_config_.WriteToMessage(initial_data->mutable_bodies_config());
        initial_data->set_clock_running(running_);
        initial_data->set_step_size(step_size_);
        if (absl::Status const status =
                transport_->Send(event.client,
                                 Channel::kReliable,
                                 message.SerializeAsString());
            !status.ok()) {
          LOG(WARNING) << "Initial data for client " << event.client << ": "
                       << status;
        }
        break;
      }
      case ConnectionEvent::Kind::kDisconnected:
        LOG(INFO) << "Client " << event.client << " disconnected";
        break;
    }
  }

  while (std::optional<ReceivedMessage> received = transport_->Receive()) {
    serialization::ToServer message;
    if (!message.ParseFromString(received->bytes)) {
      ++malformed_messages_;
      LOG(WARNING) << "Dropped a malformed message of "
                   << received->bytes.size() << " bytes from client "
                   << received->client;
      continue;
    }
    Handle(received->client, message);
  }
}

void SyncServer::BroadcastChanges() {
  auto const& clock = simulation_->clock();
  if (clock.running() != running_) {
    running_ = clock.running();
    serialization::ToClient message;
    message.set_toggle_time(running_);
    Broadcast(Channel::kReliable, message);
  }
  if (clock.step_size() != step_size_) {
    step_size_ = clock.step_size();
    serialization::ToClient message;
    message.set_time_scale(step_size_);
    Broadcast(Channel::kReliable, message);
  }
  if (simulation_->bodies_config() != bodies_config_) {
    bodies_config_ = simulation_->bodies_config();
    serialization::ToClient message;
    bodies_config_.WriteToMessage(message.mutable_bodies_config());
    Broadcast(Channel::kReliable, message);
  }
}

bool SyncServer::SendPeriodicUpdate(absl::Duration const elapsed) {
  since_last_update_ += elapsed;
  if (since_last_update_ < update_period_) {
    return false;
  }
  // Updates that are late are not caught up.
  since_last_update_ %= update_period_;
  serialization::ToClient message;
  simulation_->MakeSnapshot().WriteToMessage(
      message.mutable_periodic_update());
  Broadcast(Channel::kUnreliable, message);
  ++periodic_updates_sent_;
  return true;
}

std::int64_t SyncServer::periodic_updates_sent() const {
  return periodic_updates_sent_;
}

std::int64_t SyncServer::malformed_messages() const {
  return malformed_messages_;
}

void SyncServer::Broadcast(Channel const channel,
                           serialization::ToClient const& message) {
  VLOG(2) << "Broadcasting on " << channel << ": "
          << message.ShortDebugString();
  transport_->Broadcast(channel, message.SerializeAsString());
}

void SyncServer::Handle(ClientId const client,
                        serialization::ToServer const& message) {
  switch (message.message_case()) {
    case serialization::ToServer::kCreateShip: {
      auto const& create_ship = message.create_ship();
      VLOG(1) << "Client " << client << " creates ship " << create_ship.id();
      simulation_->Enqueue(CreateShip{
          .id = create_ship.id(),
          .degrees_of_freedom =
              {Position::ReadFromMessage(create_ship.position()),
               Velocity::ReadFromMessage(create_ship.velocity())},
          .acceleration =
              Acceleration::ReadFromMessage(create_ship.acceleration())});
      break;
    }
    case serialization::ToServer::MESSAGE_NOT_SET:
      ++malformed_messages_;
      LOG(WARNING) << "Empty message from client " << client;
      break;
  }
}

}  // namespace internal_sync_server
}  // namespace network
}  // namespace orrery
