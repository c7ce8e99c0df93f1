#include "network/sync_client.hpp"

#include "absl/strings/str_cat.h"
#include "geometry/named_quantities.hpp"
#include "glog/logging.h"
#include "physics/bodies_config.hpp"
#include "physics/ship.hpp"
#include "simulation/commands.hpp"
#include "simulation/snapshot.hpp"

namespace orrery {
namespace network {
namespace internal_sync_client {

using geometry::Acceleration;
using physics::BodiesConfig;
using physics::max_id_length;
using simulation::CreateShip;
using simulation::Snapshot;

std::ostream& operator<<(std::ostream& out, SyncStatus const status) {
  switch (status) {
    case SyncStatus::NotSynced:
      return out << "NotSynced";
    case SyncStatus::Synced:
      return out << "Synced";
  }
  return out << "SyncStatus(" << static_cast<int>(status) << ")";
}

SyncClient::SyncClient(not_null<Simulation*> const simulation,
                       not_null<ClientTransport*> const transport)
    : simulation_(simulation), transport_(transport) {}

void SyncClient::ReceiveMessages() {
  while (std::optional<std::string> const bytes = transport_->Receive()) {
    serialization::ToClient message;
    if (!message.ParseFromString(*bytes)) {
      LOG(WARNING) << "Dropped a malformed message of " << bytes->size()
                   << " bytes";
      continue;
    }
    Handle(message);
  }
}

absl::Status SyncClient::RequestShip(
    std::string const& id,
    DegreesOfFreedom const& degrees_of_freedom) {
  if (id.empty() || id.size() > max_id_length) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid ship id '", id, "'"));
  }
  Acceleration const acceleration =
      simulation_->integrator().ComputeAcceleration(
          degrees_of_freedom.position);
  simulation_->Enqueue(CreateShip{.id = id,
                                  .degrees_of_freedom = degrees_of_freedom,
                                  .acceleration = acceleration});

  serialization::ToServer message;
  auto* const create_ship = message.mutable_create_ship();
  create_ship->set_id(id);
  acceleration.WriteToMessage(create_ship->mutable_acceleration());
  degrees_of_freedom.position.WriteToMessage(create_ship->mutable_position());
  degrees_of_freedom.velocity.WriteToMessage(create_ship->mutable_velocity());
  return transport_->Send(Channel::kReliable, message.SerializeAsString());
}

SyncStatus SyncClient::status() const {
  return status_;
}

std::int64_t SyncClient::dropped_updates() const {
  return dropped_updates_;
}

std::int64_t SyncClient::stale_updates() const {
  return stale_updates_;
}

std::optional<std::uint64_t> SyncClient::last_update_tick() const {
  return last_update_tick_;
}

void SyncClient::Handle(serialization::ToClient const& message) {
  auto& clock = simulation_->clock();
  switch (message.message_case()) {
    case serialization::ToClient::kInitialData: {
      auto const& initial_data = message.initial_data();
      auto const bodies_config =
          BodiesConfig::ReadFromMessage(initial_data.bodies_config());
      if (bodies_config != simulation_->bodies_config()) {
        simulation_->SetBodiesConfig(bodies_config);
      }
      clock.SetRunning(initial_data.clock_running());
      if (absl::Status const status =
              clock.SetStepSize(initial_data.step_size());
          !status.ok()) {
        LOG(WARNING) << "Initial data: " << status;
      }
      status_ = SyncStatus::Synced;
      LOG(INFO) << "Synced with the server: " << bodies_config << ", "
                << (initial_data.clock_running() ? "running" : "paused")
                << ", step size " << initial_data.step_size();
      break;
    }
    case serialization::ToClient::kToggleTime:
      LOG(INFO) << "toggling time";
      clock.SetRunning(message.toggle_time());
      break;
    case serialization::ToClient::kBodiesConfig:
      simulation_->SetBodiesConfig(
          BodiesConfig::ReadFromMessage(message.bodies_config()));
      status_ = SyncStatus::Synced;
      break;
    case serialization::ToClient::kTimeScale:
      if (absl::Status const status = clock.SetStepSize(message.time_scale());
          !status.ok()) {
        LOG(WARNING) << "Time scale: " << status;
      } else {
        LOG(INFO) << "Current timescale = " << message.time_scale();
      }
      break;
    case serialization::ToClient::kPeriodicUpdate: {
      Snapshot const snapshot =
          Snapshot::ReadFromMessage(message.periodic_update());
      if (last_update_tick_.has_value() && snapshot.tick < *last_update_tick_) {
        ++stale_updates_;
        VLOG(1) << "Discarded the update for tick " << snapshot.tick
                << ", already at " << *last_update_tick_;
        break;
      }
      last_update_tick_ = snapshot.tick;
      std::int64_t const skipped = simulation_->ApplySnapshot(snapshot);
      dropped_updates_ += skipped;
      VLOG_IF(1, skipped > 0) << "Skipped " << skipped
                              << " unknown ships at tick " << snapshot.tick;
      break;
    }
    case serialization::ToClient::MESSAGE_NOT_SET:
      LOG(WARNING) << "Empty message from the server";
      break;
  }
}

}  // namespace internal_sync_client
}  // namespace network
}  // namespace orrery
