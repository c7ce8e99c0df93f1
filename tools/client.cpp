#include "tools/client.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <memory>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "base/status_utilities.hpp"
#include "base/thread_pool.hpp"
#include "glog/logging.h"
#include "network/socket_transport.hpp"
#include "network/sync_client.hpp"
#include "simulation/fixed_step_scheduler.hpp"
#include "simulation/simulation.hpp"
#include "tools/configuration.hpp"
#include "tools/console.hpp"
#include "tools/line_reader.hpp"

namespace orrery {
namespace tools {

using base::ThreadPool;
using network::SocketClientTransport;
using network::SyncClient;
using network::SyncStatus;
using physics::DegreesOfFreedom;
using simulation::ClientMode;
using simulation::FixedStepScheduler;
using simulation::GameStage;
using simulation::Simulation;

constexpr std::int64_t max_steps_per_update = 8;

absl::Status RunClient(ClientMode const mode,
                       serialization::Configuration const& configuration) {
  if (mode != ClientMode::Singleplayer && mode != ClientMode::Multiplayer &&
      mode != ClientMode::Explorer) {
    return absl::InvalidArgumentError(
        absl::StrCat("Not a client mode: ", static_cast<int>(mode)));
  }
  auto catalog = ReadCatalog(configuration);
  RETURN_IF_ERROR(catalog.status());
  ThreadPool<void> pool(GetWorkerThreads(configuration));
  Simulation simulation(std::move(catalog).value(),
                        GetBodiesConfig(configuration),
                        &pool);
  RETURN_IF_ERROR(simulation.clock().SetStepSize(configuration.step_size()));
  simulation.SetClientMode(mode);

  std::unique_ptr<SocketClientTransport> transport;
  std::unique_ptr<SyncClient> sync_client;
  Console::ShipCreator create_ship;
  if (mode == ClientMode::Multiplayer) {
    auto connected = SocketClientTransport::Connect(
        configuration.server_address(),
        static_cast<std::uint16_t>(configuration.server_port()),
        configuration.client_address(),
        static_cast<std::uint16_t>(configuration.client_port()));
    RETURN_IF_ERROR(connected.status());
    transport = std::move(connected).value();
    sync_client = std::make_unique<SyncClient>(&simulation, transport.get());
    create_ship = [&sync_client](std::string const& id,
                                 DegreesOfFreedom const& dof) {
      if (absl::Status const status = sync_client->RequestShip(id, dof);
          !status.ok()) {
        LOG(WARNING) << "Ship " << id << ": " << status;
      }
    };
  } else if (mode == ClientMode::Singleplayer) {
    simulation.SetGameStage(GameStage::Action);
  }

  FixedStepScheduler scheduler(GetTickPeriod(configuration),
                               max_steps_per_update);
  LineReader line_reader(std::cin);
  Console console(&simulation, std::cout, std::move(create_ship));
  LOG(INFO) << "Running in mode " << mode << " with "
            << simulation.propagator().bodies().size() << " bodies";

  SyncStatus last_status = SyncStatus::NotSynced;
  absl::Time last_iteration = absl::Now();
  for (;;) {
    while (std::optional<std::string> const line = line_reader.Next()) {
      console.Execute(*line);
    }
    absl::Time const now = absl::Now();
    std::int64_t const steps = scheduler.Update(now - last_iteration);
    last_iteration = now;

    for (std::int64_t i = 0; i < steps; ++i) {
      if (sync_client != nullptr) {
        sync_client->ReceiveMessages();
        if (sync_client->status() != last_status) {
          last_status = sync_client->status();
          LOG(INFO) << "Sync status " << last_status;
        }
        if (!transport->connected()) {
          return absl::UnavailableError("Disconnected from the server");
        }
      }
      simulation.Step();
    }
    absl::SleepFor(scheduler.TimeToNextStep());
  }
}

}  // namespace tools
}  // namespace orrery
