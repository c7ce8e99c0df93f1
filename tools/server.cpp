#include "tools/server.hpp"

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <utility>

#include "absl/time/clock.h"
#include "absl/time/time.h"
#include "base/status_utilities.hpp"
#include "base/thread_pool.hpp"
#include "glog/logging.h"
#include "network/socket_transport.hpp"
#include "network/sync_server.hpp"
#include "simulation/fixed_step_scheduler.hpp"
#include "simulation/game_state.hpp"
#include "simulation/simulation.hpp"
#include "tools/configuration.hpp"
#include "tools/console.hpp"
#include "tools/line_reader.hpp"

namespace orrery {
namespace tools {

using base::ThreadPool;
using network::SocketServerTransport;
using network::SyncServer;
using simulation::ClientMode;
using simulation::FixedStepScheduler;
using simulation::Simulation;

// More steps than this in a single iteration are dropped.
constexpr std::int64_t max_steps_per_update = 8;

absl::Status RunServer(serialization::Configuration const& configuration) {
  auto catalog = ReadCatalog(configuration);
  RETURN_IF_ERROR(catalog.status());
  ThreadPool<void> pool(GetWorkerThreads(configuration));
  Simulation simulation(std::move(catalog).value(),
                        GetBodiesConfig(configuration),
                        &pool);
  simulation.SetClientMode(ClientMode::Server);
  RETURN_IF_ERROR(simulation.clock().SetStepSize(configuration.step_size()));

  auto transport = SocketServerTransport::Listen(
      configuration.server_address(),
      static_cast<std::uint16_t>(configuration.server_port()));
  RETURN_IF_ERROR(transport.status());
  SyncServer sync_server(&simulation,
                         transport->get(),
                         GetUpdatePeriod(configuration));

  FixedStepScheduler scheduler(GetTickPeriod(configuration),
                               max_steps_per_update);
  LineReader line_reader(std::cin);
  Console console(&simulation, std::cout);
  LOG(INFO) << "Serving " << simulation.propagator().bodies().size()
            << " bodies, system size "
            << simulation.propagator().system_size() << " km";

  absl::Time last_iteration = absl::Now();
  for (;;) {
    while (std::optional<std::string> const line = line_reader.Next()) {
      console.Execute(*line);
    }
    absl::Time const now = absl::Now();
    absl::Duration const elapsed = now - last_iteration;
    last_iteration = now;

    std::int64_t const steps = scheduler.Update(elapsed);
    for (std::int64_t i = 0; i < steps; ++i) {
      sync_server.ReceiveMessages();
      simulation.Step();
      sync_server.BroadcastChanges();
    }
    sync_server.SendPeriodicUpdate(elapsed);
    absl::SleepFor(
        std::min(scheduler.TimeToNextStep(), GetUpdatePeriod(configuration)));
  }
}

}  // namespace tools
}  // namespace orrery
