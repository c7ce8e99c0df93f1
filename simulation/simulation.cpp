#include "simulation/simulation.hpp"

#include <utility>
#include <variant>
#include <vector>

#include "base/status_utilities.hpp"
#include "glog/logging.h"

namespace orrery {
namespace simulation {
namespace internal_simulation {

using base::make_not_null_unique;
using physics::max_id_length;

Simulation::Simulation(BodyCatalog catalog,
                       BodiesConfig const& bodies_config,
                       ThreadPool<void>* const pool)
    : catalog_(std::move(catalog)),
      bodies_config_(bodies_config),
      pool_(pool),
      propagator_(make_not_null_unique<OrbitalPropagator>(
          catalog_.Filter(bodies_config_))) {}

void Simulation::Enqueue(Command command) {
  commands_.push_back(std::move(command));
}

std::int64_t Simulation::pending_commands() const {
  return commands_.size();
}

bool Simulation::Step() {
  while (!commands_.empty()) {
    Command const command = std::move(commands_.front());
    commands_.pop_front();
    std::visit([this](auto const& c) { Apply(c); }, command);
  }

  if (!clock_.Tick()) {
    return false;
  }
  propagator_->Propagate(clock_.simulated_time(), pool_);
  ShipIntegrator const ship_integrator = integrator();
  double const Δt = static_cast<double>(clock_.step_size());
  for (auto const& [_, ship] : ships_) {
    ship_integrator.Step(Δt, ship.get());
  }
  return true;
}

SimulationClock& Simulation::clock() {
  return clock_;
}

SimulationClock const& Simulation::clock() const {
  return clock_;
}

BodyCatalog const& Simulation::catalog() const {
  return catalog_;
}

BodiesConfig const& Simulation::bodies_config() const {
  return bodies_config_;
}

void Simulation::SetBodiesConfig(BodiesConfig const& bodies_config) {
  LOG(INFO) << "Bodies config changed from " << bodies_config_ << " to "
            << bodies_config;
  bodies_config_ = bodies_config;
  propagator_ = make_not_null_unique<OrbitalPropagator>(
      catalog_.Filter(bodies_config_));
  propagator_->Propagate(clock_.simulated_time(), pool_);
  ShipIntegrator const ship_integrator = integrator();
  for (auto const& [_, ship] : ships_) {
    ship_integrator.UpdateAcceleration(ship.get());
  }
}

OrbitalPropagator const& Simulation::propagator() const {
  return *propagator_;
}

ShipIntegrator Simulation::integrator() const {
  return ShipIntegrator(*propagator_);
}

Simulation::Ships const& Simulation::ships() const {
  return ships_;
}

Ship const* Simulation::FindShip(std::string_view const id) const {
  auto const it = ships_.find(id);
  if (it == ships_.end()) {
    return nullptr;
  }
  return it->second.get();
}

Ship* Simulation::FindShip(std::string_view const id) {
  auto const it = ships_.find(id);
  if (it == ships_.end()) {
    return nullptr;
  }
  return it->second.get();
}

bool Simulation::SetShipPosition(std::string_view const id,
                                 Position const& position) {
  Ship* const ship = FindShip(id);
  if (ship == nullptr) {
    return false;
  }
  ship->set_position(position);
  integrator().UpdateAcceleration(ship);
  return true;
}

Snapshot Simulation::MakeSnapshot() const {
  Snapshot snapshot;
  snapshot.tick = clock_.tick();
  snapshot.ships.reserve(ships_.size());
  for (auto const& [id, ship] : ships_) {
    snapshot.ships.push_back({id, ship->degrees_of_freedom()});
  }
  return snapshot;
}

std::int64_t Simulation::ApplySnapshot(Snapshot const& snapshot) {
  std::int64_t skipped = 0;
  std::vector<not_null<Ship*>> updated;
  for (auto const& ship_snapshot : snapshot.ships) {
    Ship* const ship = FindShip(ship_snapshot.id);
    if (ship == nullptr) {
      ++skipped;
      continue;
    }
    ship->set_degrees_of_freedom(ship_snapshot.degrees_of_freedom);
    updated.push_back(ship);
  }

  ShipIntegrator const ship_integrator = integrator();
  std::uint64_t const tick = clock_.tick();
  if (snapshot.tick < tick) {
    // The local clock ran ahead of the update: the updated ships are brought
    // to the local tick the way |Step| would have moved them.
    VLOG(1) << "Replaying ticks " << snapshot.tick + 1 << " to " << tick
            << " for " << updated.size() << " ships";
    if (!updated.empty()) {
      double const Δt = static_cast<double>(clock_.step_size());
      for (std::uint64_t t = snapshot.tick + 1; t <= tick; ++t) {
        propagator_->Propagate(clock_.SimulatedTimeAt(t), pool_);
        for (not_null<Ship*> const ship : updated) {
          ship_integrator.Step(Δt, ship);
        }
      }
    }
    return skipped;
  }

  if (snapshot.tick > tick) {
    clock_.SetTick(snapshot.tick);
    propagator_->Propagate(clock_.simulated_time(), pool_);
  }
  for (auto const& [_, ship] : ships_) {
    ship_integrator.UpdateAcceleration(ship.get());
  }
  return skipped;
}

ClientMode Simulation::client_mode() const {
  return client_mode_;
}

void Simulation::SetClientMode(ClientMode const mode) {
  LOG(INFO) << "Client mode changed from " << client_mode_ << " to " << mode;
  client_mode_ = mode;
  if (!IsInGame(mode)) {
    game_stage_.reset();
  }
  switch (mode) {
    case ClientMode::None:
      clock_.SetRunning(false);
      break;
    case ClientMode::Explorer: {
      std::uint64_t const step_size = clock_.step_size();
      clock_ = SimulationClock();
      CHECK_OK(clock_.SetStepSize(step_size));
      clock_.SetRunning(true);
      propagator_->Propagate(clock_.simulated_time(), pool_);
      break;
    }
    case ClientMode::Singleplayer:
    case ClientMode::Multiplayer:
      if (!game_stage_.has_value()) {
        SetGameStage(GameStage::Preparation);
      }
      break;
    case ClientMode::Server:
      break;
  }
}

std::optional<GameStage> Simulation::game_stage() const {
  return game_stage_;
}

void Simulation::SetGameStage(GameStage const stage) {
  CHECK(IsInGame(client_mode_)) << client_mode_;
  game_stage_ = stage;
  clock_.SetRunning(stage == GameStage::Action);
  LOG(INFO) << "Game stage " << stage;
}

void Simulation::Apply(CreateShip const& command) {
  if (command.id.empty() || command.id.size() > max_id_length) {
    LOG(WARNING) << "Invalid ship id '" << command.id << "'";
    return;
  }
  if (ships_.contains(command.id)) {
    VLOG(1) << "Ship " << command.id << " already exists";
    return;
  }
  auto ship = make_not_null_unique<Ship>(
      command.id,
      command.degrees_of_freedom,
      command.acceleration.value_or(geometry::Acceleration()));
  ShipIntegrator const ship_integrator = integrator();
  if (command.acceleration.has_value()) {
    ship_integrator.UpdateInfluence(ship.get());
  } else {
    ship_integrator.UpdateAcceleration(ship.get());
  }
  LOG(INFO) << "Created ship " << command.id << " at "
            << command.degrees_of_freedom << ", influenced by "
            << ship->influence();
  ships_.emplace(command.id, std::move(ship));
}

void Simulation::Apply(RemoveShip const& command) {
  if (ships_.erase(command.id) > 0) {
    LOG(INFO) << "Removed ship " << command.id;
  }
}

void Simulation::Apply(ToggleTime const&) {
  clock_.RequestToggle();
}

void Simulation::Apply(SetTimeScale const& command) {
  if (absl::Status const status = clock_.SetStepSize(command.step_size);
      !status.ok()) {
    LOG(WARNING) << status;
  }
}

}  // namespace internal_simulation
}  // namespace simulation
}  // namespace orrery
