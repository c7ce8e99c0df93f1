#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "base/not_null.hpp"
#include "base/thread_pool.hpp"
#include "geometry/named_quantities.hpp"
#include "physics/bodies_config.hpp"
#include "physics/body_catalog.hpp"
#include "physics/degrees_of_freedom.hpp"
#include "physics/orbital_propagator.hpp"
#include "physics/ship.hpp"
#include "physics/ship_integrator.hpp"
#include "simulation/commands.hpp"
#include "simulation/game_state.hpp"
#include "simulation/simulation_clock.hpp"
#include "simulation/snapshot.hpp"

namespace orrery {
namespace simulation {
namespace internal_simulation {

using base::not_null;
using base::ThreadPool;
using geometry::Position;
using physics::BodiesConfig;
using physics::BodyCatalog;
using physics::DegreesOfFreedom;
using physics::OrbitalPropagator;
using physics::Ship;
using physics::ShipIntegrator;

// The state of a simulation instance: the clock, the bodies, the ships and
// the pending commands.  A single thread drives it; the pool is only used
// inside |Step|.
class Simulation final {
 public:
  using Ships = std::map<std::string, not_null<std::unique_ptr<Ship>>,
                         std::less<>>;

  // The bodies are those of |catalog| selected by |bodies_config|.  |pool|
  // may be null, in which case everything runs on the calling thread.
  Simulation(BodyCatalog catalog,
             BodiesConfig const& bodies_config,
             ThreadPool<void>* pool = nullptr);

  // Appends to the command queue.
  void Enqueue(Command command);
  std::int64_t pending_commands() const;

  // Runs one fixed step: applies the pending commands, ticks the clock and,
  // if it advanced, positions the bodies and integrates the ships.  Returns
  // true if the clock advanced.
  bool Step();

  SimulationClock& clock();
  SimulationClock const& clock() const;

  BodyCatalog const& catalog() const;
  BodiesConfig const& bodies_config() const;
  // Rebuilds the system of bodies at the current time.  The ships are kept
  // and their influence is resolved again.
  void SetBodiesConfig(BodiesConfig const& bodies_config);

  OrbitalPropagator const& propagator() const;
  ShipIntegrator integrator() const;

  Ships const& ships() const;
  // Return null if there is no ship with that id.
  Ship const* FindShip(std::string_view id) const;
  Ship* FindShip(std::string_view id);
  // Moves a ship and resolves its influence.  Returns false if there is no
  // ship with that id.
  bool SetShipPosition(std::string_view id, Position const& position);

  Snapshot MakeSnapshot() const;
  // Overwrites the state of the ships of |snapshot| that exist locally.  If
  // |snapshot| is ahead of the clock, the clock and the bodies move to its
  // tick; if it is behind, the updated ships are integrated forward to the
  // local tick.  Returns the number of ships of |snapshot| that were skipped
  // because they don't exist locally.
  std::int64_t ApplySnapshot(Snapshot const& snapshot);

  ClientMode client_mode() const;
  // Entering |Explorer| restarts the clock from tick 0, running.  Entering
  // |None| pauses the clock.  Entering a game starts in |Preparation|.
  void SetClientMode(ClientMode mode);

  // Absent unless |IsInGame(client_mode())|.
  std::optional<GameStage> game_stage() const;
  // |Action| starts the clock, |Preparation| pauses it.  Must be in game.
  void SetGameStage(GameStage stage);

 private:
  void Apply(CreateShip const& command);
  void Apply(RemoveShip const& command);
  void Apply(ToggleTime const& command);
  void Apply(SetTimeScale const& command);

  BodyCatalog const catalog_;
  BodiesConfig bodies_config_;
  ThreadPool<void>* const pool_;
  not_null<std::unique_ptr<OrbitalPropagator>> propagator_;
  SimulationClock clock_;
  Ships ships_;
  std::deque<Command> commands_;
  ClientMode client_mode_ = ClientMode::None;
  std::optional<GameStage> game_stage_;
};

}  // namespace internal_simulation

using internal_simulation::Simulation;

}  // namespace simulation
}  // namespace orrery
