#include "simulation/simulation.hpp"

#include <optional>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "physics/body_type.hpp"
#include "serialization/network.pb.h"
#include "testing_utilities/solar_system.hpp"

namespace orrery {

using base::ThreadPool;
using geometry::Acceleration;
using geometry::Position;
using geometry::Velocity;
using physics::BodiesConfig;
using physics::BodyType;
using physics::DegreesOfFreedom;
using testing_utilities::StarPlanetMoonCatalog;
using ::testing::DoubleNear;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::Optional;

namespace simulation {

class SimulationTest : public ::testing::Test {
 protected:
  SimulationTest()
      : simulation_(StarPlanetMoonCatalog(),
                    BodiesConfig::SmallestBodyType(BodyType::Moon)) {}

  static std::vector<std::string> ShipIds(Simulation const& simulation) {
    std::vector<std::string> ids;
    for (auto const& [id, _] : simulation.ships()) {
      ids.push_back(id);
    }
    return ids;
  }

  // Close to the planet, on a roughly circular orbit around it.
  DegreesOfFreedom const near_planet_{Position(1e8 + 1e5, 0, 0),
                                      Velocity(0, 1.73e5, 0)};
  // In the sphere of the moon.
  DegreesOfFreedom const near_moon_{Position(1e8 + 4e5 + 1000, 0, 0),
                                    Velocity()};
  Simulation simulation_;
};

using SimulationDeathTest = SimulationTest;

TEST_F(SimulationTest, Initial) {
  EXPECT_EQ(ClientMode::None, simulation_.client_mode());
  EXPECT_EQ(std::nullopt, simulation_.game_stage());
  EXPECT_EQ(3, simulation_.propagator().bodies().size());
  EXPECT_TRUE(simulation_.ships().empty());
  EXPECT_FALSE(simulation_.Step());
  EXPECT_EQ(0, simulation_.clock().tick());
}

TEST_F(SimulationTest, CommandsAreAppliedInOrder) {
  simulation_.Enqueue(CreateShip{"a", near_planet_});
  simulation_.Enqueue(RemoveShip{"a"});
  simulation_.Enqueue(RemoveShip{"b"});
  simulation_.Enqueue(CreateShip{"b", near_planet_});
  EXPECT_EQ(4, simulation_.pending_commands());
  EXPECT_TRUE(simulation_.ships().empty());

  // The commands are applied even if the clock is paused.
  EXPECT_FALSE(simulation_.Step());
  EXPECT_EQ(0, simulation_.pending_commands());
  EXPECT_THAT(ShipIds(simulation_), ElementsAre("b"));
}

TEST_F(SimulationTest, CreateShip) {
  simulation_.Enqueue(CreateShip{"z", near_moon_});
  simulation_.Enqueue(CreateShip{"a", near_planet_});
  simulation_.Enqueue(CreateShip{"a", near_moon_});
  simulation_.Enqueue(CreateShip{"", near_moon_});
  simulation_.Enqueue(CreateShip{"seventeen_chars_x", near_moon_});
  simulation_.Step();
  EXPECT_THAT(ShipIds(simulation_), ElementsAre("a", "z"));

  // The first creation wins.
  physics::Ship const* const a = simulation_.FindShip("a");
  ASSERT_NE(nullptr, a);
  EXPECT_EQ(near_planet_, a->degrees_of_freedom());
  EXPECT_EQ("planet", a->influence().dominant);
  EXPECT_EQ(simulation_.integrator().ComputeAcceleration(a->position()),
            a->acceleration());

  physics::Ship const* const z = simulation_.FindShip("z");
  ASSERT_NE(nullptr, z);
  EXPECT_EQ("moon", z->influence().dominant);
  EXPECT_EQ(nullptr, simulation_.FindShip("b"));
}

TEST_F(SimulationTest, CreateShipWithAcceleration) {
  Acceleration const acceleration(1, 2, 3);
  simulation_.Enqueue(CreateShip{"a", near_moon_, acceleration});
  simulation_.Step();
  physics::Ship const* const a = simulation_.FindShip("a");
  ASSERT_NE(nullptr, a);
  EXPECT_EQ(acceleration, a->acceleration());
  EXPECT_EQ("moon", a->influence().dominant);
}

TEST_F(SimulationTest, ToggleTime) {
  simulation_.Enqueue(ToggleTime{});
  EXPECT_TRUE(simulation_.Step());
  EXPECT_TRUE(simulation_.clock().running());
  EXPECT_EQ(1, simulation_.clock().tick());

  simulation_.Enqueue(ToggleTime{});
  simulation_.Enqueue(ToggleTime{});
  EXPECT_TRUE(simulation_.Step());
  EXPECT_EQ(2, simulation_.clock().tick());

  simulation_.Enqueue(ToggleTime{});
  EXPECT_FALSE(simulation_.Step());
  EXPECT_EQ(2, simulation_.clock().tick());
}

TEST_F(SimulationTest, TimeScale) {
  simulation_.Enqueue(SetTimeScale{10});
  simulation_.Step();
  EXPECT_EQ(10, simulation_.clock().step_size());
  simulation_.Enqueue(SetTimeScale{0});
  simulation_.Step();
  EXPECT_EQ(10, simulation_.clock().step_size());
}

TEST_F(SimulationTest, Motion) {
  simulation_.Enqueue(CreateShip{"a", near_planet_});
  simulation_.Enqueue(ToggleTime{});
  EXPECT_TRUE(simulation_.Step());
  EXPECT_EQ(1, simulation_.clock().simulated_time());

  // The planet went a 365th of the way around the star.
  Position const planet =
      simulation_.propagator().FindBody("planet")->position();
  EXPECT_GT(planet.y, 0);
  EXPECT_THAT(planet.Norm(), DoubleNear(1e8, 1e-3));

  physics::Ship const* const a = simulation_.FindShip("a");
  ASSERT_NE(nullptr, a);
  EXPECT_NE(near_planet_, a->degrees_of_freedom());
  EXPECT_EQ(
      simulation_.integrator().ComputeAcceleration(a->position(),
                                                   a->influence()),
      a->acceleration());
}

TEST_F(SimulationTest, ParallelMotion) {
  ThreadPool<void> pool(3);
  Simulation parallel(StarPlanetMoonCatalog(),
                      BodiesConfig::SmallestBodyType(BodyType::Moon),
                      &pool);
  for (Simulation* const simulation : {&simulation_, &parallel}) {
    simulation->Enqueue(CreateShip{"a", near_planet_});
    simulation->Enqueue(CreateShip{"b", near_moon_});
    simulation->Enqueue(ToggleTime{});
    for (int i = 0; i < 5; ++i) {
      simulation->Step();
    }
  }
  EXPECT_EQ(simulation_.MakeSnapshot().ships.size(), 2);
  for (auto const& id : {"a", "b"}) {
    EXPECT_EQ(simulation_.FindShip(id)->degrees_of_freedom(),
              parallel.FindShip(id)->degrees_of_freedom());
  }
}

TEST_F(SimulationTest, SetShipPosition) {
  simulation_.Enqueue(CreateShip{"a", near_planet_});
  simulation_.Step();
  EXPECT_FALSE(simulation_.SetShipPosition("b", near_moon_.position));
  EXPECT_TRUE(simulation_.SetShipPosition("a", near_moon_.position));
  physics::Ship const* const a = simulation_.FindShip("a");
  EXPECT_EQ(near_moon_.position, a->position());
  EXPECT_EQ(near_planet_.velocity, a->velocity());
  EXPECT_EQ("moon", a->influence().dominant);
}

TEST_F(SimulationTest, SetBodiesConfig) {
  simulation_.Enqueue(CreateShip{"a", near_moon_});
  simulation_.Step();
  EXPECT_EQ("moon", simulation_.FindShip("a")->influence().dominant);

  simulation_.SetBodiesConfig(BodiesConfig::SmallestBodyType(BodyType::Planet));
  EXPECT_EQ(BodiesConfig::SmallestBodyType(BodyType::Planet),
            simulation_.bodies_config());
  EXPECT_EQ(2, simulation_.propagator().bodies().size());
  EXPECT_EQ(nullptr, simulation_.propagator().FindBody("moon"));
  // The ship survives and is now influenced by the planet.
  ASSERT_NE(nullptr, simulation_.FindShip("a"));
  EXPECT_EQ("planet", simulation_.FindShip("a")->influence().dominant);
  // The catalog is unchanged.
  EXPECT_EQ(3, simulation_.catalog().bodies().size());
}

TEST_F(SimulationTest, Snapshots) {
  simulation_.Enqueue(CreateShip{"b", near_planet_});
  simulation_.Enqueue(CreateShip{"a", near_moon_});
  simulation_.Enqueue(ToggleTime{});
  simulation_.Step();
  simulation_.Step();
  Snapshot const snapshot = simulation_.MakeSnapshot();
  EXPECT_EQ(2, snapshot.tick);
  ASSERT_EQ(2, snapshot.ships.size());
  EXPECT_EQ("a", snapshot.ships[0].id);
  EXPECT_EQ("b", snapshot.ships[1].id);
  EXPECT_EQ(simulation_.FindShip("b")->degrees_of_freedom(),
            snapshot.ships[1].degrees_of_freedom);

  serialization::PeriodicUpdate message;
  snapshot.WriteToMessage(&message);
  EXPECT_EQ(2, message.tick());
  EXPECT_EQ(2, message.ship_size());
  Snapshot const read = Snapshot::ReadFromMessage(message);
  EXPECT_EQ(snapshot.tick, read.tick);
  EXPECT_EQ(snapshot.ships[0].degrees_of_freedom,
            read.ships[0].degrees_of_freedom);

  // A replica that only knows ship "a".
  Simulation replica(StarPlanetMoonCatalog(),
                     BodiesConfig::SmallestBodyType(BodyType::Moon));
  replica.Enqueue(CreateShip{"a", near_planet_});
  replica.Step();
  EXPECT_EQ(1, replica.ApplySnapshot(snapshot));
  EXPECT_EQ(2, replica.clock().tick());
  EXPECT_EQ(snapshot.ships[0].degrees_of_freedom,
            replica.FindShip("a")->degrees_of_freedom());
  EXPECT_EQ(nullptr, replica.FindShip("b"));

  // An older snapshot doesn't move the clock back, the ships it updates are
  // integrated forward instead.
  Snapshot older = snapshot;
  older.tick = 1;
  EXPECT_EQ(1, replica.ApplySnapshot(older));
  EXPECT_EQ(2, replica.clock().tick());
  EXPECT_NE(snapshot.ships[0].degrees_of_freedom,
            replica.FindShip("a")->degrees_of_freedom());
}

TEST_F(SimulationTest, ReplicaAheadOfTheSnapshot) {
  simulation_.Enqueue(CreateShip{"a", near_moon_});
  simulation_.Enqueue(ToggleTime{});
  Simulation replica(StarPlanetMoonCatalog(),
                     BodiesConfig::SmallestBodyType(BodyType::Moon));
  replica.Enqueue(CreateShip{"a", near_planet_});
  replica.Enqueue(ToggleTime{});
  for (int i = 0; i < 3; ++i) {
    simulation_.Step();
  }
  for (int i = 0; i < 5; ++i) {
    replica.Step();
  }
  ASSERT_EQ(3, simulation_.clock().tick());
  ASSERT_EQ(5, replica.clock().tick());

  EXPECT_EQ(0, replica.ApplySnapshot(simulation_.MakeSnapshot()));
  EXPECT_EQ(5, replica.clock().tick());
  simulation_.Step();
  simulation_.Step();
  EXPECT_EQ(simulation_.FindShip("a")->degrees_of_freedom(),
            replica.FindShip("a")->degrees_of_freedom());
  EXPECT_EQ(simulation_.FindShip("a")->influence(),
            replica.FindShip("a")->influence());
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(simulation_.propagator().bodies()[i]->degrees_of_freedom(),
              replica.propagator().bodies()[i]->degrees_of_freedom());
  }
}

TEST_F(SimulationTest, ReplicaBehindTheSnapshot) {
  simulation_.Enqueue(CreateShip{"a", near_planet_});
  simulation_.Enqueue(ToggleTime{});
  for (int i = 0; i < 4; ++i) {
    simulation_.Step();
  }
  Simulation replica(StarPlanetMoonCatalog(),
                     BodiesConfig::SmallestBodyType(BodyType::Moon));
  replica.Enqueue(CreateShip{"a", near_moon_});
  replica.Step();

  EXPECT_EQ(0, replica.ApplySnapshot(simulation_.MakeSnapshot()));
  EXPECT_EQ(4, replica.clock().tick());
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(simulation_.propagator().bodies()[i]->degrees_of_freedom(),
              replica.propagator().bodies()[i]->degrees_of_freedom());
  }
  EXPECT_EQ(simulation_.FindShip("a")->influence(),
            replica.FindShip("a")->influence());
}

TEST_F(SimulationTest, ClientModes) {
  EXPECT_FALSE(IsLoaded(ClientMode::None));
  EXPECT_TRUE(IsLoaded(ClientMode::Explorer));
  EXPECT_TRUE(IsInGame(ClientMode::Multiplayer));
  EXPECT_FALSE(IsInGame(ClientMode::Server));
  EXPECT_TRUE(IsAuthoritative(ClientMode::Server));
  EXPECT_TRUE(IsAuthoritative(ClientMode::Singleplayer));
  EXPECT_FALSE(IsAuthoritative(ClientMode::Multiplayer));
  EXPECT_FALSE(IsAuthoritative(ClientMode::Explorer));

  simulation_.SetClientMode(ClientMode::Singleplayer);
  EXPECT_THAT(simulation_.game_stage(), Optional(Eq(GameStage::Preparation)));
  EXPECT_FALSE(simulation_.clock().running());
  simulation_.SetGameStage(GameStage::Action);
  EXPECT_TRUE(simulation_.clock().running());
  EXPECT_TRUE(simulation_.Step());
  EXPECT_TRUE(simulation_.Step());
  simulation_.SetGameStage(GameStage::Preparation);
  EXPECT_FALSE(simulation_.Step());
  EXPECT_EQ(2, simulation_.clock().tick());

  // Exploring restarts from the beginning.
  simulation_.SetClientMode(ClientMode::Explorer);
  EXPECT_EQ(std::nullopt, simulation_.game_stage());
  EXPECT_TRUE(simulation_.clock().running());
  EXPECT_EQ(0, simulation_.clock().tick());

  simulation_.SetClientMode(ClientMode::None);
  EXPECT_FALSE(simulation_.clock().running());
  simulation_.SetClientMode(ClientMode::Server);
  EXPECT_EQ(std::nullopt, simulation_.game_stage());
}

TEST_F(SimulationDeathTest, GameStageOutsideOfAGame) {
  EXPECT_DEATH({
    simulation_.SetGameStage(GameStage::Action);
  }, "IsInGame");
}

}  // namespace simulation
}  // namespace orrery
