#include "tools/console.hpp"

#include <sstream>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "physics/bodies_config.hpp"
#include "physics/body_type.hpp"
#include "simulation/commands.hpp"
#include "testing_utilities/solar_system.hpp"

namespace orrery {

using geometry::Position;
using geometry::Velocity;
using physics::BodiesConfig;
using physics::BodyType;
using physics::DegreesOfFreedom;
using simulation::CreateShip;
using simulation::Simulation;
using testing_utilities::StarPlanetMoonCatalog;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace tools {

class ConsoleTest : public ::testing::Test {
 protected:
  ConsoleTest()
      : simulation_(StarPlanetMoonCatalog(),
                    BodiesConfig::SmallestBodyType(BodyType::Moon)),
        console_(&simulation_, out_) {}

  // Executes |line| and returns what the console printed.
  std::string Execute(std::string const& line) {
    out_.str("");
    console_.Execute(line);
    return out_.str();
  }

  void AddShip(std::string const& id) {
    simulation_.Enqueue(CreateShip{id, {Position(1e8 + 1e5, 0, 0), {}}});
    simulation_.Step();
  }

  std::ostringstream out_;
  Simulation simulation_;
  Console console_;
};

TEST_F(ConsoleTest, Help) {
  EXPECT_THAT(Execute("help"), StartsWith("commands:\n"));
  EXPECT_EQ(Execute("help"), Execute(""));
  EXPECT_EQ(Execute("help"), Execute(" \t "));
  std::string const unknown = Execute("warp 9");
  EXPECT_THAT(unknown, StartsWith("err : unknown command 'warp'\n"));
  EXPECT_THAT(unknown, HasSubstr(Execute("help")));
}

TEST_F(ConsoleTest, ToggleTime) {
  EXPECT_EQ("toggling time\n", Execute("toggle_time"));
  EXPECT_FALSE(simulation_.clock().running());
  EXPECT_TRUE(simulation_.Step());
  EXPECT_TRUE(simulation_.clock().running());
}

TEST_F(ConsoleTest, TimeScale) {
  EXPECT_EQ("Current timescale = 1\n", Execute("time_scale"));
  EXPECT_EQ("Current timescale = 12\n", Execute("time_scale 12"));
  // Takes effect at the next step.
  EXPECT_EQ(1, simulation_.clock().step_size());
  simulation_.Step();
  EXPECT_EQ(12, simulation_.clock().step_size());
  EXPECT_EQ("Current timescale = 12\n", Execute("time_scale"));

  EXPECT_EQ("timescale is a u64, Error : 'fast'\n",
            Execute("time_scale fast"));
  EXPECT_EQ("timescale is a u64, Error : '-3'\n", Execute("time_scale -3"));
  EXPECT_EQ("timescale must be positive\n", Execute("time_scale 0"));
  EXPECT_EQ(0, simulation_.pending_commands());
}

TEST_F(ConsoleTest, Ships) {
  EXPECT_EQ("ships list : []\n", Execute("list_ships"));
  AddShip("b");
  AddShip("a");
  EXPECT_EQ("ships list : [a, b]\n", Execute("list_ships"));
  EXPECT_EQ("ships list : [a, b]\ntest\n", Execute("test"));

  EXPECT_EQ("wrong ID\n", Execute("get_ship_data"));
  EXPECT_EQ("wrong ID\n", Execute("get_ship_data c"));
  std::string const data = Execute("get_ship_data a");
  EXPECT_THAT(data, StartsWith("ship a\n"));
  EXPECT_THAT(data, HasSubstr("position     : {1.001e+08, 0, 0}"));
  EXPECT_THAT(data,
              HasSubstr("influence    : {dominant: planet, influencers: "
                        "[star, planet]}"));
}

TEST_F(ConsoleTest, TestSetPosition) {
  AddShip("a");
  EXPECT_EQ("wrong ID\n", Execute("test_set_pos b 1 2 3"));
  EXPECT_EQ("ship a moved to {1.004e+08, 1000, 0}\n",
            Execute("test_set_pos a 1.004e8 1000 0"));
  EXPECT_EQ(Position(1.004e8, 1000, 0), simulation_.FindShip("a")->position());
  EXPECT_EQ("moon", simulation_.FindShip("a")->influence().dominant);

  EXPECT_EQ(
      "wrong pos : 'north'\n"
      "wrong pos : missing argument 3\n"
      "ship a moved to {0, 5, 0}\n",
      Execute("test_set_pos a north 5"));
}

TEST_F(ConsoleTest, CreateShip) {
  EXPECT_EQ("creating ship s at {{1, 2, 3}, {4, 5, 6}}\n",
            Execute("create_ship s 1 2 3 4 5 6"));
  EXPECT_EQ(nullptr, simulation_.FindShip("s"));
  simulation_.Step();
  ASSERT_NE(nullptr, simulation_.FindShip("s"));
  EXPECT_EQ(Velocity(4, 5, 6), simulation_.FindShip("s")->velocity());
  EXPECT_EQ("wrong ID\n", Execute("create_ship"));
}

TEST_F(ConsoleTest, CustomShipCreator) {
  std::string created;
  Console console(&simulation_,
                  out_,
                  [&created](std::string const& id,
                             DegreesOfFreedom const& dof) {
                    created = id;
                  });
  console.Execute("create_ship x 1 1 1 0 0 0");
  EXPECT_EQ("x", created);
  EXPECT_EQ(0, simulation_.pending_commands());
}

TEST_F(ConsoleTest, Bodies) {
  std::string const bodies = Execute("get_bodys_data");
  EXPECT_THAT(bodies,
              StartsWith("0 - {star, Star, position: {0, 0, 0}, velocity: "));
  EXPECT_THAT(bodies, HasSubstr("1 - {planet, Planet, position: {1e+08, "));
  EXPECT_THAT(bodies, HasSubstr("2 - {moon, Moon, position: {1.004e+08, "));
}

}  // namespace tools
}  // namespace orrery
