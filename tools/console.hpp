#pragma once

#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "base/not_null.hpp"
#include "physics/degrees_of_freedom.hpp"
#include "simulation/simulation.hpp"

namespace orrery {
namespace tools {
namespace internal_console {

using base::not_null;
using physics::DegreesOfFreedom;
using simulation::Simulation;

// The administrative console.  Each line is a command followed by its
// arguments, separated by blanks.  The commands that change the simulation
// go through its command queue and take effect at the next step, except
// |test_set_pos| which moves the ship immediately.
class Console final {
 public:
  using ShipCreator = std::function<void(std::string const& id,
                                         DegreesOfFreedom const& dof)>;

  // Replies are written to |out|.  |create_ship| handles |create_ship|; by
  // default it enqueues a |CreateShip| command.
  Console(not_null<Simulation*> simulation,
          std::ostream& out,
          ShipCreator create_ship = nullptr);

  void Execute(std::string_view line);

 private:
  void Help();
  void ToggleTime();
  void TimeScale(std::vector<std::string_view> const& arguments);
  void ListShips();
  void GetShipData(std::vector<std::string_view> const& arguments);
  void GetBodiesData();
  void Test();
  void TestSetPosition(std::vector<std::string_view> const& arguments);
  void CreateShip(std::vector<std::string_view> const& arguments);

  // Parses |arguments[first + i]| into the i-th element of the result.
  // Missing or malformed arguments are reported and replaced by 0.
  std::vector<double> ParseCoordinates(
      std::vector<std::string_view> const& arguments,
      int first,
      int count);

  not_null<Simulation*> const simulation_;
  std::ostream& out_;
  ShipCreator const create_ship_;
};

}  // namespace internal_console

using internal_console::Console;

}  // namespace tools
}  // namespace orrery
