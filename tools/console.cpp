#include "tools/console.hpp"

#include <cstdint>
#include <utility>

#include "absl/strings/numbers.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "geometry/named_quantities.hpp"
#include "glog/logging.h"
#include "simulation/commands.hpp"

namespace orrery {
namespace tools {
namespace internal_console {

using geometry::Position;
using geometry::Velocity;

namespace {

constexpr char help[] =
    "commands:\n"
    "  help                                  print this message\n"
    "  toggle_time                           pause or resume the time\n"
    "  time_scale [n]                        print or set the step size, in "
    "days per tick\n"
    "  list_ships                            list the ids of the ships\n"
    "  get_ship_data <id>                    print the state of a ship\n"
    "  get_bodys_data                        print the state of the bodies\n"
    "  test                                  list the ships and print test\n"
    "  test_set_pos <id> <x> <y> <z>         move a ship\n"
    "  create_ship <id> <x> <y> <z> <vx> <vy> <vz>\n"
    "                                        create a ship\n";

}  // namespace

Console::Console(not_null<Simulation*> const simulation,
                 std::ostream& out,
                 ShipCreator create_ship)
    : simulation_(simulation),
      out_(out),
      create_ship_(
          create_ship != nullptr
              ? std::move(create_ship)
              : ShipCreator([simulation](std::string const& id,
                                         DegreesOfFreedom const& dof) {
                  simulation->Enqueue(::orrery::simulation::CreateShip{
                      .id = id, .degrees_of_freedom = dof});
                })) {}

void Console::Execute(std::string_view const line) {
  std::vector<std::string_view> const words =
      absl::StrSplit(line, absl::ByAnyChar(" \t\r"), absl::SkipEmpty());
  if (words.empty()) {
    Help();
    return;
  }
  VLOG(1) << "Console: " << line;
  std::string_view const command = words.front();
  std::vector<std::string_view> const arguments(words.begin() + 1,
                                                words.end());
  if (command == "help") {
    Help();
  } else if (command == "toggle_time") {
    ToggleTime();
  } else if (command == "time_scale") {
    TimeScale(arguments);
  } else if (command == "list_ships") {
    ListShips();
  } else if (command == "get_ship_data") {
    GetShipData(arguments);
  } else if (command == "get_bodys_data") {
    GetBodiesData();
  } else if (command == "test") {
    Test();
  } else if (command == "test_set_pos") {
    TestSetPosition(arguments);
  } else if (command == "create_ship") {
    CreateShip(arguments);
  } else {
    out_ << "err : unknown command '" << command << "'\n";
    Help();
  }
}

void Console::Help() {
  out_ << help;
}

void Console::ToggleTime() {
  out_ << "toggling time\n";
  simulation_->Enqueue(simulation::ToggleTime{});
}

void Console::TimeScale(std::vector<std::string_view> const& arguments) {
  if (arguments.empty()) {
    out_ << "Current timescale = " << simulation_->clock().step_size() << "\n";
    return;
  }
  std::uint64_t step_size;
  if (!absl::SimpleAtoi(arguments.front(), &step_size)) {
    out_ << "timescale is a u64, Error : '" << arguments.front() << "'\n";
    return;
  }
  if (step_size == 0) {
    out_ << "timescale must be positive\n";
    return;
  }
  simulation_->Enqueue(simulation::SetTimeScale{.step_size = step_size});
  out_ << "Current timescale = " << step_size << "\n";
}

void Console::ListShips() {
  std::vector<std::string> ids;
  for (auto const& [id, _] : simulation_->ships()) {
    ids.push_back(id);
  }
  out_ << "ships list : [" << absl::StrJoin(ids, ", ") << "]\n";
}

void Console::GetShipData(std::vector<std::string_view> const& arguments) {
  if (arguments.empty()) {
    out_ << "wrong ID\n";
    return;
  }
  auto const* const ship = simulation_->FindShip(arguments.front());
  if (ship == nullptr) {
    out_ << "wrong ID\n";
    return;
  }
  out_ << "ship " << ship->id() << "\n"
       << "  position     : " << ship->position() << "\n"
       << "  velocity     : " << ship->velocity() << "\n"
       << "  acceleration : " << ship->acceleration() << "\n"
       << "  influence    : " << ship->influence() << "\n";
}

void Console::GetBodiesData() {
  auto const& bodies = simulation_->propagator().bodies();
  for (std::int64_t i = 0; i < bodies.size(); ++i) {
    auto const& body = *bodies[i];
    out_ << i << " - {" << body.id() << ", " << body.record().type
         << ", position: " << body.position()
         << ", velocity: " << body.velocity() << "}\n";
  }
}

void Console::Test() {
  ListShips();
  out_ << "test\n";
}

void Console::TestSetPosition(std::vector<std::string_view> const& arguments) {
  if (arguments.empty() || simulation_->FindShip(arguments.front()) == nullptr) {
    out_ << "wrong ID\n";
    return;
  }
  std::vector<double> const coordinates =
      ParseCoordinates(arguments, /*first=*/1, /*count=*/3);
  Position const position(coordinates[0], coordinates[1], coordinates[2]);
  CHECK(simulation_->SetShipPosition(arguments.front(), position));
  out_ << "ship " << arguments.front() << " moved to " << position << "\n";
}

void Console::CreateShip(std::vector<std::string_view> const& arguments) {
  if (arguments.empty()) {
    out_ << "wrong ID\n";
    return;
  }
  std::vector<double> const coordinates =
      ParseCoordinates(arguments, /*first=*/1, /*count=*/6);
  DegreesOfFreedom const dof{
      Position(coordinates[0], coordinates[1], coordinates[2]),
      Velocity(coordinates[3], coordinates[4], coordinates[5])};
  std::string const id(arguments.front());
  create_ship_(id, dof);
  out_ << "creating ship " << id << " at " << dof << "\n";
}

std::vector<double> Console::ParseCoordinates(
    std::vector<std::string_view> const& arguments,
    int const first,
    int const count) {
  std::vector<double> coordinates(count, 0);
  for (int i = 0; i < count; ++i) {
    std::int64_t const index = first + i;
    if (index >= arguments.size()) {
      out_ << "wrong pos : missing argument " << index << "\n";
      continue;
    }
    if (!absl::SimpleAtod(arguments[index], &coordinates[i])) {
      out_ << "wrong pos : '" << arguments[index] << "'\n";
      coordinates[i] = 0;
    }
  }
  return coordinates;
}

}  // namespace internal_console
}  // namespace tools
}  // namespace orrery
