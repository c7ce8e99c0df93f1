#include "testing_utilities/solar_system.hpp"

#include <utility>
#include <vector>

#include "base/status_utilities.hpp"
#include "glog/logging.h"

namespace orrery {
namespace testing_utilities {
namespace internal_solar_system {

BodyCatalog SolarSystemCatalog() {
  auto catalog = BodyCatalog::ReadFromFile(
      SOLUTION_DIR / "astronomy" / "sol_main_bodies.proto.txt");
  CHECK_OK(catalog.status());
  return std::move(catalog).value();
}

BodyRecord CircularBody(std::string const& id,
                        BodyType const type,
                        std::string const& parent,
                        double const mass,
                        double const semimajor_axis,
                        double const revolution_period) {
  BodyRecord record;
  record.id = id;
  record.type = type;
  record.parent = parent;
  record.mass = mass;
  record.elements.semimajor_axis = semimajor_axis;
  record.elements.revolution_period = revolution_period;
  return record;
}

BodyCatalog StarPlanetMoonCatalog() {
  BodyRecord star;
  star.id = "star";
  star.type = BodyType::Star;
  star.mass = 1e30;
  std::vector<BodyRecord> records = {
      std::move(star),
      CircularBody("planet", BodyType::Planet, "star", 6e24, 1e8, 365),
      CircularBody("moon", BodyType::Moon, "planet", 7e22, 4e5, 27)};
  auto catalog = BodyCatalog::Make(std::move(records));
  CHECK_OK(catalog.status());
  return std::move(catalog).value();
}

}  // namespace internal_solar_system
}  // namespace testing_utilities
}  // namespace orrery
