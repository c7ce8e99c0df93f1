#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "physics/body_catalog.hpp"
#include "physics/body_type.hpp"
#include "physics/kepler_orbit.hpp"

namespace orrery {
namespace testing_utilities {
namespace internal_solar_system {

using physics::BodyCatalog;
using physics::BodyRecord;
using physics::BodyType;
using physics::KeplerianElements;

// The root of the source tree.
inline std::filesystem::path const SOLUTION_DIR = ORRERY_SOURCE_DIR;

// The catalog of astronomy/sol_main_bodies.proto.txt.
BodyCatalog SolarSystemCatalog();

// A body on a circular orbit in the reference plane, at its periapsis at
// t = 0.
BodyRecord CircularBody(std::string const& id,
                        BodyType type,
                        std::string const& parent,
                        double mass,
                        double semimajor_axis,
                        double revolution_period);

// A star of 1e30 kg with a planet of 6e24 kg at 1e8 km, itself with a moon of
// 7e22 kg at 4e5 km.  At t = 0 the three bodies lie on the x axis.
BodyCatalog StarPlanetMoonCatalog();

}  // namespace internal_solar_system

using internal_solar_system::CircularBody;
using internal_solar_system::SOLUTION_DIR;
using internal_solar_system::SolarSystemCatalog;
using internal_solar_system::StarPlanetMoonCatalog;

}  // namespace testing_utilities
}  // namespace orrery
